#include <main/hardware/buzzer.hpp>
#include <main/utils/logger.hpp>
#include <freertos/task.h>

static const char* TAG = "Buzzer";

// Morse timing unit
static constexpr uint32_t SOS_UNIT_MS = 120;

Buzzer::Buzzer(gpio_num_t buzzer_pin, bool active_high_level)
    : pin(buzzer_pin), active_high(active_high_level) {}

bool Buzzer::init() {
    gpio_config_t io_conf = {};
    io_conf.intr_type = GPIO_INTR_DISABLE;
    io_conf.mode = GPIO_MODE_OUTPUT;
    io_conf.pin_bit_mask = (1ULL << pin);
    io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io_conf.pull_up_en = GPIO_PULLUP_DISABLE;
    esp_err_t err = gpio_config(&io_conf);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "gpio_config failed on GPIO %d: %d", static_cast<int>(pin), static_cast<int>(err));
        return false;
    }
    off();
    return true;
}

void Buzzer::drive(bool enable) {
    gpio_set_level(pin, (enable == active_high) ? 1 : 0);
}

void Buzzer::on() {
    drive(true);
}

void Buzzer::off() {
    drive(false);
}

void Buzzer::pulse(uint32_t on_ms, uint32_t off_ms, uint32_t repeat) {
    for (uint32_t i = 0; i < repeat; ++i) {
        on();
        vTaskDelay(pdMS_TO_TICKS(on_ms));
        off();
        if (i + 1 < repeat) {
            vTaskDelay(pdMS_TO_TICKS(off_ms));
        }
    }
}

void Buzzer::sosRound() {
    // dot = 1 unit, dash = 3, symbol gap = 1, letter gap = 3
    pulse(SOS_UNIT_MS, SOS_UNIT_MS, 3);
    vTaskDelay(pdMS_TO_TICKS(SOS_UNIT_MS * 3));
    pulse(SOS_UNIT_MS * 3, SOS_UNIT_MS, 3);
    vTaskDelay(pdMS_TO_TICKS(SOS_UNIT_MS * 3));
    pulse(SOS_UNIT_MS, SOS_UNIT_MS, 3);
    vTaskDelay(pdMS_TO_TICKS(SOS_UNIT_MS * 3));
}
