#include <main/hardware/sos_button.hpp>
#include <main/utils/logger.hpp>

static const char* TAG_BUTTON = "SosButton";

SosButton::SosButton(gpio_num_t button_pin, bool active_low)
    : pin(button_pin), active_low(active_low), initialized(false) {}

bool SosButton::init() {
    gpio_config_t io_conf = {};
    io_conf.intr_type = GPIO_INTR_DISABLE;
    io_conf.mode = GPIO_MODE_INPUT;
    io_conf.pin_bit_mask = (1ULL << pin);
    io_conf.pull_up_en = active_low ? GPIO_PULLUP_ENABLE : GPIO_PULLUP_DISABLE;
    io_conf.pull_down_en = active_low ? GPIO_PULLDOWN_DISABLE : GPIO_PULLDOWN_ENABLE;
    esp_err_t err = gpio_config(&io_conf);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_BUTTON, "gpio_config failed on GPIO %d: %d", static_cast<int>(pin), static_cast<int>(err));
        return false;
    }
    initialized = true;
    LOG_INFO(TAG_BUTTON, "SOS button on GPIO %d", static_cast<int>(pin));
    return true;
}

bool SosButton::isPressed() const {
    if (!initialized) {
        return false;
    }
    int level = gpio_get_level(pin);
    return active_low ? (level == 0) : (level != 0);
}
