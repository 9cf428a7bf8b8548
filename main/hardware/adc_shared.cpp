#include <main/hardware/adc_shared.hpp>
#include <main/utils/logger.hpp>
#include <esp_adc/adc_oneshot.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

static const char* TAG = "AdcShared";

namespace AdcShared {
    static adc_oneshot_unit_handle_t s_adc1_handle = nullptr;
    static StaticSemaphore_t s_mutex_buffer;
    static SemaphoreHandle_t s_mutex = nullptr;

    adc_oneshot_unit_handle_t getAdc1Handle() {
        if (s_mutex == nullptr) {
            s_mutex = xSemaphoreCreateMutexStatic(&s_mutex_buffer);
        }
        if (s_adc1_handle != nullptr) {
            return s_adc1_handle;
        }

        adc_oneshot_unit_init_cfg_t init_config = {};
        init_config.unit_id = ADC_UNIT_1;
        init_config.ulp_mode = ADC_ULP_MODE_DISABLE;

        esp_err_t ret = adc_oneshot_new_unit(&init_config, &s_adc1_handle);
        if (ret != ESP_OK) {
            LOG_ERROR(TAG, "adc_oneshot_new_unit failed: %d", static_cast<int>(ret));
            s_adc1_handle = nullptr;
            return nullptr;
        }
        return s_adc1_handle;
    }

    bool channelForGpio(gpio_num_t gpio, adc_channel_t& out_channel) {
        // ESP32: GPIO 32-39 are the ADC1 channels
        switch (gpio) {
            case GPIO_NUM_36: out_channel = ADC_CHANNEL_0; return true;
            case GPIO_NUM_37: out_channel = ADC_CHANNEL_1; return true;
            case GPIO_NUM_38: out_channel = ADC_CHANNEL_2; return true;
            case GPIO_NUM_39: out_channel = ADC_CHANNEL_3; return true;
            case GPIO_NUM_32: out_channel = ADC_CHANNEL_4; return true;
            case GPIO_NUM_33: out_channel = ADC_CHANNEL_5; return true;
            case GPIO_NUM_34: out_channel = ADC_CHANNEL_6; return true;
            case GPIO_NUM_35: out_channel = ADC_CHANNEL_7; return true;
            default: return false;
        }
    }

    void lock() {
        if (s_mutex != nullptr) {
            xSemaphoreTake(s_mutex, portMAX_DELAY);
        }
    }

    void unlock() {
        if (s_mutex != nullptr) {
            xSemaphoreGive(s_mutex);
        }
    }
}
