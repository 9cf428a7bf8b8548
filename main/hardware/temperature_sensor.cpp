#include <main/hardware/temperature_sensor.hpp>
#include <main/hardware/adc_shared.hpp>
#include <main/utils/logger.hpp>

static const char* TAG_SENSOR = "TempSensor";

// ADC_ATTEN_DB_0 full scale on ESP32 is about 1.1 V
static constexpr float ADC_REF_VOLTAGE = 1.1f;
static constexpr int ADC_MAX_VALUE = 4095;
static constexpr int ADC_SAMPLES = 16;

TemperatureSensor::TemperatureSensor(gpio_num_t sensor_pin)
    : pin(sensor_pin),
      adc_channel(ADC_CHANNEL_0),
      adc_handle(nullptr),
      initialized(false) {}

bool TemperatureSensor::init() {
    if (!AdcShared::channelForGpio(pin, adc_channel)) {
        LOG_ERROR(TAG_SENSOR, "GPIO %d is not an ADC1 pin", static_cast<int>(pin));
        return false;
    }
    adc_handle = AdcShared::getAdc1Handle();
    if (adc_handle == nullptr) {
        LOG_ERROR(TAG_SENSOR, "%s", "Failed to get shared ADC1 handle");
        return false;
    }

    adc_oneshot_chan_cfg_t config = {};
    config.bitwidth = ADC_BITWIDTH_12;
    // Body-worn range stays well under 1.1 V (110 C)
    config.atten = ADC_ATTEN_DB_0;

    esp_err_t ret = adc_oneshot_config_channel(adc_handle, adc_channel, &config);
    if (ret != ESP_OK) {
        LOG_ERROR(TAG_SENSOR, "Failed to configure ADC channel: %d", static_cast<int>(ret));
        return false;
    }

    initialized = true;
    LOG_INFO(TAG_SENSOR, "LM35 on GPIO %d (ADC1_CH%d)", static_cast<int>(pin), static_cast<int>(adc_channel));
    return true;
}

bool TemperatureSensor::readTemperature(float& out_celsius) {
    if (!initialized || adc_handle == nullptr) {
        return false;
    }

    int32_t adc_sum = 0;
    int valid_samples = 0;
    AdcShared::lock();
    for (int i = 0; i < ADC_SAMPLES; ++i) {
        int adc_raw = 0;
        if (adc_oneshot_read(adc_handle, adc_channel, &adc_raw) == ESP_OK && adc_raw >= 0) {
            adc_sum += adc_raw;
            valid_samples++;
        }
    }
    AdcShared::unlock();

    if (valid_samples == 0) {
        return false;
    }

    float adc_avg = static_cast<float>(adc_sum) / static_cast<float>(valid_samples);
    float voltage_mv = (adc_avg / static_cast<float>(ADC_MAX_VALUE)) * ADC_REF_VOLTAGE * 1000.0f;
    float celsius = Config::Hardware::Temperature::gain_c_per_mv * voltage_mv;

    // A saturated ADC reads as full scale; treat it as a wiring fault
    if (adc_avg >= static_cast<float>(ADC_MAX_VALUE) - 1.0f ||
        celsius < Config::Hardware::Temperature::valid_min_c ||
        celsius > Config::Hardware::Temperature::valid_max_c) {
        return false;
    }
    out_celsius = celsius;
    return true;
}
