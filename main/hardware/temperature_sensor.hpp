#ifndef TEMPERATURE_SENSOR_HPP
#define TEMPERATURE_SENSOR_HPP

#include <cstdint>
#include <driver/gpio.h>
#include <hal/adc_types.h>
#include <esp_adc/adc_oneshot.h>
#include <main/config/config.hpp>

// LM35 analog ambient sensor on ADC1
class TemperatureSensor {
public:
    explicit TemperatureSensor(gpio_num_t sensor_pin = Config::Hardware::Pins::temp_sensor_gpio);

    bool init();
    bool isReady() const { return initialized; }

    // False when the ADC read fails or the value is outside the sensor's
    // rated range (open or shorted line)
    bool readTemperature(float& out_celsius);

private:
    gpio_num_t pin;
    adc_channel_t adc_channel;
    adc_oneshot_unit_handle_t adc_handle;
    bool initialized;
};

#endif // TEMPERATURE_SENSOR_HPP
