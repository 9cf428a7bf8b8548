#ifndef BUZZER_HPP
#define BUZZER_HPP

#include <cstdint>
#include <driver/gpio.h>
#include <freertos/FreeRTOS.h>
#include <main/config/config.hpp>

// Piezo buzzer on a plain GPIO. The pattern calls block (vTaskDelay)
// and are meant for the alarm task only.
class Buzzer {
public:
    explicit Buzzer(gpio_num_t buzzer_pin = Config::Hardware::Pins::buzzer_gpio, bool active_high = true);

    bool init();

    void on();
    void off();

    // repeat times on_ms on / off_ms off
    void pulse(uint32_t on_ms, uint32_t off_ms, uint32_t repeat);

    // One round of ... --- ... (returns after the trailing letter gap)
    void sosRound();

private:
    void drive(bool enable);

    gpio_num_t pin;
    bool active_high;
};

#endif // BUZZER_HPP
