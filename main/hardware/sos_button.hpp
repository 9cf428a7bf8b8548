#ifndef SOS_BUTTON_HPP
#define SOS_BUTTON_HPP

#include <driver/gpio.h>
#include <main/config/config.hpp>

// Momentary push button read by polling. Edge detection and debounce
// happen in the sampling loop, not here.
class SosButton {
public:
    explicit SosButton(gpio_num_t button_pin = Config::Hardware::Pins::sos_button_gpio,
                       bool active_low = true);

    bool init();
    bool isPressed() const;

private:
    gpio_num_t pin;
    bool active_low;
    bool initialized;
};

#endif // SOS_BUTTON_HPP
