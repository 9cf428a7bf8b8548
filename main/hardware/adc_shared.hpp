#ifndef ADC_SHARED_HPP
#define ADC_SHARED_HPP

#include <esp_adc/adc_oneshot.h>
#include <hal/adc_types.h>

// ESP-IDF allows a single ADC1 unit handle; every analog input shares it.
namespace AdcShared {
    // Get or create the shared ADC1 handle. Returns nullptr on failure.
    adc_oneshot_unit_handle_t getAdc1Handle();

    // Map an ADC1-capable GPIO to its channel. Returns false for other pins.
    bool channelForGpio(gpio_num_t gpio, adc_channel_t& out_channel);

    // Serialize conversions across tasks
    void lock();
    void unlock();
}

#endif // ADC_SHARED_HPP
