#ifndef DEVICE_STATE_HPP
#define DEVICE_STATE_HPP

#include <cstdint>
#include <main/models/device_status.hpp>

// Latest resolved state of this wearable, written by the sampling task
// and read by the alarm task.
namespace DeviceStateMachine {
    void init();

    // Returns true when the state differs from the previous one
    bool set(DeviceState state, uint8_t causes, const SubsystemHealth& health, uint32_t now_ms);

    DeviceState get();
}

#endif // DEVICE_STATE_HPP
