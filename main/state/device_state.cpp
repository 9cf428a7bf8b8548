#include <main/state/device_state.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/portmacro.h>

namespace {
    struct StateData {
        DeviceState     state;
        uint8_t         causes;
        SubsystemHealth health;
        uint32_t        last_change_ms;
    };

    StateData s_data { DeviceState::NORMAL, CAUSE_NONE, SubsystemHealth{}, 0 };
#if defined(CONFIG_FREERTOS_UNICORE) || defined(portMUX_INITIALIZER_UNLOCKED)
    portMUX_TYPE s_mux = portMUX_INITIALIZER_UNLOCKED;
    inline void enter() { taskENTER_CRITICAL(&s_mux); }
    inline void leave() { taskEXIT_CRITICAL(&s_mux); }
#else
    inline void enter() { taskENTER_CRITICAL(); }
    inline void leave() { taskEXIT_CRITICAL(); }
#endif
}

namespace DeviceStateMachine {
    void init() {
        enter();
        s_data.state = DeviceState::NORMAL;
        s_data.causes = CAUSE_NONE;
        s_data.health = SubsystemHealth{};
        s_data.last_change_ms = 0;
        leave();
    }

    bool set(DeviceState state, uint8_t causes, const SubsystemHealth& health, uint32_t now_ms) {
        enter();
        bool changed = (s_data.state != state);
        s_data.state = state;
        s_data.causes = causes;
        s_data.health = health;
        if (changed) {
            s_data.last_change_ms = now_ms;
        }
        leave();
        return changed;
    }

    DeviceState get() {
        enter();
        DeviceState st = s_data.state;
        leave();
        return st;
    }
}
