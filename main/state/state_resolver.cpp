#include <main/state/state_resolver.hpp>

namespace {
    float absf(float v) {
        return v < 0.0f ? -v : v;
    }

    DeviceState applyMotion(const SensorSnapshot& s, MotionTimer& timer,
                            const ResolverConfig& cfg, Resolution& out) {
        if (!s.motion_valid) {
            out.health.motion_ok = false;
            return DeviceState::NORMAL;
        }
        if (!timer.armed) {
            timer.last_moved_ms = s.ts_ms;
            timer.armed = true;
        }

        if (absf(s.acc_deviation_g) > cfg.movement_threshold_g) {
            timer.last_moved_ms = s.ts_ms;
            out.moving = true;
            out.still_ms = 0;
            return DeviceState::NORMAL;
        }

        uint32_t elapsed = s.ts_ms - timer.last_moved_ms;
        out.moving = false;
        out.still_ms = elapsed;
        if (elapsed >= cfg.still_emergency_ms) {
            out.causes |= CAUSE_STILL_EMERGENCY;
            return DeviceState::EMERGENCY;
        }
        if (elapsed >= cfg.still_warning_ms) {
            out.causes |= CAUSE_STILL_WARNING;
            return DeviceState::WARNING;
        }
        return DeviceState::NORMAL;
    }

    DeviceState applyTemperature(const SensorSnapshot& s, const ResolverConfig& cfg,
                                 Resolution& out) {
        if (!s.temperature_valid) {
            out.health.environment_ok = false;
            return DeviceState::NORMAL;
        }
        if (s.temperature_c >= cfg.temp_critical_c) {
            out.causes |= CAUSE_TEMP_CRITICAL;
            return DeviceState::EMERGENCY;
        }
        if (s.temperature_c >= cfg.temp_warning_c) {
            out.causes |= CAUSE_TEMP_HIGH;
            return DeviceState::WARNING;
        }
        return DeviceState::NORMAL;
    }
}

namespace StateResolver {
    Resolution resolve(const SensorSnapshot& snapshot,
                       MotionTimer& timer,
                       const SosLatch& latch,
                       const ResolverConfig& config) {
        Resolution out{};
        out.health.position_ok = snapshot.has_fix;

        DeviceState candidate = DeviceState::NORMAL;
        candidate = DeviceStatus::maxSeverity(candidate, applyMotion(snapshot, timer, config, out));
        candidate = DeviceStatus::maxSeverity(candidate, applyTemperature(snapshot, config, out));

        if (latch.isActive()) {
            out.state = DeviceState::SOS;
            out.causes |= CAUSE_SOS;
            return out;
        }
        out.state = candidate;
        return out;
    }
}
