#ifndef STATE_RESOLVER_HPP
#define STATE_RESOLVER_HPP

#include <cstdint>
#include <main/config/monitoring.hpp>
#include <main/models/resolved_sample.hpp>
#include <main/models/sensor_snapshot.hpp>
#include <main/state/sos_latch.hpp>

// Last time the wearer was seen moving. Owned by the sampling loop and
// only ever mutated by StateResolver::resolve().
struct MotionTimer {
    uint32_t last_moved_ms = 0;
    bool     armed = false;
};

struct ResolverConfig {
    float    movement_threshold_g = Config::Monitoring::movement_threshold_g;
    uint32_t still_warning_ms     = Config::Monitoring::still_warning_ms;
    uint32_t still_emergency_ms   = Config::Monitoring::still_emergency_ms;
    float    temp_warning_c       = Config::Monitoring::temp_warning_c;
    float    temp_critical_c      = Config::Monitoring::temp_critical_c;
};

namespace StateResolver {
    // Fuse one snapshot into a single state. Rules, in order:
    //   1. SOS latch active -> SOS (timer still maintained)
    //   2. baseline NORMAL
    //   3. movement resets the timer; stillness escalates by elapsed time
    //   4. temperature escalates by threshold; invalid readings only flag health
    //   5. result is the highest severity any rule produced
    // Bounded time, no allocation, no I/O.
    Resolution resolve(const SensorSnapshot& snapshot,
                       MotionTimer& timer,
                       const SosLatch& latch,
                       const ResolverConfig& config = ResolverConfig{});
}

#endif // STATE_RESOLVER_HPP
