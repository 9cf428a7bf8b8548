#ifndef SOS_LATCH_HPP
#define SOS_LATCH_HPP

#include <cstdint>
#include <main/config/monitoring.hpp>

// Turns a sampled button level into release edges. A held button yields
// nothing until it is let go.
class ReleaseEdgeDetector {
public:
    ReleaseEdgeDetector() : was_pressed(false) {}

    // Returns true exactly once per pressed -> released transition
    bool update(bool pressed) {
        bool released = was_pressed && !pressed;
        was_pressed = pressed;
        return released;
    }

private:
    bool was_pressed;
};

// Manual distress latch. One accepted edge activates; two more accepted
// edges are needed to clear. Edges closer than the debounce interval to
// the previously accepted edge are dropped.
class SosLatch {
public:
    enum class Mode : uint8_t { IDLE = 0, ACTIVE = 1 };

    explicit SosLatch(uint32_t debounce_ms = Config::Monitoring::sos_debounce_ms,
                      uint8_t deactivation_presses = Config::Monitoring::sos_deactivation_presses);

    // Feed a release edge observed at now_ms. Returns true if it was
    // accepted (outside the debounce window), whether or not the mode changed.
    bool onReleaseEdge(uint32_t now_ms);

    bool isActive() const { return mode == Mode::ACTIVE; }
    uint8_t pendingDeactivationPresses() const { return pending_presses; }
    uint32_t lastAcceptedEdgeMs() const { return last_accepted_ms; }

private:
    uint32_t debounce_ms;
    uint8_t  deactivation_presses;
    Mode     mode;
    uint8_t  pending_presses;
    uint32_t last_accepted_ms;
    bool     has_accepted;
};

#endif // SOS_LATCH_HPP
