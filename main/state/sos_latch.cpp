#include <main/state/sos_latch.hpp>

SosLatch::SosLatch(uint32_t debounce_ms, uint8_t deactivation_presses)
    : debounce_ms(debounce_ms),
      deactivation_presses(deactivation_presses == 0 ? 1 : deactivation_presses),
      mode(Mode::IDLE),
      pending_presses(0),
      last_accepted_ms(0),
      has_accepted(false) {}

bool SosLatch::onReleaseEdge(uint32_t now_ms) {
    // Unsigned difference stays correct across millisecond counter wrap
    if (has_accepted && (now_ms - last_accepted_ms) < debounce_ms) {
        return false;
    }
    has_accepted = true;
    last_accepted_ms = now_ms;

    if (mode == Mode::IDLE) {
        mode = Mode::ACTIVE;
        pending_presses = 0;
        return true;
    }

    ++pending_presses;
    if (pending_presses >= deactivation_presses) {
        mode = Mode::IDLE;
        pending_presses = 0;
    }
    return true;
}
