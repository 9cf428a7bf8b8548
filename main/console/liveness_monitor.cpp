#include <main/console/liveness_monitor.hpp>

LivenessMonitor::LivenessMonitor(uint32_t timeout_ms)
    : timeout_ms(timeout_ms),
      last_receipt_ms(0),
      reported(DeviceState::NORMAL),
      has_report(false),
      offline_announced(false) {}

bool LivenessMonitor::isOffline(uint32_t now_ms) const {
    if (!has_report) {
        return true;
    }
    return (now_ms - last_receipt_ms) >= timeout_ms;
}

bool LivenessMonitor::onReport(DeviceState reported_state, uint32_t now_ms) {
    bool recovered = has_report && (offline_announced || isOffline(now_ms));
    reported = reported_state;
    last_receipt_ms = now_ms;
    has_report = true;
    offline_announced = false;
    return recovered;
}

DeviceState LivenessMonitor::displayedState(uint32_t now_ms) const {
    return isOffline(now_ms) ? DeviceState::OFFLINE : reported;
}

bool LivenessMonitor::checkWentOffline(uint32_t now_ms) {
    if (!has_report || offline_announced || !isOffline(now_ms)) {
        return false;
    }
    offline_announced = true;
    return true;
}
