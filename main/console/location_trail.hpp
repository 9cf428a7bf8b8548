#ifndef LOCATION_TRAIL_HPP
#define LOCATION_TRAIL_HPP

#include <cstddef>
#include <main/config/monitoring.hpp>
#include <main/utils/rolling_window.hpp>

struct GeoPoint {
    double latitude;
    double longitude;
};

// Recent positions of one device. Jitter below min_step is not recorded.
class LocationTrail {
public:
    static constexpr std::size_t kCapacity = Config::Console::trail_capacity;

    // Returns true if the point was appended
    bool add(double latitude, double longitude) {
        GeoPoint last{};
        if (points.newest(last) &&
            absd(last.latitude - latitude) <= Config::Console::trail_min_step_deg &&
            absd(last.longitude - longitude) <= Config::Console::trail_min_step_deg) {
            return false;
        }
        points.push(GeoPoint{latitude, longitude});
        return true;
    }

    std::size_t size() const { return points.size(); }
    const GeoPoint& at(std::size_t index) const { return points.at(index); }
    bool newest(GeoPoint& out) const { return points.newest(out); }

private:
    static double absd(double v) { return v < 0.0 ? -v : v; }

    RollingWindow<GeoPoint, kCapacity> points;
};

#endif // LOCATION_TRAIL_HPP
