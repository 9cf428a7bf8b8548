#ifndef ROLLING_WINDOW_HPP
#define ROLLING_WINDOW_HPP

#include <cstddef>
#include <array>

// Fixed-capacity, header-only rolling window.
// - No dynamic allocation (storage is embedded).
// - push() always succeeds; on overflow the oldest entry is evicted.
// - at(0) is the oldest retained entry, at(size() - 1) the newest.
// - No internal locking; the owner serializes access.
template<typename T, std::size_t Capacity>
class RollingWindow {
public:
    static_assert(Capacity > 0, "RollingWindow capacity must be greater than zero");

    RollingWindow() : oldest_index(0), count(0) {}

    void push(const T& value) {
        if (count < Capacity) {
            storage[(oldest_index + count) % Capacity] = value;
            ++count;
            return;
        }
        storage[oldest_index] = value;
        oldest_index = (oldest_index + 1U) % Capacity;
    }

    const T& at(std::size_t index) const {
        return storage[(oldest_index + index) % Capacity];
    }

    bool newest(T& out_value) const {
        if (isEmpty()) {
            return false;
        }
        out_value = at(count - 1U);
        return true;
    }

    bool isFull() const {
        return count == Capacity;
    }

    bool isEmpty() const {
        return count == 0U;
    }

    std::size_t size() const {
        return count;
    }

    static constexpr std::size_t capacity() {
        return Capacity;
    }

    void clear() {
        oldest_index = 0U;
        count = 0U;
    }

private:
    std::array<T, Capacity> storage{};
    std::size_t oldest_index;
    std::size_t count;
};

#endif // ROLLING_WINDOW_HPP
