#include <loopsim/core/virtual_clock.hpp>
#include <loopsim/core/error.hpp>

#include <limits>
#include <string>

namespace loopsim::core {

VirtualClock::VirtualClock(TimePoint start) noexcept
    : now_ms_(time_to_millis(start)) {}

VirtualClock& VirtualClock::global() noexcept {
    static VirtualClock clock;
    return clock;
}

TimePoint VirtualClock::now() const noexcept {
    return time_from_millis(now_ms_.load(std::memory_order_acquire));
}

TimePoint VirtualClock::advance_by(Duration d) {
    if (d < Duration::zero()) {
        throw OutOfRangeError("Cannot advance the virtual clock by a negative duration");
    }
    const int64_t delta = duration_to_millis(d);
    int64_t current = now_ms_.load(std::memory_order_acquire);
    int64_t target = 0;
    do {
        if (current > std::numeric_limits<int64_t>::max() - delta) {
            throw OutOfRangeError("Advancing the virtual clock by " + std::to_string(delta)
                                  + " ms would overflow it");
        }
        target = current + delta;
    } while (!now_ms_.compare_exchange_weak(current, target, std::memory_order_acq_rel,
                                            std::memory_order_acquire));
    return time_from_millis(target);
}

bool VirtualClock::set_absolute(TimePoint instant) noexcept {
    const int64_t target = time_to_millis(instant);
    int64_t current = now_ms_.load(std::memory_order_acquire);
    while (current < target) {
        if (now_ms_.compare_exchange_weak(current, target, std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

void VirtualClock::reset(TimePoint start) noexcept {
    now_ms_.store(time_to_millis(start), std::memory_order_release);
}

} // namespace loopsim::core
