#pragma once

#include "types.hpp"

#include <algorithm>
#include <optional>

namespace codebox::core {

// A point on the monotonic clock after which an operation must give up.
// A default-constructed deadline never expires; cleanup steps use it so
// that a deadline which already fired cannot skip them.
class Deadline {
public:
    Deadline() = default;

    static Deadline none() { return Deadline{}; }

    static Deadline after(Duration timeout) {
        Deadline deadline;
        deadline.expiry_ = SteadyClock::now() + timeout;
        return deadline;
    }

    bool bounded() const { return expiry_.has_value(); }

    bool expired() const {
        return expiry_ && SteadyClock::now() >= *expiry_;
    }

    // Time left before expiry; Duration::max() when unbounded
    Duration remaining() const {
        if (!expiry_) {
            return Duration::max();
        }
        auto left = std::chrono::duration_cast<Duration>(*expiry_ - SteadyClock::now());
        return std::max(left, Duration::zero());
    }

    // Remaining time, or `fallback` when unbounded
    Duration remaining_or(Duration fallback) const {
        return expiry_ ? remaining() : fallback;
    }

private:
    std::optional<SteadyClock::time_point> expiry_;
};

}  // namespace codebox::core
