#pragma once

#include <chrono>

namespace blockfall::controller {

// Auto-repeat for a held key (DAS/ARR): the press itself acts once,
// then after Delay the action repeats every Rate while the key stays down.
class KeyRepeat {
public:
    using Duration = std::chrono::microseconds;

    static constexpr Duration Delay{170'000};
    static constexpr Duration Rate{50'000};

    void press() noexcept;
    void release() noexcept;

    bool held() const noexcept { return held_; }

    // Advance the hold timer; returns how many repeats are now due
    int advance(Duration elapsed) noexcept;

private:
    bool held_{false};
    Duration holdTime_{0};
    int repeatsFired_{0};
};

} // namespace blockfall::controller
