#include "controller/KeyRepeat.hpp"

namespace blockfall::controller {

void KeyRepeat::press() noexcept {
    held_ = true;
    holdTime_ = Duration{0};
    repeatsFired_ = 0;
}

void KeyRepeat::release() noexcept {
    held_ = false;
    holdTime_ = Duration{0};
    repeatsFired_ = 0;
}

int KeyRepeat::advance(Duration elapsed) noexcept {
    if (!held_) {
        return 0;
    }

    holdTime_ += elapsed;
    if (holdTime_ < Delay + Rate) {
        return 0;
    }

    // First repeat lands one Rate after the initial Delay
    const int due = static_cast<int>((holdTime_ - Delay) / Rate);
    const int fresh = due - repeatsFired_;
    repeatsFired_ = due;
    return fresh;
}

} // namespace blockfall::controller
