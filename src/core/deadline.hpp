#pragma once

#include <chrono>

// One-shot monotonic deadline. Checked by its owner's loop; never fires on
// its own.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    void arm(Clock::duration d) {
        armed_ = true;
        at_ = Clock::now() + d;
    }

    // Returns true if this call disarmed a live deadline.
    bool disarm() {
        if (!armed_) return false;
        armed_ = false;
        return true;
    }

    bool armed() const { return armed_; }

    bool expired(Clock::time_point now = Clock::now()) const {
        return armed_ && now >= at_;
    }

    Clock::duration remaining(Clock::time_point now = Clock::now()) const {
        if (!armed_ || now >= at_) return Clock::duration::zero();
        return at_ - now;
    }

private:
    bool armed_ = false;
    Clock::time_point at_{};
};
