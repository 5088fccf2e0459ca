#pragma once
#include <algorithm>
#include <chrono>

// ---------------------------------------------------------------------------
// Cooldown — restartable countdown used to rate-limit discrete actions.
//
// A freshly constructed cooldown is already ready (elapsed == duration), so
// the gated action is available at startup. tick() saturates at duration;
// a zero duration is always ready, even right after start().
//
// Time is kept in whole nanoseconds. Each float dt is rounded once on entry,
// and elapsed within k_tolerance of duration counts as ready, so N ticks of
// duration / N always complete the countdown.
// ---------------------------------------------------------------------------

class Cooldown {
public:
    using Nanos = std::chrono::nanoseconds;

    Cooldown() = default;
    explicit Cooldown(float duration_s)
        : duration_(to_nanos(std::max(0.0f, duration_s))), elapsed_(duration_) {}

    // Begin (or restart) the countdown.
    void start() { elapsed_ = Nanos::zero(); }

    // Advance by dt seconds. Negative dt is treated as zero.
    bool tick(float dt) {
        if (dt > 0.0f && !ready()) {
            elapsed_ += to_nanos(dt);
            if (elapsed_ + k_tolerance >= duration_) elapsed_ = duration_;
        }
        return ready();
    }

    bool ready() const { return elapsed_ >= duration_; }

    float duration() const { return to_seconds(duration_); }
    float elapsed()  const { return to_seconds(elapsed_); }

    // Seconds left until ready; 0 once ready.
    float remaining() const { return to_seconds(duration_ - elapsed_); }

private:
    static constexpr Nanos k_tolerance{1000};

    static Nanos to_nanos(float seconds) {
        return std::chrono::round<Nanos>(std::chrono::duration<double>(seconds));
    }

    static float to_seconds(Nanos n) {
        return std::chrono::duration<float>(n).count();
    }

    Nanos duration_ = Nanos::zero();
    Nanos elapsed_  = Nanos::zero();
};
