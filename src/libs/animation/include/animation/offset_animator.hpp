#pragma once

namespace animation {

// Eases a single offset from a start value to a target over a fixed duration.
class OffsetAnimator {
public:
    OffsetAnimator();
    void set_duration(float seconds) { duration_ = seconds; }
    float duration() const { return duration_; }

    void start(double from, double to);
    void tick(float dt);

    double current() const { return current_; }
    double target() const { return target_; }
    bool done() const { return done_; }

private:
    double from_ = 0.0;
    double target_ = 0.0;
    double current_ = 0.0;
    float elapsed_ = 0.0f;
    float duration_ = 0.18f;
    bool done_ = true;
};

} // namespace animation
