#include <animation/offset_animator.hpp>
#include <algorithm>
#include <cmath>

namespace animation {

namespace {

const double snap_distance = 0.5;

double ease_out(double t) {
    if (t >= 1.0) return 1.0;
    return 1.0 - (1.0 - t) * (1.0 - t);
}

} // namespace

OffsetAnimator::OffsetAnimator() = default;

void OffsetAnimator::start(double from, double to) {
    from_ = from;
    target_ = to;
    current_ = from;
    elapsed_ = 0.0f;
    done_ = from == to || duration_ <= 0.0f;
    if (done_) current_ = to;
}

void OffsetAnimator::tick(float dt) {
    if (done_ || dt <= 0.f) return;
    elapsed_ += dt;
    double t = static_cast<double>(elapsed_) / static_cast<double>(duration_);
    t = std::min(1.0, t);
    current_ = from_ + (target_ - from_) * ease_out(t);
    if (t >= 1.0 || std::abs(target_ - current_) < snap_distance) {
        current_ = target_;
        done_ = true;
    }
}

} // namespace animation
