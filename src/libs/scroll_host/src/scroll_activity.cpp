#include <scroll_host/scroll_activity.hpp>
#include <scroll_host/scroll_position.hpp>
#include <utility>

namespace scroll_host {

ScrollActivity::ScrollActivity(ScrollPosition& delegate) : delegate_(&delegate) {}

ScrollActivity::~ScrollActivity() = default;

void ScrollActivity::dispose() {
    if (disposed_) return;
    disposed_ = true;
    on_dispose();
    delegate_ = nullptr;
}

HoldActivity::HoldActivity(ScrollPosition& delegate, std::function<void()> on_cancel)
    : ScrollActivity(delegate), on_cancel_(std::move(on_cancel)) {}

void HoldActivity::on_dispose() {
    if (!on_cancel_) return;
    auto callback = std::move(on_cancel_);
    on_cancel_ = nullptr;
    callback();
}

DragActivity::DragActivity(ScrollPosition& delegate, std::function<void()> on_dispose)
    : ScrollActivity(delegate), on_dispose_(std::move(on_dispose)) {}

void DragActivity::on_dispose() {
    if (!on_dispose_) return;
    auto callback = std::move(on_dispose_);
    on_dispose_ = nullptr;
    callback();
}

BallisticActivity::BallisticActivity(ScrollPosition& delegate, std::unique_ptr<ScrollSimulation> simulation)
    : ScrollActivity(delegate), simulation_(std::move(simulation)) {}

double BallisticActivity::velocity() const {
    return simulation_ ? simulation_->velocity() : 0.0;
}

void BallisticActivity::tick(float dt) {
    if (disposed() || !simulation_) return;
    simulation_->step(dt);
    const double overscroll = delegate()->set_pixels(simulation_->offset());
    // set_pixels may have replaced this activity (e.g. a peer took over).
    if (disposed()) return;
    if (overscroll != 0.0 || simulation_->is_done())
        delegate()->go_idle();
}

DrivenActivity::DrivenActivity(ScrollPosition& delegate, double from, double to, float duration)
    : ScrollActivity(delegate)
{
    animator_.set_duration(duration);
    animator_.start(from, to);
}

void DrivenActivity::tick(float dt) {
    if (disposed()) return;
    const double before = animator_.current();
    animator_.tick(dt);
    velocity_ = dt > 0.f ? (animator_.current() - before) / static_cast<double>(dt) : 0.0;
    const double overscroll = delegate()->set_pixels(animator_.current());
    if (disposed()) return;
    if (overscroll != 0.0 || animator_.done())
        delegate()->go_idle();
}

bool HoldHandle::active() const {
    auto activity = activity_.lock();
    return activity && !activity->disposed();
}

void HoldHandle::cancel() {
    auto activity = activity_.lock();
    activity_.reset();
    if (!activity || activity->disposed()) return;
    activity->delegate()->go_idle();
}

void HoldHandle::release() {
    auto activity = activity_.lock();
    activity_.reset();
    if (activity) activity->release();
}

std::shared_ptr<DragActivity> DragHandle::live() const {
    auto activity = activity_.lock();
    if (!activity || activity->disposed()) return nullptr;
    return activity;
}

bool DragHandle::active() const {
    return live() != nullptr;
}

void DragHandle::update(double delta, float dt) {
    auto activity = live();
    if (!activity) return;
    if (dt > 0.f) activity->record_velocity(-delta / static_cast<double>(dt));
    activity->delegate()->apply_user_offset(delta);
}

void DragHandle::end(double velocity) {
    auto activity = live();
    activity_.reset();
    if (!activity) return;
    activity->delegate()->go_ballistic(velocity);
}

void DragHandle::cancel() {
    auto activity = live();
    activity_.reset();
    if (!activity) return;
    activity->delegate()->go_idle();
}

} // namespace scroll_host
