#include <scroll_host/check.hpp>
#include <scroll_host/scroll_position.hpp>
#include <algorithm>

namespace scroll_host {

ScrollPosition::ScrollPosition(double initial_pixels, scroll_model::ScrollExtent extent)
    : extent_(extent)
{
    LINKED_SCROLL_CHECK(extent_.is_valid(), "scroll extent must have min <= max and a non-negative viewport");
    state_.pixels = initial_pixels;
    activity_ = std::make_shared<IdleActivity>(*this);
}

ScrollPosition::~ScrollPosition() {
    if (activity_) activity_->dispose();
}

void ScrollPosition::update_user_scroll_direction(scroll_model::ScrollDirection direction) {
    state_.user_direction = direction;
}

void ScrollPosition::set_extent(const scroll_model::ScrollExtent& extent) {
    LINKED_SCROLL_CHECK(extent.is_valid(), "scroll extent must have min <= max and a non-negative viewport");
    extent_ = extent;
}

void ScrollPosition::attach() {
    attached_ = true;
}

void ScrollPosition::detach() {
    attached_ = false;
}

double ScrollPosition::set_pixels(double new_pixels) {
    if (new_pixels == state_.pixels) return 0.0;
    const double clamped = extent_.clamp(new_pixels);
    const double overscroll = new_pixels - clamped;
    if (clamped != state_.pixels) {
        state_.pixels = clamped;
        notify_listeners();
    }
    return overscroll;
}

void ScrollPosition::force_pixels(double value) {
    if (value == state_.pixels) return;
    state_.pixels = value;
    notify_listeners();
}

void ScrollPosition::begin_activity(std::shared_ptr<ScrollActivity> activity) {
    if (!activity) return;
    // Install first so that code running from dispose() sees the new activity.
    std::shared_ptr<ScrollActivity> previous = std::move(activity_);
    activity_ = std::move(activity);
    if (previous) previous->dispose();
}

void ScrollPosition::go_idle() {
    begin_activity(std::make_shared<IdleActivity>(*this));
}

void ScrollPosition::go_ballistic(double velocity) {
    if (simulation_factory_) {
        auto simulation = simulation_factory_->create_fling(state_.pixels, velocity, extent_);
        if (simulation) {
            begin_activity(std::make_shared<BallisticActivity>(*this, std::move(simulation)));
            return;
        }
    }
    go_idle();
}

HoldHandle ScrollPosition::hold(std::function<void()> on_cancel) {
    auto activity = std::make_shared<HoldActivity>(*this, std::move(on_cancel));
    begin_activity(activity);
    return HoldHandle(activity);
}

DragHandle ScrollPosition::drag(std::function<void()> on_dispose) {
    auto activity = std::make_shared<DragActivity>(*this, std::move(on_dispose));
    begin_activity(activity);
    return DragHandle(activity);
}

void ScrollPosition::apply_user_offset(double delta) {
    if (delta == 0.0) return;
    const double target = state_.pixels - delta;
    update_user_scroll_direction(scroll_model::direction_between(state_.pixels, target));
    set_pixels(target);
}

void ScrollPosition::jump_to(double value) {
    go_idle();
    const double target = extent_.clamp(value);
    if (target != state_.pixels) force_pixels(target);
    // Settle with a new activity so that a driver releases the peers it jumped.
    go_ballistic(0.0);
}

void ScrollPosition::animate_to(double target, float duration) {
    const double clamped = extent_.clamp(target);
    if (duration <= 0.0f) {
        jump_to(clamped);
        return;
    }
    if (clamped == state_.pixels) return;
    begin_activity(std::make_shared<DrivenActivity>(*this, state_.pixels, clamped, duration));
}

void ScrollPosition::tick(float dt) {
    // Keep the activity alive while it runs; it may replace itself.
    std::shared_ptr<ScrollActivity> activity = activity_;
    if (activity) activity->tick(dt);
}

ScrollPosition::ListenerId ScrollPosition::add_listener(Listener listener) {
    const ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void ScrollPosition::remove_listener(ListenerId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
        [id](const auto& entry) { return entry.first == id; }), listeners_.end());
}

void ScrollPosition::notify_listeners() {
    const auto listeners = listeners_;
    for (const auto& entry : listeners) {
        if (entry.second) entry.second(state_.pixels);
    }
}

} // namespace scroll_host
