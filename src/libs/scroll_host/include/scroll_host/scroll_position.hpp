#pragma once

#include <scroll_host/scroll_activity.hpp>
#include <scroll_host/scroll_simulation.hpp>
#include <scroll_model/types.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace scroll_host {

// Scroll state of one view: offset, extent, user direction, attachment and
// the current activity. set_pixels/force_pixels/begin_activity/hold are the
// hooks subclasses intercept.
class ScrollPosition {
public:
    using Listener = std::function<void(double pixels)>;
    using ListenerId = std::size_t;

    explicit ScrollPosition(double initial_pixels = 0.0, scroll_model::ScrollExtent extent = {});
    virtual ~ScrollPosition();

    ScrollPosition(const ScrollPosition&) = delete;
    ScrollPosition& operator=(const ScrollPosition&) = delete;

    double pixels() const { return state_.pixels; }
    const scroll_model::ScrollOffsetState& state() const { return state_; }
    scroll_model::ScrollDirection user_scroll_direction() const { return state_.user_direction; }
    virtual void update_user_scroll_direction(scroll_model::ScrollDirection direction);

    const scroll_model::ScrollExtent& extent() const { return extent_; }
    void set_extent(const scroll_model::ScrollExtent& extent);

    bool attached() const { return attached_; }
    virtual void attach();
    virtual void detach();

    // Clamping path. Returns the overscroll, i.e. the part of the move that
    // the extent did not allow; 0 when the move was fully applied.
    virtual double set_pixels(double new_pixels);
    // Jump path. Applies the value unconditionally.
    virtual void force_pixels(double value);

    // Ignores a null activity.
    virtual void begin_activity(std::shared_ptr<ScrollActivity> activity);
    ScrollActivity* activity() const { return activity_.get(); }
    const std::shared_ptr<ScrollActivity>& current_activity() const { return activity_; }

    void go_idle();
    void go_ballistic(double velocity);
    virtual HoldHandle hold(std::function<void()> on_cancel);
    DragHandle drag(std::function<void()> on_dispose = {});
    void apply_user_offset(double delta);
    void jump_to(double value);
    void animate_to(double target, float duration);
    void tick(float dt);

    void set_simulation_factory(std::shared_ptr<const SimulationFactory> factory) {
        simulation_factory_ = std::move(factory);
    }

    ListenerId add_listener(Listener listener);
    void remove_listener(ListenerId id);

protected:
    void notify_listeners();

private:
    scroll_model::ScrollOffsetState state_;
    scroll_model::ScrollExtent extent_;
    bool attached_ = false;
    std::shared_ptr<ScrollActivity> activity_;
    std::shared_ptr<const SimulationFactory> simulation_factory_;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace scroll_host
