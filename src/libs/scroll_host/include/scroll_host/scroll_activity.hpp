#pragma once

#include <animation/offset_animator.hpp>
#include <scroll_host/scroll_simulation.hpp>
#include <functional>
#include <memory>

namespace scroll_host {

class ScrollPosition;

// The reason a position's offset is currently changing. A position owns
// exactly one activity; the previous one is disposed when another begins.
class ScrollActivity {
public:
    explicit ScrollActivity(ScrollPosition& delegate);
    virtual ~ScrollActivity();

    ScrollActivity(const ScrollActivity&) = delete;
    ScrollActivity& operator=(const ScrollActivity&) = delete;

    // Null once disposed.
    ScrollPosition* delegate() const { return delegate_; }
    bool disposed() const { return disposed_; }

    virtual const char* name() const = 0;
    virtual bool is_scrolling() const = 0;
    virtual bool should_ignore_pointer() const = 0;
    virtual double velocity() const { return 0.0; }
    virtual void tick(float dt) { (void)dt; }

    // Runs on_dispose() once; later calls do nothing.
    void dispose();

protected:
    virtual void on_dispose() {}

private:
    ScrollPosition* delegate_;
    bool disposed_ = false;
};

class IdleActivity final : public ScrollActivity {
public:
    using ScrollActivity::ScrollActivity;

    const char* name() const override { return "idle"; }
    bool is_scrolling() const override { return false; }
    bool should_ignore_pointer() const override { return false; }
};

class HoldActivity final : public ScrollActivity {
public:
    HoldActivity(ScrollPosition& delegate, std::function<void()> on_cancel);

    const char* name() const override { return "hold"; }
    bool is_scrolling() const override { return false; }
    bool should_ignore_pointer() const override { return false; }

    // Drops the cancel callback, e.g. when a drag takes over the hold.
    void release() { on_cancel_ = nullptr; }

protected:
    void on_dispose() override;

private:
    std::function<void()> on_cancel_;
};

class DragActivity final : public ScrollActivity {
public:
    DragActivity(ScrollPosition& delegate, std::function<void()> on_dispose);

    const char* name() const override { return "drag"; }
    bool is_scrolling() const override { return true; }
    bool should_ignore_pointer() const override { return true; }
    double velocity() const override { return last_velocity_; }

    void record_velocity(double velocity) { last_velocity_ = velocity; }

protected:
    void on_dispose() override;

private:
    std::function<void()> on_dispose_;
    double last_velocity_ = 0.0;
};

// Moves the position along a simulation until it finishes or overscrolls.
class BallisticActivity final : public ScrollActivity {
public:
    BallisticActivity(ScrollPosition& delegate, std::unique_ptr<ScrollSimulation> simulation);

    const char* name() const override { return "ballistic"; }
    bool is_scrolling() const override { return true; }
    bool should_ignore_pointer() const override { return true; }
    double velocity() const override;
    void tick(float dt) override;

private:
    std::unique_ptr<ScrollSimulation> simulation_;
};

// Ease-out animation towards a fixed target.
class DrivenActivity final : public ScrollActivity {
public:
    DrivenActivity(ScrollPosition& delegate, double from, double to, float duration);

    const char* name() const override { return "driven"; }
    bool is_scrolling() const override { return true; }
    bool should_ignore_pointer() const override { return true; }
    double velocity() const override { return velocity_; }
    void tick(float dt) override;

    double target() const { return animator_.target(); }

private:
    animation::OffsetAnimator animator_;
    double velocity_ = 0.0;
};

// Handle returned by ScrollPosition::hold(). Does not own the activity.
class HoldHandle {
public:
    HoldHandle() = default;
    explicit HoldHandle(std::weak_ptr<HoldActivity> activity) : activity_(std::move(activity)) {}

    bool active() const;
    // Ends the hold; the cancel callback fires.
    void cancel();
    // Forgets the hold without firing the cancel callback.
    void release();

private:
    std::weak_ptr<HoldActivity> activity_;
};

class DragHandle {
public:
    DragHandle() = default;
    explicit DragHandle(std::weak_ptr<DragActivity> activity) : activity_(std::move(activity)) {}

    bool active() const;
    // delta is the pointer movement; the offset moves the opposite way.
    void update(double delta, float dt);
    // velocity is in offset units per second.
    void end(double velocity);
    void cancel();

private:
    std::shared_ptr<DragActivity> live() const;

    std::weak_ptr<DragActivity> activity_;
};

} // namespace scroll_host
