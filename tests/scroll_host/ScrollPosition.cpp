#include <gtest/gtest.h>
#include <scroll_host/scroll_position.hpp>
#include <memory>
#include <vector>

using scroll_host::ScrollPosition;
using scroll_model::ScrollDirection;
using scroll_model::ScrollExtent;

namespace {

ScrollExtent extent(double min, double max, double viewport = 0.0) {
    ScrollExtent e;
    e.min = min;
    e.max = max;
    e.viewport = viewport;
    return e;
}

// Constant-velocity motion that stops after a fixed number of steps.
class LinearSimulation : public scroll_host::ScrollSimulation {
public:
    LinearSimulation(double offset, double velocity, int steps)
        : offset_(offset), velocity_(velocity), steps_left_(steps) {}

    void step(float dt) override {
        if (steps_left_ <= 0) return;
        offset_ += velocity_ * static_cast<double>(dt);
        --steps_left_;
    }
    double offset() const override { return offset_; }
    double velocity() const override { return steps_left_ > 0 ? velocity_ : 0.0; }
    bool is_done() const override { return steps_left_ <= 0; }

private:
    double offset_;
    double velocity_;
    int steps_left_;
};

class LinearSimulationFactory : public scroll_host::SimulationFactory {
public:
    std::unique_ptr<scroll_host::ScrollSimulation> create_fling(double offset, double velocity,
        const ScrollExtent&) const override {
        if (velocity == 0.0) return nullptr;
        return std::make_unique<LinearSimulation>(offset, velocity, 4);
    }
};

} // namespace

TEST(ScrollPosition, StartsIdleAndDetached) {
    ScrollPosition position(12.0);

    EXPECT_EQ(position.pixels(), 12.0);
    EXPECT_FALSE(position.attached());
    ASSERT_NE(position.activity(), nullptr);
    EXPECT_STREQ(position.activity()->name(), "idle");
    EXPECT_EQ(position.user_scroll_direction(), ScrollDirection::Idle);
}

TEST(ScrollPosition, SetPixelsClampsAndReportsOverscroll) {
    ScrollPosition position(0.0, extent(0.0, 100.0, 40.0));

    EXPECT_EQ(position.set_pixels(130.0), 30.0);
    EXPECT_EQ(position.pixels(), 100.0);

    EXPECT_EQ(position.set_pixels(-20.0), -20.0);
    EXPECT_EQ(position.pixels(), 0.0);

    EXPECT_EQ(position.set_pixels(55.0), 0.0);
    EXPECT_EQ(position.pixels(), 55.0);
}

TEST(ScrollPosition, SetPixelsToCurrentOffsetIsNoOp) {
    ScrollPosition position(30.0);
    int notifications = 0;
    position.add_listener([&](double) { ++notifications; });

    EXPECT_EQ(position.set_pixels(30.0), 0.0);
    EXPECT_EQ(notifications, 0);
}

TEST(ScrollPosition, ForcePixelsBypassesExtent) {
    ScrollPosition position(0.0, extent(0.0, 100.0));

    position.force_pixels(250.0);

    EXPECT_EQ(position.pixels(), 250.0);
}

TEST(ScrollPosition, ListenersSeeEveryAppliedChange) {
    ScrollPosition position;
    std::vector<double> seen;
    const auto id = position.add_listener([&](double pixels) { seen.push_back(pixels); });

    position.set_pixels(10.0);
    position.force_pixels(-5.0);
    position.remove_listener(id);
    position.set_pixels(99.0);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], 10.0);
    EXPECT_EQ(seen[1], -5.0);
}

TEST(ScrollPosition, BeginActivityDisposesPreviousOne) {
    ScrollPosition position;
    const auto first = position.current_activity();

    position.go_idle();

    EXPECT_TRUE(first->disposed());
    EXPECT_EQ(first->delegate(), nullptr);
    EXPECT_NE(position.current_activity(), first);
    EXPECT_FALSE(position.activity()->disposed());
}

TEST(ScrollPosition, BeginActivityIgnoresNull) {
    ScrollPosition position;
    const auto current = position.current_activity();

    position.begin_activity(nullptr);

    EXPECT_EQ(position.current_activity(), current);
    EXPECT_FALSE(current->disposed());
}

TEST(ScrollPosition, HoldCancelFiresCallbackOnce) {
    ScrollPosition position;
    int cancels = 0;
    auto hold = position.hold([&]() { ++cancels; });
    EXPECT_STREQ(position.activity()->name(), "hold");
    EXPECT_TRUE(hold.active());

    hold.cancel();
    hold.cancel();

    EXPECT_EQ(cancels, 1);
    EXPECT_FALSE(hold.active());
    EXPECT_STREQ(position.activity()->name(), "idle");
}

TEST(ScrollPosition, ReplacingHoldFiresCancelCallback) {
    ScrollPosition position;
    int cancels = 0;
    auto hold = position.hold([&]() { ++cancels; });

    position.go_idle();

    EXPECT_EQ(cancels, 1);
    EXPECT_FALSE(hold.active());
}

TEST(ScrollPosition, ReleasedHoldDoesNotFireCallback) {
    ScrollPosition position;
    int cancels = 0;
    auto hold = position.hold([&]() { ++cancels; });

    hold.release();
    position.go_idle();

    EXPECT_EQ(cancels, 0);
}

TEST(ScrollPosition, DragMovesAgainstPointerDelta) {
    ScrollPosition position(0.0, extent(0.0, 1000.0));
    auto drag = position.drag();

    drag.update(-10.0, 1.0f / 60.0f);
    EXPECT_EQ(position.pixels(), 10.0);
    EXPECT_EQ(position.user_scroll_direction(), ScrollDirection::Forward);

    drag.update(4.0, 1.0f / 60.0f);
    EXPECT_EQ(position.pixels(), 6.0);
    EXPECT_EQ(position.user_scroll_direction(), ScrollDirection::Reverse);
    EXPECT_STREQ(position.activity()->name(), "drag");
}

TEST(ScrollPosition, DragEndWithoutFactoryGoesIdle) {
    ScrollPosition position;
    bool drag_disposed = false;
    auto drag = position.drag([&]() { drag_disposed = true; });

    drag.end(800.0);

    EXPECT_TRUE(drag_disposed);
    EXPECT_FALSE(drag.active());
    EXPECT_STREQ(position.activity()->name(), "idle");
}

TEST(ScrollPosition, DragEndFlingsThroughSimulationFactory) {
    ScrollPosition position(0.0, extent(0.0, 1000.0));
    position.set_simulation_factory(std::make_shared<LinearSimulationFactory>());
    auto drag = position.drag();

    drag.end(100.0);
    ASSERT_STREQ(position.activity()->name(), "ballistic");
    EXPECT_EQ(position.activity()->velocity(), 100.0);

    for (int i = 0; i < 4; ++i)
        position.tick(0.5f);

    EXPECT_DOUBLE_EQ(position.pixels(), 200.0);
    EXPECT_STREQ(position.activity()->name(), "idle");
}

TEST(ScrollPosition, BallisticStopsWhenHittingTheEdge) {
    ScrollPosition position(90.0, extent(0.0, 100.0));
    position.set_simulation_factory(std::make_shared<LinearSimulationFactory>());

    position.go_ballistic(100.0);
    position.tick(0.5f);

    EXPECT_EQ(position.pixels(), 100.0);
    EXPECT_STREQ(position.activity()->name(), "idle");
}

TEST(ScrollPosition, JumpToClampsAndEndsIdle) {
    ScrollPosition position(0.0, extent(0.0, 100.0));

    position.jump_to(300.0);

    EXPECT_EQ(position.pixels(), 100.0);
    EXPECT_STREQ(position.activity()->name(), "idle");
}

TEST(ScrollPosition, AnimateToReachesTargetThenGoesIdle) {
    ScrollPosition position(0.0, extent(0.0, 1000.0));

    position.animate_to(200.0, 0.2f);
    ASSERT_STREQ(position.activity()->name(), "driven");

    double previous = position.pixels();
    for (int i = 0; i < 4; ++i) {
        position.tick(0.05f);
        EXPECT_GE(position.pixels(), previous);
        previous = position.pixels();
    }

    EXPECT_EQ(position.pixels(), 200.0);
    EXPECT_STREQ(position.activity()->name(), "idle");
}

TEST(ScrollPosition, AnimateToWithoutDurationJumps) {
    ScrollPosition position;

    position.animate_to(42.0, 0.0f);

    EXPECT_EQ(position.pixels(), 42.0);
    EXPECT_STREQ(position.activity()->name(), "idle");
}

TEST(ScrollPosition, SetExtentKeepsOffsetUntilNextClampingMove) {
    ScrollPosition position(500.0);

    position.set_extent(extent(0.0, 100.0));
    EXPECT_EQ(position.pixels(), 500.0);

    position.set_pixels(499.0);
    EXPECT_EQ(position.pixels(), 100.0);
}
