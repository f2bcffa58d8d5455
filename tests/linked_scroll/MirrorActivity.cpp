#include <gtest/gtest.h>
#include <linked_scroll/linked_scroll_group.hpp>
#include <linked_scroll/linked_scroll_position.hpp>
#include <linked_scroll/mirror_activity.hpp>
#include <memory>

using linked_scroll::LinkedScrollGroup;
using linked_scroll::LinkedScrollPosition;
using linked_scroll::MirrorActivity;
using scroll_model::ScrollDirection;

namespace {

class MirrorActivityTest : public ::testing::Test {
protected:
    MirrorActivityTest() : group(make_extent()), a(attach(group.create_position())),
        b(attach(group.create_position())), c(attach(group.create_position())) {}

    static scroll_model::ScrollExtent make_extent() {
        scroll_model::ScrollExtent extent;
        extent.min = 0.0;
        extent.max = 100.0;
        return extent;
    }

    static LinkedScrollPosition& attach(LinkedScrollPosition& position) {
        position.attach();
        return position;
    }

    // c mirrors both a and b.
    std::shared_ptr<MirrorActivity> mirror_on_c() {
        auto mirror = std::make_shared<MirrorActivity>(c);
        c.begin_activity(mirror);
        mirror->link(a);
        mirror->link(b);
        return mirror;
    }

    LinkedScrollGroup group;
    LinkedScrollPosition& a;
    LinkedScrollPosition& b;
    LinkedScrollPosition& c;
};

} // namespace

TEST_F(MirrorActivityTest, RelaysDriverMotionProperties) {
    const auto mirror = mirror_on_c();

    EXPECT_STREQ(mirror->name(), "mirror");
    EXPECT_TRUE(mirror->is_scrolling());
    EXPECT_TRUE(mirror->should_ignore_pointer());
    EXPECT_EQ(mirror->velocity(), 0.0);
    EXPECT_EQ(mirror->driver_count(), 2u);
    EXPECT_EQ(group.counters().mirrors_created, 1u);
}

TEST_F(MirrorActivityTest, AgreeingDriversSetDirection) {
    const auto mirror = mirror_on_c();
    a.update_user_scroll_direction(ScrollDirection::Forward);
    b.update_user_scroll_direction(ScrollDirection::Forward);

    mirror->move_to(15.0);

    EXPECT_EQ(c.pixels(), 15.0);
    EXPECT_EQ(c.user_scroll_direction(), ScrollDirection::Forward);
}

TEST_F(MirrorActivityTest, DisagreeingDriversLeaveDirectionIdle) {
    const auto mirror = mirror_on_c();
    a.update_user_scroll_direction(ScrollDirection::Forward);
    b.update_user_scroll_direction(ScrollDirection::Reverse);

    mirror->move_to(15.0);

    EXPECT_EQ(c.user_scroll_direction(), ScrollDirection::Idle);
}

TEST_F(MirrorActivityTest, LinkingSameDriverTwiceCountsOnce) {
    const auto mirror = mirror_on_c();

    mirror->link(a);

    EXPECT_EQ(mirror->driver_count(), 2u);
}

TEST_F(MirrorActivityTest, LastUnlinkSendsOwnerIdle) {
    const auto mirror = mirror_on_c();

    mirror->unlink(a);
    EXPECT_EQ(c.current_activity(), mirror);
    EXPECT_FALSE(mirror->disposed());

    mirror->unlink(b);
    EXPECT_TRUE(mirror->disposed());
    EXPECT_STREQ(c.activity()->name(), "idle");
}

TEST_F(MirrorActivityTest, DisposeUnlinksFromDrivers) {
    a.set_pixels(10.0);
    const auto mirror = std::dynamic_pointer_cast<MirrorActivity>(b.current_activity());
    ASSERT_NE(mirror, nullptr);
    ASSERT_EQ(a.peer_activity_count(), 2u);

    b.go_idle();

    EXPECT_TRUE(mirror->disposed());
    EXPECT_EQ(mirror->driver_count(), 0u);
    EXPECT_EQ(a.peer_activity_count(), 1u);
}

TEST_F(MirrorActivityTest, MovesAfterDisposeAreIgnored) {
    const auto mirror = mirror_on_c();
    c.go_idle();

    mirror->move_to(40.0);
    mirror->jump_to(40.0);
    mirror->link(a);

    EXPECT_EQ(c.pixels(), 0.0);
    EXPECT_EQ(mirror->driver_count(), 0u);
}

TEST_F(MirrorActivityTest, RemovedDriverIsDroppedFromMirror) {
    const auto mirror = mirror_on_c();

    group.remove_position(a);

    EXPECT_EQ(mirror->driver_count(), 1u);
    EXPECT_TRUE(mirror->is_driven_by(b));
    EXPECT_EQ(c.current_activity(), mirror);

    group.remove_position(b);

    EXPECT_EQ(mirror->driver_count(), 0u);
    EXPECT_STREQ(c.activity()->name(), "idle");
}

TEST_F(MirrorActivityTest, MoveClampsAndJumpDoesNot) {
    const auto mirror = mirror_on_c();

    mirror->move_to(150.0);
    EXPECT_EQ(c.pixels(), 100.0);

    mirror->jump_to(150.0);
    EXPECT_EQ(c.pixels(), 150.0);
}

TEST_F(MirrorActivityTest, MirrorMovesDoNotFanOut) {
    const auto mirror = mirror_on_c();

    mirror->move_to(30.0);

    EXPECT_EQ(a.pixels(), 0.0);
    EXPECT_EQ(b.pixels(), 0.0);
    EXPECT_EQ(group.counters().fan_outs, 0u);
}
