#include <gtest/gtest.h>
#include <animation/offset_animator.hpp>

using animation::OffsetAnimator;

TEST(OffsetAnimator, EasesOutTowardsTarget) {
    OffsetAnimator animator;
    animator.set_duration(1.0f);
    animator.start(0.0, 100.0);
    EXPECT_FALSE(animator.done());

    animator.tick(0.5f);

    // 1 - (1 - 0.5)^2
    EXPECT_DOUBLE_EQ(animator.current(), 75.0);
    EXPECT_FALSE(animator.done());
}

TEST(OffsetAnimator, FinishesOnTargetAfterDuration) {
    OffsetAnimator animator;
    animator.set_duration(0.5f);
    animator.start(20.0, -40.0);

    animator.tick(0.25f);
    animator.tick(0.5f);

    EXPECT_TRUE(animator.done());
    EXPECT_EQ(animator.current(), -40.0);
    EXPECT_EQ(animator.target(), -40.0);
}

TEST(OffsetAnimator, SnapsWhenCloseToTarget) {
    OffsetAnimator animator;
    animator.set_duration(1.0f);
    animator.start(0.0, 1.0);

    // 1 - 0.4^2 = 0.84 leaves less than half a pixel.
    animator.tick(0.6f);

    EXPECT_TRUE(animator.done());
    EXPECT_EQ(animator.current(), 1.0);
}

TEST(OffsetAnimator, IgnoresNonPositiveSteps) {
    OffsetAnimator animator;
    animator.set_duration(1.0f);
    animator.start(0.0, 100.0);

    animator.tick(0.0f);
    animator.tick(-1.0f);

    EXPECT_EQ(animator.current(), 0.0);
    EXPECT_FALSE(animator.done());
}

TEST(OffsetAnimator, StartingOnTargetIsDone) {
    OffsetAnimator animator;

    animator.start(30.0, 30.0);

    EXPECT_TRUE(animator.done());
    EXPECT_EQ(animator.current(), 30.0);
}

TEST(OffsetAnimator, UsesShortDefaultDuration) {
    OffsetAnimator animator;

    EXPECT_FLOAT_EQ(animator.duration(), 0.18f);
    EXPECT_TRUE(animator.done());
}
