#pragma once

#include <scroll_host/scroll_activity.hpp>
#include <cstddef>
#include <vector>

namespace linked_scroll {

class LinkedScrollPosition;

// Activity of a position that is moved by one or more peer positions (its
// drivers). It has no motion of its own: drivers push offsets through
// move_to/jump_to, which apply them without fanning out again.
class MirrorActivity final : public scroll_host::ScrollActivity {
public:
    explicit MirrorActivity(LinkedScrollPosition& delegate);

    const char* name() const override { return "mirror"; }
    bool is_scrolling() const override { return true; }
    bool should_ignore_pointer() const override { return true; }
    double velocity() const override { return 0.0; }

    void link(LinkedScrollPosition& driver);
    // Drops the driver. Without drivers left, the owner goes idle.
    void unlink(LinkedScrollPosition& driver);

    void move_to(double new_pixels);
    void jump_to(double new_pixels);

    std::size_t driver_count() const { return drivers_.size(); }
    bool is_driven_by(const LinkedScrollPosition& driver) const;

protected:
    void on_dispose() override;

private:
    LinkedScrollPosition* owner() const;
    void update_user_scroll_direction();

    // Back-references only; a driver removes itself before it goes away.
    std::vector<LinkedScrollPosition*> drivers_;
};

} // namespace linked_scroll
