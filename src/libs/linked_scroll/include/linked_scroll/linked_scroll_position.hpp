#pragma once

#include <scroll_host/scroll_position.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace linked_scroll {

class LinkedScrollGroup;
class MirrorActivity;

// A scroll position that mirrors its movements to the other attached
// positions of its group.
//
// set_pixels/force_pixels on a position make it a driver: every live peer is
// given a MirrorActivity linked to this position, and the new offset is pushed
// through those activities. The peers apply it through the *_internal paths,
// which never fan out. Beginning any new activity stops this position from
// driving the peers it was driving.
class LinkedScrollPosition : public scroll_host::ScrollPosition {
public:
    // Only LinkedScrollGroup can make one; positions are created through the group.
    class ConstructionKey {
        friend class LinkedScrollGroup;
        ConstructionKey() {}
    };

    LinkedScrollPosition(ConstructionKey, LinkedScrollGroup& owner, double initial_pixels,
        scroll_model::ScrollExtent extent);
    ~LinkedScrollPosition() override;

    LinkedScrollGroup& owner() const { return owner_; }

    // Adopts the offset of the first live peer, clamped to this position's
    // extent, so a re-attached view rejoins in sync.
    void attach() override;
    void detach() override;

    void begin_activity(std::shared_ptr<scroll_host::ScrollActivity> activity) override;
    double set_pixels(double new_pixels) override;
    void force_pixels(double value) override;
    // Holds every live peer silently before holding this position.
    scroll_host::HoldHandle hold(std::function<void()> on_cancel) override;

    double set_pixels_internal(double new_pixels);
    void force_pixels_internal(double value);
    void hold_internal();

    std::shared_ptr<MirrorActivity> link(LinkedScrollPosition& driver);
    void unlink(const MirrorActivity& activity);

    std::size_t peer_activity_count() const;
    std::string describe() const;

private:
    friend class LinkedScrollGroup;

    void add_peer_activities(const std::vector<std::shared_ptr<MirrorActivity>>& activities);
    std::vector<std::shared_ptr<MirrorActivity>> live_peer_activities() const;
    void stop_driving_peers();
    void teardown();

    LinkedScrollGroup& owner_;
    std::vector<std::weak_ptr<MirrorActivity>> peer_activities_;
};

} // namespace linked_scroll
