#pragma once

#include <scroll_host/scroll_simulation.hpp>
#include <scroll_model/types.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace linked_scroll {

class LinkedScrollPosition;
class MirrorActivity;

// Sets up a collection of scroll positions that mirror their movements to
// each other.
//
// Positions are created with create_position() and must be handed back with
// remove_position() when their view is torn down. A new position starts at
// the offset of the first attached position.
//
// The host must give every view instance its own position. Reusing a
// position for a different view after it was removed desynchronizes the
// offsets, and nothing here can detect that.
class LinkedScrollGroup {
public:
    using OffsetListener = std::function<void(double offset)>;
    using ListenerId = std::size_t;

    struct Counters {
        std::size_t fan_outs = 0;
        std::size_t mirrors_created = 0;
    };

    explicit LinkedScrollGroup(scroll_model::ScrollExtent extent = {},
        std::shared_ptr<const scroll_host::SimulationFactory> simulations = nullptr);
    ~LinkedScrollGroup();

    LinkedScrollGroup(const LinkedScrollGroup&) = delete;
    LinkedScrollGroup& operator=(const LinkedScrollGroup&) = delete;

    LinkedScrollPosition& create_position();
    void remove_position(LinkedScrollPosition& position);

    // Attached members other than `excluding`, in membership order.
    // Computed on every call.
    std::vector<LinkedScrollPosition*> live_peers(const LinkedScrollPosition& excluding) const;
    std::vector<LinkedScrollPosition*> attached_positions() const;
    bool is_live(const LinkedScrollPosition* position) const;

    // Jumps every attached position to 0 individually, without mirroring.
    void reset_scroll();

    double offset() const;
    void jump_to(double value);
    void animate_to(double value, float duration);
    void tick(float dt);
    bool is_idle() const;

    ListenerId add_offset_changed_listener(OffsetListener listener);
    void remove_offset_changed_listener(ListenerId id);

    const Counters& counters() const { return counters_; }
    std::size_t size() const { return positions_.size(); }
    std::size_t attached_count() const;

private:
    friend class LinkedScrollPosition;
    friend class MirrorActivity;

    bool can_link_with_peers(const LinkedScrollPosition& position) const;
    std::vector<std::shared_ptr<MirrorActivity>> link_with_peers(LinkedScrollPosition& driver);
    // Current mirror activities of other members that list `driver` as a driver.
    std::vector<std::shared_ptr<MirrorActivity>> mirrors_driven_by(const LinkedScrollPosition& driver) const;
    void notify_offset_changed(double offset);
    void record_mirror_created() { ++counters_.mirrors_created; }

    scroll_model::ScrollExtent extent_;
    std::shared_ptr<const scroll_host::SimulationFactory> simulations_;
    std::vector<std::unique_ptr<LinkedScrollPosition>> positions_;
    std::vector<std::pair<ListenerId, OffsetListener>> listeners_;
    ListenerId next_listener_id_ = 1;
    Counters counters_;
};

} // namespace linked_scroll
