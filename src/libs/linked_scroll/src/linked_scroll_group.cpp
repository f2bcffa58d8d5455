#include <linked_scroll/linked_scroll_group.hpp>
#include <linked_scroll/linked_scroll_position.hpp>
#include <linked_scroll/mirror_activity.hpp>
#include <scroll_host/check.hpp>
#include <scroll_host/log.hpp>
#include <algorithm>

namespace linked_scroll {

LinkedScrollGroup::LinkedScrollGroup(scroll_model::ScrollExtent extent,
    std::shared_ptr<const scroll_host::SimulationFactory> simulations)
    : extent_(extent), simulations_(std::move(simulations))
{
    LINKED_SCROLL_CHECK(extent_.is_valid(), "group extent must have min <= max and a non-negative viewport");
}

LinkedScrollGroup::~LinkedScrollGroup() {
    // Break every driver/mirror relation before any position is destroyed.
    for (auto& position : positions_)
        position->teardown();
    positions_.clear();
}

LinkedScrollPosition& LinkedScrollGroup::create_position() {
    const auto attached = attached_positions();
    const double initial_pixels = attached.empty() ? 0.0 : attached.front()->pixels();

    auto position = std::make_unique<LinkedScrollPosition>(LinkedScrollPosition::ConstructionKey(), *this,
        initial_pixels, extent_);
    position->set_simulation_factory(simulations_);
    positions_.push_back(std::move(position));

    scroll_host::scroll_logger()->debug("position_created position={} initial_pixels={} members={}",
        static_cast<const void*>(positions_.back().get()), initial_pixels, positions_.size());
    return *positions_.back();
}

void LinkedScrollGroup::remove_position(LinkedScrollPosition& position) {
    LINKED_SCROLL_CHECK(&position.owner() == this, "remove_position called with a position of another group");
    auto member = [&position](const std::unique_ptr<LinkedScrollPosition>& p) { return p.get() == &position; };
    LINKED_SCROLL_CHECK(std::any_of(positions_.begin(), positions_.end(), member),
        "remove_position called for a position that is not a member");

    position.teardown();

    // Teardown can run hold callbacks; look the member up again.
    const auto it = std::find_if(positions_.begin(), positions_.end(), member);
    if (it == positions_.end()) return;
    positions_.erase(it);
    scroll_host::scroll_logger()->debug("position_removed position={} members={}",
        static_cast<const void*>(&position), positions_.size());
}

std::vector<LinkedScrollPosition*> LinkedScrollGroup::live_peers(const LinkedScrollPosition& excluding) const {
    std::vector<LinkedScrollPosition*> out;
    for (const auto& position : positions_) {
        if (position.get() != &excluding && position->attached())
            out.push_back(position.get());
    }
    return out;
}

std::vector<LinkedScrollPosition*> LinkedScrollGroup::attached_positions() const {
    std::vector<LinkedScrollPosition*> out;
    for (const auto& position : positions_) {
        if (position->attached()) out.push_back(position.get());
    }
    return out;
}

bool LinkedScrollGroup::is_live(const LinkedScrollPosition* position) const {
    return std::any_of(positions_.begin(), positions_.end(),
        [position](const std::unique_ptr<LinkedScrollPosition>& p) {
            return p.get() == position && p->attached();
        });
}

std::size_t LinkedScrollGroup::attached_count() const {
    return static_cast<std::size_t>(std::count_if(positions_.begin(), positions_.end(),
        [](const std::unique_ptr<LinkedScrollPosition>& p) { return p->attached(); }));
}

bool LinkedScrollGroup::can_link_with_peers(const LinkedScrollPosition& position) const {
    return !live_peers(position).empty();
}

std::vector<std::shared_ptr<MirrorActivity>> LinkedScrollGroup::link_with_peers(LinkedScrollPosition& driver) {
    const auto peers = live_peers(driver);
    LINKED_SCROLL_CHECK(!peers.empty(), "link_with_peers called without live peers");
    ++counters_.fan_outs;

    std::vector<std::shared_ptr<MirrorActivity>> activities;
    activities.reserve(peers.size());
    for (auto* peer : peers) {
        // Linking an earlier peer can run callbacks that detach or remove a later one.
        if (!is_live(peer)) continue;
        activities.push_back(peer->link(driver));
    }
    scroll_host::scroll_logger()->trace("fan_out driver={} peers={}",
        static_cast<const void*>(&driver), activities.size());
    return activities;
}

std::vector<std::shared_ptr<MirrorActivity>> LinkedScrollGroup::mirrors_driven_by(
    const LinkedScrollPosition& driver) const
{
    std::vector<std::shared_ptr<MirrorActivity>> out;
    for (const auto& position : positions_) {
        if (position.get() == &driver) continue;
        auto mirror = std::dynamic_pointer_cast<MirrorActivity>(position->current_activity());
        if (mirror && mirror->is_driven_by(driver)) out.push_back(std::move(mirror));
    }
    return out;
}

void LinkedScrollGroup::reset_scroll() {
    const auto positions = attached_positions();
    for (auto* position : positions) {
        if (!is_live(position)) continue;
        position->go_idle();
        position->update_user_scroll_direction(scroll_model::ScrollDirection::Idle);
        position->force_pixels_internal(0.0);
    }
    scroll_host::scroll_logger()->info("reset_scroll positions={}", positions.size());
    if (!positions.empty()) notify_offset_changed(0.0);
}

double LinkedScrollGroup::offset() const {
    const auto attached = attached_positions();
    return attached.empty() ? 0.0 : attached.front()->pixels();
}

void LinkedScrollGroup::jump_to(double value) {
    const auto attached = attached_positions();
    if (attached.empty()) return;
    attached.front()->jump_to(value);
}

void LinkedScrollGroup::animate_to(double value, float duration) {
    const auto attached = attached_positions();
    if (attached.empty()) return;
    attached.front()->animate_to(value, duration);
}

void LinkedScrollGroup::tick(float dt) {
    for (auto* position : attached_positions()) {
        if (is_live(position)) position->tick(dt);
    }
}

bool LinkedScrollGroup::is_idle() const {
    return std::none_of(positions_.begin(), positions_.end(),
        [](const std::unique_ptr<LinkedScrollPosition>& p) {
            return p->attached() && p->activity() && p->activity()->is_scrolling();
        });
}

LinkedScrollGroup::ListenerId LinkedScrollGroup::add_offset_changed_listener(OffsetListener listener) {
    const ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void LinkedScrollGroup::remove_offset_changed_listener(ListenerId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
        [id](const auto& entry) { return entry.first == id; }), listeners_.end());
}

void LinkedScrollGroup::notify_offset_changed(double offset) {
    const auto listeners = listeners_;
    for (const auto& entry : listeners) {
        if (entry.second) entry.second(offset);
    }
}

} // namespace linked_scroll
