#include <linked_scroll/linked_scroll_group.hpp>
#include <linked_scroll/linked_scroll_position.hpp>
#include <linked_scroll/mirror_activity.hpp>
#include <scroll_host/check.hpp>
#include <scroll_host/log.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace linked_scroll {

LinkedScrollPosition::LinkedScrollPosition(ConstructionKey, LinkedScrollGroup& owner, double initial_pixels,
    scroll_model::ScrollExtent extent)
    : ScrollPosition(initial_pixels, extent), owner_(owner)
{
}

LinkedScrollPosition::~LinkedScrollPosition() {
    stop_driving_peers();
}

void LinkedScrollPosition::attach() {
    if (attached()) return;
    const auto peers = owner_.live_peers(*this);
    ScrollPosition::attach();
    if (!peers.empty())
        force_pixels_internal(extent().clamp(peers.front()->pixels()));
}

void LinkedScrollPosition::detach() {
    if (!attached()) return;
    go_idle();
    ScrollPosition::detach();
}

void LinkedScrollPosition::begin_activity(std::shared_ptr<scroll_host::ScrollActivity> activity) {
    if (!activity) return;
    stop_driving_peers();
    scroll_host::scroll_logger()->trace("begin_activity position={} activity={}",
        static_cast<const void*>(this), activity->name());
    ScrollPosition::begin_activity(std::move(activity));
}

double LinkedScrollPosition::set_pixels(double new_pixels) {
    LINKED_SCROLL_CHECK(attached(), "set_pixels on a linked position with no attached view");
    if (new_pixels == pixels()) return 0.0;
    update_user_scroll_direction(scroll_model::direction_between(pixels(), new_pixels));

    if (owner_.can_link_with_peers(*this)) {
        add_peer_activities(owner_.link_with_peers(*this));
        for (const auto& activity : live_peer_activities())
            activity->move_to(new_pixels);
    }

    const double overscroll = set_pixels_internal(new_pixels);
    owner_.notify_offset_changed(pixels());
    return overscroll;
}

double LinkedScrollPosition::set_pixels_internal(double new_pixels) {
    return ScrollPosition::set_pixels(new_pixels);
}

void LinkedScrollPosition::force_pixels(double value) {
    LINKED_SCROLL_CHECK(attached(), "force_pixels on a linked position with no attached view");
    if (value == pixels()) return;
    update_user_scroll_direction(scroll_model::direction_between(pixels(), value));

    if (owner_.can_link_with_peers(*this)) {
        add_peer_activities(owner_.link_with_peers(*this));
        for (const auto& activity : live_peer_activities())
            activity->jump_to(value);
    }

    force_pixels_internal(value);
    owner_.notify_offset_changed(pixels());
}

void LinkedScrollPosition::force_pixels_internal(double value) {
    ScrollPosition::force_pixels(value);
}

scroll_host::HoldHandle LinkedScrollPosition::hold(std::function<void()> on_cancel) {
    for (auto* peer : owner_.live_peers(*this)) {
        if (owner_.is_live(peer)) peer->hold_internal();
    }
    return ScrollPosition::hold(std::move(on_cancel));
}

void LinkedScrollPosition::hold_internal() {
    // TODO: peers get a hold without a cancel callback; give them their own
    // callback if a peer ever needs to react to losing its hold.
    ScrollPosition::hold(nullptr);
}

std::shared_ptr<MirrorActivity> LinkedScrollPosition::link(LinkedScrollPosition& driver) {
    auto mirror = std::dynamic_pointer_cast<MirrorActivity>(current_activity());
    if (!mirror) {
        mirror = std::make_shared<MirrorActivity>(*this);
        begin_activity(mirror);
    }
    mirror->link(driver);
    // Record the reverse edge so the driver releases this mirror before it goes away.
    driver.add_peer_activities({ mirror });
    return mirror;
}

void LinkedScrollPosition::unlink(const MirrorActivity& activity) {
    peer_activities_.erase(std::remove_if(peer_activities_.begin(), peer_activities_.end(),
        [&activity](const std::weak_ptr<MirrorActivity>& entry) {
            const auto locked = entry.lock();
            return !locked || locked.get() == &activity;
        }), peer_activities_.end());
}

void LinkedScrollPosition::add_peer_activities(const std::vector<std::shared_ptr<MirrorActivity>>& activities) {
    for (const auto& activity : activities) {
        if (!activity || activity->disposed()) continue;
        const bool known = std::any_of(peer_activities_.begin(), peer_activities_.end(),
            [&activity](const std::weak_ptr<MirrorActivity>& entry) { return entry.lock() == activity; });
        if (!known) peer_activities_.push_back(activity);
    }
}

std::vector<std::shared_ptr<MirrorActivity>> LinkedScrollPosition::live_peer_activities() const {
    std::vector<std::shared_ptr<MirrorActivity>> out;
    out.reserve(peer_activities_.size());
    for (const auto& entry : peer_activities_) {
        auto activity = entry.lock();
        if (activity && !activity->disposed()) out.push_back(std::move(activity));
    }
    return out;
}

std::size_t LinkedScrollPosition::peer_activity_count() const {
    return live_peer_activities().size();
}

void LinkedScrollPosition::stop_driving_peers() {
    // Unlinking can make peers go idle and call back into unlink(); work on a copy.
    auto stale = std::move(peer_activities_);
    peer_activities_.clear();
    for (const auto& entry : stale) {
        if (auto activity = entry.lock())
            activity->unlink(*this);
    }
}

void LinkedScrollPosition::teardown() {
    stop_driving_peers();
    // Mirrors linked directly through MirrorActivity::link are not in peer_activities_.
    for (const auto& mirror : owner_.mirrors_driven_by(*this))
        mirror->unlink(*this);
    go_idle();
    ScrollPosition::detach();
}

std::string LinkedScrollPosition::describe() const {
    return fmt::format("LinkedScrollPosition(offset: {:.1f}, direction: {}, activity: {}, attached: {}, "
        "peer_activities: {}, owner: {})",
        pixels(), scroll_model::to_string(user_scroll_direction()),
        activity() ? activity()->name() : "none", attached(), peer_activity_count(),
        static_cast<const void*>(&owner_));
}

} // namespace linked_scroll
