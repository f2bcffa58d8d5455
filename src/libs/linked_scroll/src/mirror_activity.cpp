#include <linked_scroll/linked_scroll_group.hpp>
#include <linked_scroll/linked_scroll_position.hpp>
#include <linked_scroll/mirror_activity.hpp>
#include <scroll_host/check.hpp>
#include <scroll_host/log.hpp>
#include <algorithm>

namespace linked_scroll {

MirrorActivity::MirrorActivity(LinkedScrollPosition& delegate)
    : ScrollActivity(delegate)
{
    delegate.owner().record_mirror_created();
}

LinkedScrollPosition* MirrorActivity::owner() const {
    return static_cast<LinkedScrollPosition*>(delegate());
}

bool MirrorActivity::is_driven_by(const LinkedScrollPosition& driver) const {
    return std::find(drivers_.begin(), drivers_.end(), &driver) != drivers_.end();
}

void MirrorActivity::link(LinkedScrollPosition& driver) {
    if (disposed() || is_driven_by(driver)) return;
    drivers_.push_back(&driver);
    scroll_host::scroll_logger()->debug("mirror_linked owner={} driver={} drivers={}",
        static_cast<const void*>(owner()), static_cast<const void*>(&driver), drivers_.size());
}

void MirrorActivity::unlink(LinkedScrollPosition& driver) {
    const auto it = std::find(drivers_.begin(), drivers_.end(), &driver);
    if (it == drivers_.end()) return;
    drivers_.erase(it);
    scroll_host::scroll_logger()->debug("mirror_unlinked owner={} driver={} drivers={}",
        static_cast<const void*>(owner()), static_cast<const void*>(&driver), drivers_.size());
    if (drivers_.empty() && !disposed())
        owner()->go_idle();
}

void MirrorActivity::move_to(double new_pixels) {
    if (disposed()) return;
    update_user_scroll_direction();
    owner()->set_pixels_internal(new_pixels);
}

void MirrorActivity::jump_to(double new_pixels) {
    if (disposed()) return;
    update_user_scroll_direction();
    owner()->force_pixels_internal(new_pixels);
}

void MirrorActivity::update_user_scroll_direction() {
    LINKED_SCROLL_CHECK(!drivers_.empty(), "mirror direction requested without drivers");
    scroll_model::ScrollDirection common = drivers_.front()->user_scroll_direction();
    for (const auto* driver : drivers_) {
        if (driver->user_scroll_direction() != common) {
            common = scroll_model::ScrollDirection::Idle;
            break;
        }
    }
    owner()->update_user_scroll_direction(common);
}

void MirrorActivity::on_dispose() {
    auto drivers = std::move(drivers_);
    drivers_.clear();
    for (auto* driver : drivers)
        driver->unlink(*this);
}

} // namespace linked_scroll
