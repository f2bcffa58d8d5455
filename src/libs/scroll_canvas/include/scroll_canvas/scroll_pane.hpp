#pragma once

#include <linked_scroll/linked_scroll_position.hpp>
#include <scroll_host/scroll_activity.hpp>
#include <scroll_model/viewer_config.hpp>

struct ImVec2;

namespace scroll_canvas {

// One scrollable column of rows drawn with ImGui, bound to a linked position.
// Pointer press holds the position, moving past the slop turns the hold into
// a drag, release flings. The wheel animates by a few rows.
class ScrollPane {
public:
    ScrollPane(linked_scroll::LinkedScrollPosition& position, scroll_model::PaneConfig config);
    ~ScrollPane();

    ScrollPane(const ScrollPane&) = delete;
    ScrollPane& operator=(const ScrollPane&) = delete;

    const scroll_model::PaneConfig& config() const { return config_; }
    linked_scroll::LinkedScrollPosition& position() const { return position_; }

    bool enabled() const { return position_.attached(); }
    void set_enabled(bool enabled);

    bool update_and_draw(float region_width, float region_height);

private:
    void update_extent(float region_height);
    void handle_input(float region_width, float region_height);
    void release_pointer();
    void draw_rows(ImVec2 region_min, ImVec2 region_max);
    void draw_scroll_thumb(ImVec2 region_min, ImVec2 region_max);

    linked_scroll::LinkedScrollPosition& position_;
    scroll_model::PaneConfig config_;
    scroll_host::HoldHandle hold_;
    scroll_host::DragHandle drag_;
    bool pressed_ = false;
    float press_y_ = 0;
    float last_mouse_y_ = 0;
    double drag_velocity_ = 0.0;
};

} // namespace scroll_canvas
