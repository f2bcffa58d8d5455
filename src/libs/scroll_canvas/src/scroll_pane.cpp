#include <scroll_canvas/scroll_pane.hpp>
#include <scroll_host/log.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace {

const float drag_slop = 3.0f;
const float wheel_rows = 3.0f;
const float wheel_duration = 0.18f;
const float thumb_width = 6.0f;
const float min_thumb_height = 18.0f;
// Weight of the newest sample in the drag velocity estimate.
const double velocity_smoothing = 0.3;

} // namespace

namespace scroll_canvas {

ScrollPane::ScrollPane(linked_scroll::LinkedScrollPosition& position, scroll_model::PaneConfig config)
    : position_(position), config_(std::move(config))
{
}

ScrollPane::~ScrollPane() {
    hold_.release();
    drag_.cancel();
}

void ScrollPane::set_enabled(bool enabled) {
    if (enabled == position_.attached()) return;
    if (enabled) {
        position_.attach();
    } else {
        release_pointer();
        position_.detach();
    }
    scroll_host::scroll_logger()->info("pane_{} id={} offset={}",
        enabled ? "attached" : "detached", config_.id, position_.pixels());
}

void ScrollPane::update_extent(float region_height) {
    const double content = static_cast<double>(config_.row_count) * config_.row_height;
    const double viewport = static_cast<double>(region_height);
    scroll_model::ScrollExtent extent;
    extent.min = 0.0;
    extent.max = std::max(0.0, content - viewport);
    extent.viewport = viewport;
    position_.set_extent(extent);
}

void ScrollPane::release_pointer() {
    pressed_ = false;
    drag_velocity_ = 0.0;
    hold_.release();
    drag_.cancel();
}

void ScrollPane::handle_input(float region_width, float region_height) {
    if (!position_.attached()) return;

    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;

    if (ImGui::IsMouseClicked(0) && in_region) {
        hold_ = position_.hold([this]() { pressed_ = false; });
        pressed_ = true;
        press_y_ = mouse.y;
        last_mouse_y_ = mouse.y;
        drag_velocity_ = 0.0;
    }

    if (pressed_ && ImGui::IsMouseDown(0)) {
        const float dy = mouse.y - last_mouse_y_;
        if (!drag_.active() && std::abs(mouse.y - press_y_) > drag_slop) {
            hold_.release();
            drag_ = position_.drag();
        }
        if (drag_.active() && dy != 0.0f)
            drag_.update(dy, io.DeltaTime);
        if (io.DeltaTime > 0.0f) {
            const double sample = -static_cast<double>(dy) / static_cast<double>(io.DeltaTime);
            drag_velocity_ = sample * velocity_smoothing + drag_velocity_ * (1.0 - velocity_smoothing);
        }
        last_mouse_y_ = mouse.y;
    }

    if (ImGui::IsMouseReleased(0) && pressed_) {
        pressed_ = false;
        if (drag_.active()) {
            drag_.end(drag_velocity_);
        } else {
            hold_.cancel();
        }
        drag_velocity_ = 0.0;
    }

    if (in_region && !pressed_ && io.MouseWheel != 0.0f) {
        const double step = static_cast<double>(io.MouseWheel * wheel_rows) * config_.row_height;
        position_.animate_to(position_.pixels() - step, wheel_duration);
    }
}

bool ScrollPane::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    update_extent(region_height);
    handle_input(region_width, region_height);

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_list->PushClipRect(region_min, region_max, true);
    draw_rows(region_min, region_max);
    draw_scroll_thumb(region_min, region_max);
    draw_list->PopClipRect();
    return true;
}

void ScrollPane::draw_rows(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl || config_.row_count <= 0) return;

    const unsigned int even_fill = IM_COL32(38, 38, 42, 255);
    const unsigned int odd_fill = IM_COL32(45, 45, 50, 255);
    const unsigned int text_color = enabled() ? IM_COL32(220, 220, 220, 255) : IM_COL32(120, 120, 120, 255);

    const double row_height = config_.row_height;
    const double offset = position_.pixels();
    const double height = static_cast<double>(region_max.y - region_min.y);
    const int first = std::max(0, static_cast<int>(std::floor(offset / row_height)));
    const int last = std::min(config_.row_count - 1, static_cast<int>(std::ceil((offset + height) / row_height)));

    char label[128];
    for (int row = first; row <= last; ++row) {
        const float y = region_min.y + static_cast<float>(row * row_height - offset);
        const float h = static_cast<float>(row_height);
        dl->AddRectFilled(ImVec2(region_min.x, y), ImVec2(region_max.x, y + h), (row % 2) ? odd_fill : even_fill);
        (void)std::snprintf(label, sizeof(label), "%s %d", config_.label.c_str(), row);
        const ImVec2 text_size = ImGui::CalcTextSize(label);
        dl->AddText(ImVec2(region_min.x + 8.0f, y + (h - text_size.y) * 0.5f), text_color, label);
    }
}

void ScrollPane::draw_scroll_thumb(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const auto& extent = position_.extent();
    const double content = extent.max + extent.viewport;
    if (content <= 0.0 || extent.max <= 0.0) return;

    const float track = region_max.y - region_min.y;
    const float thumb_h = std::max(min_thumb_height, static_cast<float>(extent.viewport / content) * track);
    const float t = static_cast<float>(std::clamp(position_.pixels() / extent.max, 0.0, 1.0));
    const float y = region_min.y + (track - thumb_h) * t;
    const unsigned int thumb_color = position_.activity() && position_.activity()->is_scrolling()
        ? IM_COL32(150, 150, 160, 255) : IM_COL32(90, 90, 100, 255);
    dl->AddRectFilled(ImVec2(region_max.x - thumb_width - 2.0f, y), ImVec2(region_max.x - 2.0f, y + thumb_h),
        thumb_color, 3.0f);
}

} // namespace scroll_canvas
