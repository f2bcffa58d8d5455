#include <scroll_loaders/default_viewer_config.hpp>

namespace scroll_loaders {

scroll_model::ViewerConfig default_viewer_config() {
    scroll_model::ViewerConfig out;
    out.name = "Linked views (built-in)";
    out.log_level = "info";

    auto pane = [](const char* id, const char* label, int row_count, double row_height) {
        return scroll_model::PaneConfig{ id, label, row_count, row_height };
    };
    out.panes.push_back(pane("timeline", "Timeline", 400, 24.0));
    out.panes.push_back(pane("tracks", "Tracks", 400, 24.0));
    out.panes.push_back(pane("notes", "Notes", 250, 24.0));

    out.fling.linear_damping = 2.0;
    out.fling.min_fling_velocity = 50.0;
    out.fling.stop_velocity = 5.0;
    return out;
}

} // namespace scroll_loaders
