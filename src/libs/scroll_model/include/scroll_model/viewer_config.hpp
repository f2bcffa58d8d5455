#pragma once

#include <string>
#include <vector>

namespace scroll_model {

struct PaneConfig {
    std::string id;
    std::string label;
    int row_count = 200;
    double row_height = 24.0;
};

struct FlingConfig {
    double linear_damping = 2.0;
    double min_fling_velocity = 50.0;
    double stop_velocity = 5.0;
};

struct ViewerConfig {
    std::string name;
    std::string log_level = "info";
    std::vector<PaneConfig> panes;
    FlingConfig fling;
};

} // namespace scroll_model
