#pragma once

#include <algorithm>
#include <limits>

namespace scroll_model {

// Direction of the most recent user-visible offset change.
// Forward means the offset grew, Reverse means it shrank.
enum class ScrollDirection { Idle, Forward, Reverse };

inline const char* to_string(ScrollDirection direction) {
    switch (direction) {
    case ScrollDirection::Forward: return "forward";
    case ScrollDirection::Reverse: return "reverse";
    case ScrollDirection::Idle: break;
    }
    return "idle";
}

inline ScrollDirection direction_between(double from, double to) {
    if (to > from) return ScrollDirection::Forward;
    if (to < from) return ScrollDirection::Reverse;
    return ScrollDirection::Idle;
}

struct ScrollOffsetState {
    double pixels = 0.0;
    ScrollDirection user_direction = ScrollDirection::Idle;
};

// Range the clamping path keeps the offset in. Unbounded by default.
struct ScrollExtent {
    double min = -std::numeric_limits<double>::infinity();
    double max = std::numeric_limits<double>::infinity();
    double viewport = 0.0;

    bool is_valid() const { return min <= max && viewport >= 0.0; }
    bool contains(double value) const { return value >= min && value <= max; }
    double clamp(double value) const { return std::clamp(value, min, max); }
};

} // namespace scroll_model
