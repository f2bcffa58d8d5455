#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace scroll_host {

// Logger shared by the scroll libraries, registered as "linked_scroll".
// Falls back to the default spdlog logger when it cannot be created.
std::shared_ptr<spdlog::logger> scroll_logger();

// Replaces the logger returned by scroll_logger(), e.g. with a file logger.
void install_scroll_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace scroll_host
