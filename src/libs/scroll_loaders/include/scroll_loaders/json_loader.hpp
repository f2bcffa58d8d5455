#pragma once

#include <scroll_model/viewer_config.hpp>
#include <optional>
#include <istream>
#include <string>

namespace scroll_loaders {

std::optional<scroll_model::ViewerConfig> load_viewer_config_from_json(std::istream& in);
std::optional<scroll_model::ViewerConfig> load_viewer_config_from_json_file(const std::string& path);

} // namespace scroll_loaders
