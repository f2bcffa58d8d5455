#pragma once

#include <scroll_model/viewer_config.hpp>

namespace scroll_loaders {

// Three panes with different row counts, used when no config file is found.
scroll_model::ViewerConfig default_viewer_config();

} // namespace scroll_loaders
