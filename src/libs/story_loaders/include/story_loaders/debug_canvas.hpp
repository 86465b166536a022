#pragma once

#include <story_model/types.hpp>

namespace story_loaders {

// Small built-in story used when no canvas file is available.
story_model::CanvasSnapshot generate_debug_canvas();

} // namespace story_loaders
