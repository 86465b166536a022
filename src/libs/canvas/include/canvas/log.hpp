#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace canvas {

// File logger writing logs/story_canvas_latest.log under the project root.
// Falls back to the spdlog default logger if the file cannot be opened.
std::shared_ptr<spdlog::logger> canvas_logger();

} // namespace canvas
