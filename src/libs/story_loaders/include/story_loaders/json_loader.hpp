#pragma once

#include <story_model/types.hpp>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace story_loaders {

std::optional<story_model::CanvasSnapshot> load_canvas_from_json(std::istream& in);
std::optional<story_model::CanvasSnapshot> load_canvas_from_json_file(const std::string& path);

bool save_canvas_to_json(const story_model::CanvasSnapshot& canvas, std::ostream& out);
bool save_canvas_to_json_file(const story_model::CanvasSnapshot& canvas, const std::string& path);

} // namespace story_loaders
