#include <story_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <utility>

namespace story_loaders {

namespace {

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<double> optional_number(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return std::nullopt;
}

// Integers outside the int range leave the lane unset.
std::optional<int> optional_lane(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        const auto lane = v.get<std::uint64_t>();
        if (lane > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(lane);
    }
    const auto lane = v.get<std::int64_t>();
    if (lane < std::numeric_limits<int>::min() || lane > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(lane);
}

std::optional<story_model::Node> parse_node(const nlohmann::json& n, const std::string& canvas_id) {
    story_model::Node node;
    if (!n.is_object() || !n.contains("id") || !n["id"].is_string()) return std::nullopt;
    node.id = n["id"].get<std::string>();
    node.canvas_id = string_or(n, "canvas_id", canvas_id);
    node.type = story_model::node_type_from_string(string_or(n, "type", ""))
                    .value_or(story_model::NodeType::Spine);
    node.asset_id = string_or(n, "asset_id", "");
    node.label = string_or(n, "label", "");
    node.parent_id = optional_string(n, "parent_id");
    // Unknown anchor strings leave the anchor unset: the node is then unreachable.
    if (auto anchor = optional_string(n, "anchor_type"))
        node.anchor_type = story_model::anchor_type_from_string(*anchor);
    // Support both "lane" (new) and "ui_track_lane" (legacy).
    if (n.contains("lane") && n["lane"].is_number_integer())
        node.lane = optional_lane(n["lane"]);
    else if (n.contains("ui_track_lane") && n["ui_track_lane"].is_number_integer())
        node.lane = optional_lane(n["ui_track_lane"]);
    node.drift = n.contains("drift") && n["drift"].is_number_integer() ? n["drift"].get<std::int64_t>() : 0;
    node.media_in_point = optional_number(n, "media_in_point");
    node.media_out_point = optional_number(n, "media_out_point");
    node.playback_rate = optional_number(n, "playback_rate").value_or(1.0);
    return node;
}

std::optional<story_model::CanvasSnapshot> parse_canvas_json(const nlohmann::json& j) {
    story_model::CanvasSnapshot out;
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array()) return std::nullopt;

    out.id = string_or(j, "id", "");
    out.name = string_or(j, "name", "");
    if (j.contains("fps") && j["fps"].is_number_integer()) out.fps = j["fps"].get<int>();

    for (const auto& n : j["nodes"]) {
        auto node = parse_node(n, out.id);
        if (!node) return std::nullopt;
        out.nodes.push_back(std::move(*node));
    }
    return out;
}

nlohmann::json node_to_json(const story_model::Node& n) {
    nlohmann::json j;
    j["id"] = n.id;
    j["canvas_id"] = n.canvas_id;
    j["type"] = story_model::to_string(n.type);
    j["asset_id"] = n.asset_id;
    j["label"] = n.label;
    j["parent_id"] = n.parent_id ? nlohmann::json(*n.parent_id) : nlohmann::json(nullptr);
    j["anchor_type"] = n.anchor_type ? nlohmann::json(story_model::to_string(*n.anchor_type))
                                     : nlohmann::json(nullptr);
    j["lane"] = n.lane ? nlohmann::json(*n.lane) : nlohmann::json(nullptr);
    j["drift"] = n.drift;
    j["media_in_point"] = n.media_in_point ? nlohmann::json(*n.media_in_point) : nlohmann::json(nullptr);
    j["media_out_point"] = n.media_out_point ? nlohmann::json(*n.media_out_point) : nlohmann::json(nullptr);
    j["playback_rate"] = n.playback_rate;
    return j;
}

} // namespace

std::optional<story_model::CanvasSnapshot> load_canvas_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_canvas_json(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<story_model::CanvasSnapshot> load_canvas_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_canvas_from_json(f);
}

bool save_canvas_to_json(const story_model::CanvasSnapshot& canvas, std::ostream& out) {
    nlohmann::json j;
    j["id"] = canvas.id;
    j["name"] = canvas.name;
    j["fps"] = canvas.fps;
    j["nodes"] = nlohmann::json::array();
    for (const auto& n : canvas.nodes)
        j["nodes"].push_back(node_to_json(n));
    out << j.dump(2) << '\n';
    return static_cast<bool>(out);
}

bool save_canvas_to_json_file(const story_model::CanvasSnapshot& canvas, const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;
    return save_canvas_to_json(canvas, f);
}

} // namespace story_loaders
