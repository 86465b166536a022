#include <story_model/types.hpp>

namespace story_model {

const char* to_string(NodeType type) {
    switch (type) {
    case NodeType::Spine: return "SPINE";
    case NodeType::Satellite: return "SATELLITE";
    case NodeType::Container: return "CONTAINER";
    }
    return "SPINE";
}

const char* to_string(AnchorType anchor) {
    switch (anchor) {
    case AnchorType::Origin: return "ORIGIN";
    case AnchorType::Append: return "APPEND";
    case AnchorType::Prepend: return "PREPEND";
    case AnchorType::Top: return "TOP";
    }
    return "APPEND";
}

std::optional<NodeType> node_type_from_string(std::string_view s) {
    if (s == "SPINE") return NodeType::Spine;
    if (s == "SATELLITE") return NodeType::Satellite;
    if (s == "CONTAINER") return NodeType::Container;
    return std::nullopt;
}

std::optional<AnchorType> anchor_type_from_string(std::string_view s) {
    if (s == "ORIGIN") return AnchorType::Origin;
    if (s == "APPEND") return AnchorType::Append;
    if (s == "PREPEND") return AnchorType::Prepend;
    if (s == "TOP") return AnchorType::Top;
    return std::nullopt;
}

} // namespace story_model
