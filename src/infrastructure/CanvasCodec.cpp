#include "infrastructure/CanvasCodec.hpp"
#include <nlohmann/json.hpp>

namespace vaultbreakdown::infrastructure {

using domain::CanvasColor;
using domain::CanvasSide;

std::string CanvasCodec::ColorCode(CanvasColor color) {
    switch (color) {
        case CanvasColor::PURPLE: return "6";
        case CanvasColor::GREEN: return "4";
        case CanvasColor::YELLOW: return "3";
        case CanvasColor::CYAN: return "5";
        case CanvasColor::ORANGE: return "2";
    }
    return "3";
}

std::string CanvasCodec::SideName(CanvasSide side) {
    switch (side) {
        case CanvasSide::TOP: return "top";
        case CanvasSide::BOTTOM: return "bottom";
        case CanvasSide::LEFT: return "left";
        case CanvasSide::RIGHT: return "right";
    }
    return "bottom";
}

std::string CanvasCodec::Encode(const domain::CanvasGraph& graph) {
    nlohmann::ordered_json j;
    j["nodes"] = nlohmann::ordered_json::array();
    j["edges"] = nlohmann::ordered_json::array();

    for (const auto& node : graph.nodes) {
        nlohmann::ordered_json n;
        n["id"] = node.id;
        n["x"] = node.x;
        n["y"] = node.y;
        n["width"] = node.width;
        n["height"] = node.height;
        n["type"] = "file";
        n["file"] = node.file;
        n["color"] = ColorCode(node.color);
        j["nodes"].push_back(n);
    }

    for (const auto& edge : graph.edges) {
        nlohmann::ordered_json e;
        e["id"] = edge.id;
        e["fromNode"] = edge.fromNode;
        e["fromSide"] = SideName(edge.fromSide);
        e["toNode"] = edge.toNode;
        e["toSide"] = SideName(edge.toSide);
        j["edges"].push_back(e);
    }

    return j.dump(2);
}

} // namespace vaultbreakdown::infrastructure
