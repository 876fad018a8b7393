#pragma once

#include <string>
#include <vector>

namespace vaultbreakdown::domain {

    /**
     * @enum CanvasNodeKind
     * @brief Tier of a node in the breakdown canvas.
     */
    enum class CanvasNodeKind {
        SOURCE,     ///< The original clipped article.
        SUMMARY,    ///< 00-Summary.md.
        SECTION,    ///< Top-level section note.
        SUBSECTION, ///< Second-level note under a section.
        SPECIAL     ///< Parentless note stacked beside the tree.
    };

    /**
     * @enum CanvasColor
     * @brief Visual discriminator per tier. Not semantic.
     */
    enum class CanvasColor {
        PURPLE,
        GREEN,
        YELLOW,
        CYAN,
        ORANGE
    };

    /**
     * @enum CanvasSide
     * @brief Anchor side of an edge endpoint.
     */
    enum class CanvasSide {
        TOP,
        BOTTOM,
        LEFT,
        RIGHT
    };

    /**
     * @struct CanvasNode
     * @brief A positioned file card. (x, y) is the top-left corner.
     */
    struct CanvasNode {
        std::string id;    ///< Fresh unique id per layout.
        int x = 0;
        int y = 0;
        int width = 0;
        int height = 0;
        CanvasNodeKind kind = CanvasNodeKind::SECTION;
        std::string file;  ///< Vault-relative document path.
        CanvasColor color = CanvasColor::YELLOW;
    };

    /**
     * @struct CanvasEdge
     * @brief Directed connection between two nodes.
     */
    struct CanvasEdge {
        std::string id;
        std::string fromNode;
        CanvasSide fromSide = CanvasSide::BOTTOM;
        std::string toNode;
        CanvasSide toSide = CanvasSide::TOP;
    };

    /**
     * @struct CanvasGraph
     * @brief Full node/edge description of a breakdown.
     */
    struct CanvasGraph {
        std::vector<CanvasNode> nodes;
        std::vector<CanvasEdge> edges;
    };

    inline CanvasColor ColorForKind(CanvasNodeKind kind) {
        switch (kind) {
            case CanvasNodeKind::SOURCE: return CanvasColor::PURPLE;
            case CanvasNodeKind::SUMMARY: return CanvasColor::GREEN;
            case CanvasNodeKind::SECTION: return CanvasColor::YELLOW;
            case CanvasNodeKind::SUBSECTION: return CanvasColor::CYAN;
            case CanvasNodeKind::SPECIAL: return CanvasColor::ORANGE;
        }
        return CanvasColor::YELLOW;
    }

} // namespace vaultbreakdown::domain
