/**
 * @file CanvasLayoutEngine.hpp
 * @brief Positions the breakdown notes as a tiered node/edge canvas.
 */

#pragma once

#include "domain/ArticleTree.hpp"
#include "domain/CanvasGraph.hpp"
#include "domain/OutputDocument.hpp"
#include <functional>
#include <string>

namespace vaultbreakdown::application {

/**
 * @class CanvasLayoutEngine
 * @brief Deterministic tier layout: source, summary, sections, subsections, specials.
 *
 * Rows: source at y=-600, summary at y=-300, sections at y=0, subsections at
 * y=300. Each row is centred on its parent. Specials stack at x=800 from
 * y=-300 downwards. Only node/edge ids differ between two layouts of the same tree.
 */
class CanvasLayoutEngine {
public:
    using IdGenerator = std::function<std::string()>;

    static constexpr int kNodeWidth = 300;
    static constexpr int kNodeHeight = 200;
    static constexpr int kGap = 200;
    static constexpr int kSourceY = -600;
    static constexpr int kSummaryY = -300;
    static constexpr int kSectionY = 0;
    static constexpr int kSubsectionY = 300;
    static constexpr int kSpecialX = 800;
    static constexpr int kSpecialStartY = -300;
    static constexpr int kSpecialStep = 250;

    /** @param idGenerator Source of node/edge ids; random UUIDs when empty. */
    explicit CanvasLayoutEngine(IdGenerator idGenerator = IdGenerator());

    /**
     * @param tree Parsed article.
     * @param fileSet Materialized notes; its rootFolder anchors the expected paths.
     * @param originalPath Vault-relative path of the source article.
     */
    domain::CanvasGraph layout(const domain::ArticleTree& tree,
                               const domain::OutputDocumentSet& fileSet,
                               const std::string& originalPath) const;

    /** @brief Left x of each of count nodes centred on centreX. */
    static std::vector<int> RowPositions(size_t count, int centreX);

private:
    domain::CanvasNode makeNode(domain::CanvasNodeKind kind, int x, int y, const std::string& file) const;
    domain::CanvasEdge makeEdge(const domain::CanvasNode& from, domain::CanvasSide fromSide,
                                const domain::CanvasNode& to, domain::CanvasSide toSide) const;

    IdGenerator m_nextId;
};

} // namespace vaultbreakdown::application
