/**
 * @file CanvasLayoutEngine.cpp
 * @brief Implementation of CanvasLayoutEngine.
 */

#include "application/CanvasLayoutEngine.hpp"
#include "application/DocumentMaterializer.hpp"
#include "infrastructure/UuidGenerator.hpp"
#include <iostream>

namespace vaultbreakdown::application {

using domain::CanvasNodeKind;
using domain::CanvasSide;

CanvasLayoutEngine::CanvasLayoutEngine(IdGenerator idGenerator)
    : m_nextId(std::move(idGenerator)) {
    if (!m_nextId) {
        m_nextId = [] { return infrastructure::UuidGenerator::Generate(); };
    }
}

std::vector<int> CanvasLayoutEngine::RowPositions(size_t count, int centreX) {
    std::vector<int> xs;
    if (count == 0) return xs;
    const int n = static_cast<int>(count);
    const int total = n * kNodeWidth + (n - 1) * kGap;
    // Row of total width centred on centreX, i.e. on the parent's middle.
    const int startX = centreX - total / 2;
    xs.reserve(count);
    for (int i = 0; i < n; ++i) {
        xs.push_back(startX + i * (kNodeWidth + kGap));
    }
    return xs;
}

domain::CanvasNode CanvasLayoutEngine::makeNode(CanvasNodeKind kind, int x, int y, const std::string& file) const {
    domain::CanvasNode node;
    node.id = m_nextId();
    node.x = x;
    node.y = y;
    node.width = kNodeWidth;
    node.height = kNodeHeight;
    node.kind = kind;
    node.file = file;
    node.color = domain::ColorForKind(kind);
    return node;
}

domain::CanvasEdge CanvasLayoutEngine::makeEdge(const domain::CanvasNode& from, CanvasSide fromSide,
                                                const domain::CanvasNode& to, CanvasSide toSide) const {
    domain::CanvasEdge edge;
    edge.id = m_nextId();
    edge.fromNode = from.id;
    edge.fromSide = fromSide;
    edge.toNode = to.id;
    edge.toSide = toSide;
    return edge;
}

domain::CanvasGraph CanvasLayoutEngine::layout(const domain::ArticleTree& tree,
                                               const domain::OutputDocumentSet& fileSet,
                                               const std::string& originalPath) const {
    domain::CanvasGraph graph;
    const std::string prefix = fileSet.rootFolder.empty() ? std::string() : fileSet.rootFolder + "/";

    auto expected = [&](const std::string& filename) {
        std::string path = prefix + filename;
        if (!fileSet.contains(path)) {
            std::cerr << "[CanvasLayoutEngine] " << path << " was not written; placing node anyway." << std::endl;
        }
        return path;
    };

    const domain::CanvasNode source = makeNode(CanvasNodeKind::SOURCE, 0, kSourceY, originalPath);
    const domain::CanvasNode summary = makeNode(CanvasNodeKind::SUMMARY, 0, kSummaryY,
                                                expected(DocumentMaterializer::kSummaryFilename));
    graph.nodes.push_back(source);
    graph.nodes.push_back(summary);
    graph.edges.push_back(makeEdge(source, CanvasSide::BOTTOM, summary, CanvasSide::TOP));

    // Row centre 0 reproduces startX = -total/2.
    const auto sectionXs = RowPositions(tree.sections.size(), 0);
    for (size_t i = 0; i < tree.sections.size(); ++i) {
        const auto& section = tree.sections[i];
        const domain::CanvasNode sectionNode = makeNode(
            CanvasNodeKind::SECTION, sectionXs[i], kSectionY,
            expected(DocumentMaterializer::SectionFilename(i + 1, section.title)));
        graph.nodes.push_back(sectionNode);
        graph.edges.push_back(makeEdge(summary, CanvasSide::BOTTOM, sectionNode, CanvasSide::TOP));

        const int parentCentre = sectionNode.x + kNodeWidth / 2;
        const auto childXs = RowPositions(section.subsections.size(), parentCentre);
        for (size_t j = 0; j < section.subsections.size(); ++j) {
            const domain::CanvasNode child = makeNode(
                CanvasNodeKind::SUBSECTION, childXs[j], kSubsectionY,
                expected(DocumentMaterializer::SubsectionFilename(i + 1, j + 1, section.subsections[j].title)));
            graph.nodes.push_back(child);
            graph.edges.push_back(makeEdge(sectionNode, CanvasSide::BOTTOM, child, CanvasSide::TOP));
        }
    }

    int specialY = kSpecialStartY;
    for (const auto& special : tree.specialNodes) {
        const domain::CanvasNode specialNode = makeNode(
            CanvasNodeKind::SPECIAL, kSpecialX, specialY,
            expected(DocumentMaterializer::SpecialFilename(special.title)));
        graph.nodes.push_back(specialNode);
        graph.edges.push_back(makeEdge(summary, CanvasSide::RIGHT, specialNode, CanvasSide::LEFT));
        specialY += kSpecialStep;
    }

    return graph;
}

} // namespace vaultbreakdown::application
