#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/CanvasLayoutEngine.hpp"
#include "application/DocumentMaterializer.hpp"
#include "domain/ArticleParser.hpp"
#include "infrastructure/CanvasCodec.hpp"

using namespace vaultbreakdown;
using application::CanvasLayoutEngine;
using application::DocumentMaterializer;
using domain::CanvasNodeKind;
using domain::CanvasSide;

namespace {

CanvasLayoutEngine::IdGenerator Counter() {
    auto next = std::make_shared<int>(0);
    return [next] { return "id-" + std::to_string((*next)++); };
}

domain::OutputDocumentSet WrittenSet(const domain::ArticleTree& tree, const std::string& label) {
    DocumentMaterializer materializer([](const std::string&, const std::string&) {
        return domain::Status::Ok();
    });
    return materializer.materialize(tree, label, "Clippings/" + label + ".md", "2024-05-01");
}

const domain::CanvasNode& NodeById(const domain::CanvasGraph& graph, const std::string& id) {
    for (const auto& node : graph.nodes) {
        if (node.id == id) return node;
    }
    assert(false && "edge points at a missing node");
    return graph.nodes.front();
}

void TestRowPositions() {
    std::cout << "[Test] Row positions step 500 centred on the parent..." << std::endl;
    assert(CanvasLayoutEngine::RowPositions(0, 0).empty());
    assert(CanvasLayoutEngine::RowPositions(1, 0) == std::vector<int>({-150}));
    assert(CanvasLayoutEngine::RowPositions(2, 0) == std::vector<int>({-400, 100}));
    assert(CanvasLayoutEngine::RowPositions(3, 0) == std::vector<int>({-650, -150, 350}));
    assert(CanvasLayoutEngine::RowPositions(2, -500) == std::vector<int>({-900, -400}));
    std::cout << "[PASS] Row positions." << std::endl;
}

void TestSectionsOnly() {
    std::cout << "[Test] N sections give N+2 nodes..." << std::endl;
    auto tree = domain::ArticleParser::Parse("# Summary\nS\n# A\na\n# B\nb\n# C\nc\n");
    auto set = WrittenSet(tree, "Paper");
    CanvasLayoutEngine engine(Counter());
    auto graph = engine.layout(tree, set, "Clippings/Paper.md");

    assert(graph.nodes.size() == 5);
    assert(graph.edges.size() == 4);

    const auto& source = graph.nodes[0];
    assert(source.kind == CanvasNodeKind::SOURCE);
    assert(source.x == 0 && source.y == -600);
    assert(source.file == "Clippings/Paper.md");
    assert(source.color == domain::CanvasColor::PURPLE);

    const auto& summary = graph.nodes[1];
    assert(summary.kind == CanvasNodeKind::SUMMARY);
    assert(summary.x == 0 && summary.y == -300);
    assert(summary.file == "Paper-Breakdown/00-Summary.md");

    const int xs[] = {-650, -150, 350};
    for (int i = 0; i < 3; ++i) {
        const auto& node = graph.nodes[2 + i];
        assert(node.kind == CanvasNodeKind::SECTION);
        assert(node.x == xs[i]);
        assert(node.y == 0);
        assert(node.width == 300 && node.height == 200);
        assert(node.color == domain::CanvasColor::YELLOW);
    }
    assert(graph.nodes[3].file == "Paper-Breakdown/02-B.md");

    assert(graph.edges[0].fromNode == source.id && graph.edges[0].toNode == summary.id);
    assert(graph.edges[0].fromSide == CanvasSide::BOTTOM && graph.edges[0].toSide == CanvasSide::TOP);
    for (size_t e = 1; e < graph.edges.size(); ++e) {
        assert(graph.edges[e].fromNode == summary.id);
        assert(NodeById(graph, graph.edges[e].toNode).kind == CanvasNodeKind::SECTION);
    }
    std::cout << "[PASS] Sections only." << std::endl;
}

void TestSubsectionsAndSpecials() {
    std::cout << "[Test] Subsections centred under parents, specials stacked right..." << std::endl;
    auto tree = domain::ArticleParser::Parse(
        "# Summary\nS\n# A\na\n## A1\nx\n## A2\ny\n# B\nb\n# Special: Refs\nr\n# Special: Glossary\ng\n");
    auto set = WrittenSet(tree, "Paper");
    CanvasLayoutEngine engine(Counter());
    auto graph = engine.layout(tree, set, "Clippings/Paper.md");

    // source, summary, A, A1, A2, B, Refs, Glossary
    assert(graph.nodes.size() == 8);
    assert(graph.edges.size() == 7);

    const auto& a = graph.nodes[2];
    assert(a.x == -400 && a.y == 0);
    const auto& a1 = graph.nodes[3];
    const auto& a2 = graph.nodes[4];
    assert(a1.kind == CanvasNodeKind::SUBSECTION && a1.color == domain::CanvasColor::CYAN);
    assert(a1.y == 300 && a2.y == 300);
    // Parent centre -250; row of two spans 800.
    assert(a1.x == -650 && a2.x == -150);
    assert(a1.file == "Paper-Breakdown/01.01-A1.md");
    assert(graph.nodes[5].x == 100);

    const auto& refs = graph.nodes[6];
    const auto& glossary = graph.nodes[7];
    assert(refs.kind == CanvasNodeKind::SPECIAL && refs.color == domain::CanvasColor::ORANGE);
    assert(refs.x == 800 && refs.y == -300);
    assert(glossary.x == 800 && glossary.y == -50);
    assert(glossary.file == "Paper-Breakdown/Glossary.md");

    int specialEdges = 0;
    for (const auto& edge : graph.edges) {
        if (NodeById(graph, edge.toNode).kind == CanvasNodeKind::SPECIAL) {
            assert(edge.fromNode == graph.nodes[1].id);
            assert(edge.fromSide == CanvasSide::RIGHT && edge.toSide == CanvasSide::LEFT);
            ++specialEdges;
        }
        if (NodeById(graph, edge.toNode).kind == CanvasNodeKind::SUBSECTION) {
            assert(edge.fromNode == a.id);
        }
    }
    assert(specialEdges == 2);
    std::cout << "[PASS] Subsections and specials." << std::endl;
}

void TestDeterminismAndMissingDocuments() {
    std::cout << "[Test] Layout is deterministic apart from ids..." << std::endl;
    auto tree = domain::ArticleParser::Parse("# Summary\nS\n# A\na\n## A1\nx\n# Special: Refs\nr\n");
    auto set = WrittenSet(tree, "Paper");

    CanvasLayoutEngine uuidEngine;
    auto first = uuidEngine.layout(tree, set, "Clippings/Paper.md");
    auto second = uuidEngine.layout(tree, set, "Clippings/Paper.md");
    assert(first.nodes.size() == second.nodes.size());
    std::set<std::string> ids;
    for (size_t i = 0; i < first.nodes.size(); ++i) {
        assert(first.nodes[i].x == second.nodes[i].x);
        assert(first.nodes[i].y == second.nodes[i].y);
        assert(first.nodes[i].file == second.nodes[i].file);
        assert(first.nodes[i].id != second.nodes[i].id);
        ids.insert(first.nodes[i].id);
    }
    assert(ids.size() == first.nodes.size());

    // Nothing written: nodes still placed at the expected paths.
    domain::OutputDocumentSet empty;
    empty.rootFolder = DocumentMaterializer::FolderFor("Paper");
    CanvasLayoutEngine engine(Counter());
    auto graph = engine.layout(tree, empty, "Clippings/Paper.md");
    assert(graph.nodes.size() == first.nodes.size());
    assert(graph.nodes[2].file == "Paper-Breakdown/01-A.md");
    std::cout << "[PASS] Determinism." << std::endl;
}

void TestCodec() {
    std::cout << "[Test] Canvas JSON keys and colours..." << std::endl;
    auto tree = domain::ArticleParser::Parse("# Summary\nS\n# A\na\n## A1\nx\n# Special: Refs\nr\n");
    auto set = WrittenSet(tree, "Paper");
    CanvasLayoutEngine engine(Counter());
    auto graph = engine.layout(tree, set, "Clippings/Paper.md");

    const std::string text = infrastructure::CanvasCodec::Encode(graph);
    auto j = nlohmann::json::parse(text);
    assert(j.at("nodes").size() == 5);
    assert(j.at("edges").size() == 4);

    const auto& sourceJson = j["nodes"][0];
    assert(sourceJson["type"] == "file");
    assert(sourceJson["color"] == "6");
    assert(sourceJson["x"] == 0 && sourceJson["y"] == -600);
    assert(j["nodes"][1]["color"] == "4");
    assert(j["nodes"][2]["color"] == "3");
    assert(j["nodes"][3]["color"] == "5");
    assert(j["nodes"][4]["color"] == "2");
    assert(j["edges"][0]["fromSide"] == "bottom");
    assert(j["edges"][0]["toSide"] == "top");
    assert(j["edges"][0].contains("fromNode") && j["edges"][0].contains("toNode"));
    assert(j["edges"][3]["fromSide"] == "right");
    assert(j["edges"][3]["toSide"] == "left");
    std::cout << "[PASS] Codec." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CanvasLayout Test..." << std::endl;
    TestRowPositions();
    TestSectionsOnly();
    TestSubsectionsAndSpecials();
    TestDeterminismAndMissingDocuments();
    TestCodec();
    std::cout << "[PASS] CanvasLayout Test." << std::endl;
    return 0;
}
