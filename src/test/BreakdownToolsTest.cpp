#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/BreakdownTools.hpp"

using namespace vaultbreakdown;
using application::BreakdownTools;
using json = nlohmann::json;

namespace {

class EchoHost : public domain::ToolHost {
public:
    std::vector<std::string> calls;

    std::vector<domain::ToolSpec> listTools() override {
        return {{"read_file", "Read a file", json::object()},
                {BreakdownTools::kWriteNotes, "shadowed", json::object()}};
    }

    domain::ToolResult call(const std::string& name, const json&) override {
        calls.push_back(name);
        return domain::ToolResult::Success("echo " + name);
    }

    std::string describe() const override { return "echo"; }
};

struct MemoryVault {
    std::map<std::string, std::string> files;
    std::string rejectSuffix;

    application::DocumentMaterializer::WriteFile writer() {
        return [this](const std::string& path, const std::string& content) {
            if (!rejectSuffix.empty() && path.size() >= rejectSuffix.size() &&
                path.compare(path.size() - rejectSuffix.size(), rejectSuffix.size(), rejectSuffix) == 0) {
                return domain::Status::Fail(domain::ErrorKind::ToolExecution, "rejected");
            }
            files[path] = content;
            return domain::Status::Ok();
        };
    }
};

const char* kAnalysis =
    "# Summary\nThe gist.\n"
    "# Background\nContext.\n"
    "## History\nOlder work.\n"
    "# Findings\nResults.\n"
    "# Special: References\n[1] Ref.\n";

BreakdownTools MakeTools(std::shared_ptr<domain::ToolHost> delegate, MemoryVault& vault) {
    auto counter = std::make_shared<int>(0);
    return BreakdownTools(delegate, vault.writer(),
                          [] { return std::string("2024-05-01"); },
                          [counter] { return "n" + std::to_string((*counter)++); });
}

void TestListAndForward() {
    std::cout << "[Test] Tool list and forwarding..." << std::endl;
    MemoryVault vault;
    auto echo = std::make_shared<EchoHost>();
    auto tools = MakeTools(echo, vault);

    auto specs = tools.listTools();
    assert(specs.size() == 3);
    assert(specs[0].name == BreakdownTools::kWriteNotes);
    assert(specs[1].name == BreakdownTools::kWriteCanvas);
    assert(specs[2].name == "read_file");
    assert(specs[0].inputSchema["required"].size() == 2);

    auto forwarded = tools.call("read_file", {{"path", "a.md"}});
    assert(forwarded.ok && forwarded.text == "echo read_file");
    assert(echo->calls.size() == 1);
    assert(tools.describe() == "breakdown tools + echo");

    MemoryVault bare;
    auto standalone = MakeTools(nullptr, bare);
    auto missing = standalone.call("read_file", json::object());
    assert(!missing.ok);
    assert(missing.text == "Tool not found: read_file");
    std::cout << "[PASS] List and forward." << std::endl;
}

void TestLabel() {
    std::cout << "[Test] Label from source path..." << std::endl;
    assert(BreakdownTools::LabelFor("Clippings/My Paper.md") == "My Paper");
    assert(BreakdownTools::LabelFor("My Paper.txt") == "My Paper.txt");
    assert(BreakdownTools::LabelFor("deep/dir/A:B.md") == "A:B");
    std::cout << "[PASS] Label." << std::endl;
}

void TestNotesThenCanvas() {
    std::cout << "[Test] Notes then canvas for one article..." << std::endl;
    MemoryVault vault;
    auto tools = MakeTools(nullptr, vault);

    auto notes = tools.call(BreakdownTools::kWriteNotes,
                            {{"source_path", "Clippings/Paper.md"}, {"analysis", kAnalysis}});
    assert(notes.ok);
    assert(notes.text.find("Wrote 5 note(s) to Paper-Breakdown") == 0);
    assert(vault.files.count("Paper-Breakdown/00-Summary.md") == 1);
    assert(vault.files.count("Paper-Breakdown/01.01-History.md") == 1);
    assert(vault.files.count("Paper-Breakdown/References.md") == 1);
    assert(vault.files["Paper-Breakdown/02-Findings.md"].find("date: 2024-05-01") != std::string::npos);

    auto canvas = tools.call(BreakdownTools::kWriteCanvas, {{"source_path", "Clippings/Paper.md"}});
    assert(canvas.ok);
    const std::string canvasPath = "Paper-Breakdown/Paper-Breakdown.canvas";
    assert(vault.files.count(canvasPath) == 1);

    auto j = json::parse(vault.files[canvasPath]);
    // source, summary, 2 sections, 1 subsection, 1 special
    assert(j["nodes"].size() == 6);
    assert(j["edges"].size() == 5);
    assert(j["nodes"][0]["file"] == "Clippings/Paper.md");
    assert(j["nodes"][0]["id"] == "n0");
    assert(j["nodes"][1]["file"] == "Paper-Breakdown/00-Summary.md");

    // Writing the canvas again does not duplicate it in the cached set.
    auto again = tools.call(BreakdownTools::kWriteCanvas, {{"source_path", "Clippings/Paper.md"}});
    assert(again.ok);
    std::cout << "[PASS] Notes then canvas." << std::endl;
}

void TestCanvasWithoutNotes() {
    std::cout << "[Test] Canvas needs an analysis..." << std::endl;
    MemoryVault vault;
    auto tools = MakeTools(nullptr, vault);

    auto unknown = tools.call(BreakdownTools::kWriteCanvas, {{"source_path", "Clippings/Other.md"}});
    assert(!unknown.ok);
    assert(unknown.text.find("No breakdown known") == 0);

    auto given = tools.call(BreakdownTools::kWriteCanvas,
                            {{"source_path", "Clippings/Other.md"}, {"analysis", "# Summary\nS\n# Only\nx\n"}});
    assert(given.ok);
    auto j = json::parse(vault.files["Other-Breakdown/Other-Breakdown.canvas"]);
    assert(j["nodes"].size() == 3);
    std::cout << "[PASS] Canvas without notes." << std::endl;
}

void TestArgumentErrors() {
    std::cout << "[Test] Bad arguments and write failures..." << std::endl;
    MemoryVault vault;
    auto tools = MakeTools(nullptr, vault);

    assert(!tools.call(BreakdownTools::kWriteNotes, {{"analysis", kAnalysis}}).ok);
    assert(!tools.call(BreakdownTools::kWriteNotes, {{"source_path", "a.md"}}).ok);
    assert(!tools.call(BreakdownTools::kWriteNotes, {{"source_path", "a.md"}, {"analysis", 42}}).ok);
    assert(vault.files.empty());

    vault.rejectSuffix = "References.md";
    auto partial = tools.call(BreakdownTools::kWriteNotes,
                              {{"source_path", "Clippings/Paper.md"}, {"analysis", kAnalysis}});
    assert(!partial.ok);
    assert(partial.text.find("Failed:\n- Paper-Breakdown/References.md") != std::string::npos);
    assert(vault.files.size() == 4);
    std::cout << "[PASS] Argument errors." << std::endl;
}

void TestNoHeadingsWritesSummary() {
    std::cout << "[Test] Analysis without headings still gives a summary note..." << std::endl;
    MemoryVault vault;
    auto tools = MakeTools(nullptr, vault);

    auto notes = tools.call(BreakdownTools::kWriteNotes,
                            {{"source_path", "Clippings/A.md"}, {"analysis", "no headings here"}});
    assert(notes.ok);
    assert(notes.text.find("Wrote 1 note(s) to A-Breakdown") == 0);
    assert(notes.text.find("Warning: analysis has no recognised headings") != std::string::npos);
    assert(vault.files.size() == 1);
    assert(vault.files.count("A-Breakdown/00-Summary.md") == 1);

    // The empty breakdown is still known to the canvas tool.
    auto canvas = tools.call(BreakdownTools::kWriteCanvas, {{"source_path", "Clippings/A.md"}});
    assert(canvas.ok);
    auto j = json::parse(vault.files["A-Breakdown/A-Breakdown.canvas"]);
    assert(j["nodes"].size() == 2);
    assert(j["edges"].size() == 1);
    std::cout << "[PASS] No headings." << std::endl;
}

void TestOnlyLatestBreakdownKept() {
    std::cout << "[Test] Only the latest breakdown is remembered..." << std::endl;
    MemoryVault vault;
    auto tools = MakeTools(nullptr, vault);

    assert(tools.call(BreakdownTools::kWriteNotes,
                      {{"source_path", "Clippings/First.md"}, {"analysis", kAnalysis}}).ok);
    assert(tools.call(BreakdownTools::kWriteNotes,
                      {{"source_path", "Clippings/Second.md"}, {"analysis", "# Summary\nS\n# One\nx\n"}}).ok);

    auto stale = tools.call(BreakdownTools::kWriteCanvas, {{"source_path", "Clippings/First.md"}});
    assert(!stale.ok);
    assert(stale.text.find("No breakdown known for Clippings/First.md") == 0);

    auto latest = tools.call(BreakdownTools::kWriteCanvas, {{"source_path", "Clippings/Second.md"}});
    assert(latest.ok);
    auto j = json::parse(vault.files["Second-Breakdown/Second-Breakdown.canvas"]);
    assert(j["nodes"].size() == 3);
    std::cout << "[PASS] Latest breakdown." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting BreakdownTools Test..." << std::endl;
    TestListAndForward();
    TestLabel();
    TestNotesThenCanvas();
    TestCanvasWithoutNotes();
    TestArgumentErrors();
    TestNoHeadingsWritesSummary();
    TestOnlyLatestBreakdownKept();
    std::cout << "[PASS] BreakdownTools Test." << std::endl;
    return 0;
}
