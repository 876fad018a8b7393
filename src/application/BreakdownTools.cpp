/**
 * @file BreakdownTools.cpp
 * @brief Implementation of BreakdownTools.
 */

#include "application/BreakdownTools.hpp"
#include "domain/ArticleParser.hpp"
#include "infrastructure/CanvasCodec.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <filesystem>
#include <iostream>
#include <optional>

using json = nlohmann::json;

namespace vaultbreakdown::application {

namespace {
    std::optional<std::string> StringArg(const json& args, const char* key) {
        if (!args.is_object() || !args.contains(key) || !args[key].is_string()) return std::nullopt;
        return args[key].get<std::string>();
    }
}

BreakdownTools::BreakdownTools(std::shared_ptr<domain::ToolHost> delegate,
                               DocumentMaterializer::WriteFile writeFile,
                               DateProvider date,
                               CanvasLayoutEngine::IdGenerator idGenerator)
    : m_delegate(std::move(delegate)),
      m_materializer(std::move(writeFile)),
      m_layout(std::move(idGenerator)),
      m_date(std::move(date)) {
    if (!m_date) {
        m_date = [] { return infrastructure::TimeUtils::TodayLocalDate(); };
    }
}

std::string BreakdownTools::LabelFor(const std::string& sourcePath) {
    std::filesystem::path p(sourcePath);
    if (p.extension() == ".md") return p.stem().string();
    return p.filename().string();
}

std::string BreakdownTools::describe() const {
    return m_delegate ? "breakdown tools + " + m_delegate->describe() : "breakdown tools";
}

std::vector<domain::ToolSpec> BreakdownTools::listTools() {
    const json analysisSchema = {
        {"type", "string"},
        {"description", "Breakdown text: '# Summary', '# <Section>', '## <Subsection>', '# Special: <Title>' headings, each followed by its text"}
    };
    const json sourceSchema = {
        {"type", "string"},
        {"description", "Vault-relative path of the original article, e.g. Clippings/Article.md"}
    };

    std::vector<domain::ToolSpec> tools = {
        {kWriteNotes,
         "Write the summary, section, subsection and special notes of an article breakdown, with links.",
         {{"type", "object"},
          {"properties", {{"source_path", sourceSchema}, {"analysis", analysisSchema}}},
          {"required", json::array({"source_path", "analysis"})}}},
        {kWriteCanvas,
         "Write the canvas visualising an article breakdown. Uses the analysis from write_breakdown_notes unless one is given.",
         {{"type", "object"},
          {"properties", {{"source_path", sourceSchema}, {"analysis", analysisSchema}}},
          {"required", json::array({"source_path"})}}}
    };

    if (m_delegate) {
        for (auto& spec : m_delegate->listTools()) {
            if (spec.name == kWriteNotes || spec.name == kWriteCanvas) continue;
            tools.push_back(std::move(spec));
        }
    }
    return tools;
}

domain::ToolResult BreakdownTools::call(const std::string& name, const json& arguments) {
    if (name == kWriteNotes) return writeNotes(arguments);
    if (name == kWriteCanvas) return writeCanvas(arguments);
    if (!m_delegate) return domain::ToolResult::Failure("Tool not found: " + name);
    return m_delegate->call(name, arguments);
}

domain::ToolResult BreakdownTools::writeNotes(const json& arguments) {
    auto source = StringArg(arguments, "source_path");
    auto analysis = StringArg(arguments, "analysis");
    if (!source) return domain::ToolResult::Failure("Missing required argument: source_path");
    if (!analysis) return domain::ToolResult::Failure("Missing required argument: analysis");

    domain::ArticleTree tree = domain::ArticleParser::Parse(*analysis);
    const bool noHeadings = tree.empty();
    if (noHeadings) {
        std::cerr << "[BreakdownTools] Analysis for " << *source << " has no recognised headings." << std::endl;
    }

    const std::string label = LabelFor(*source);
    domain::OutputDocumentSet documents = m_materializer.materialize(tree, label, *source, m_date());

    std::string text = "Wrote " + std::to_string(documents.documents.size()) + " note(s) to " +
                       documents.rootFolder + ":";
    for (const auto& doc : documents.documents) text += "\n- " + doc.path;
    if (noHeadings) {
        text += "\nWarning: analysis has no recognised headings; use '# Summary', '# <Section>', "
                "'## <Subsection>', '# Special: <Title>'";
    }
    const bool allWritten = documents.failedPaths.empty();
    if (!allWritten) {
        text += "\nFailed:";
        for (const auto& path : documents.failedPaths) text += "\n- " + path;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last = Breakdown{*source, std::move(tree), std::move(documents)};
    }
    return allWritten ? domain::ToolResult::Success(text) : domain::ToolResult::Failure(text);
}

domain::ToolResult BreakdownTools::writeCanvas(const json& arguments) {
    auto source = StringArg(arguments, "source_path");
    if (!source) return domain::ToolResult::Failure("Missing required argument: source_path");
    const std::string label = LabelFor(*source);

    Breakdown breakdown;
    breakdown.source = *source;
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_last && m_last->source == *source) {
            breakdown = *m_last;
            known = true;
        }
    }
    auto analysis = StringArg(arguments, "analysis");
    if (analysis) {
        breakdown.tree = domain::ArticleParser::Parse(*analysis);
    } else if (!known) {
        return domain::ToolResult::Failure("No breakdown known for " + *source +
                                           "; call " + kWriteNotes + " first or pass analysis");
    }
    if (breakdown.documents.rootFolder.empty()) {
        breakdown.documents.rootFolder = DocumentMaterializer::FolderFor(label);
    }

    domain::CanvasGraph graph = m_layout.layout(breakdown.tree, breakdown.documents, *source);
    auto status = m_materializer.addCanvas(breakdown.documents, label, infrastructure::CanvasCodec::Encode(graph));
    if (!status) return domain::ToolResult::Failure(status.error().message);

    const std::string path = DocumentMaterializer::CanvasPath(label);
    std::cout << "[BreakdownTools] Canvas " << path << ": " << graph.nodes.size() << " nodes, "
              << graph.edges.size() << " edges." << std::endl;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last = std::move(breakdown);
    }
    return domain::ToolResult::Success("Wrote canvas " + path + " with " + std::to_string(graph.nodes.size()) +
                                       " nodes and " + std::to_string(graph.edges.size()) + " edges");
}

} // namespace vaultbreakdown::application
