/**
 * @file BreakdownTools.hpp
 * @brief Tool host decorator exposing the parse/materialize/layout pipeline to the executor.
 */

#pragma once

#include "application/CanvasLayoutEngine.hpp"
#include "application/DocumentMaterializer.hpp"
#include "domain/ArticleTree.hpp"
#include "domain/OutputDocument.hpp"
#include "domain/ToolHost.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace vaultbreakdown::application {

/**
 * @class BreakdownTools
 * @brief Adds write_breakdown_notes and write_breakdown_canvas; forwards everything else.
 *
 * write_breakdown_notes {source_path, analysis}: parses the heading-structured
 * analysis and writes the summary/section/subsection/special notes.
 * write_breakdown_canvas {source_path, analysis?}: lays out the last analysis
 * written for source_path (or the one given) and writes the .canvas file.
 * Only the most recent breakdown is kept.
 */
class BreakdownTools : public domain::ToolHost {
public:
    using DateProvider = std::function<std::string()>;

    static constexpr const char* kWriteNotes = "write_breakdown_notes";
    static constexpr const char* kWriteCanvas = "write_breakdown_canvas";

    /**
     * @param delegate Host for every other tool; may be null.
     * @param writeFile Write capability for the generated documents.
     * @param date Front-matter date source; local date when empty.
     * @param idGenerator Canvas id source; random UUIDs when empty.
     */
    BreakdownTools(std::shared_ptr<domain::ToolHost> delegate,
                   DocumentMaterializer::WriteFile writeFile,
                   DateProvider date = DateProvider(),
                   CanvasLayoutEngine::IdGenerator idGenerator = CanvasLayoutEngine::IdGenerator());

    std::vector<domain::ToolSpec> listTools() override;
    domain::ToolResult call(const std::string& name, const nlohmann::json& arguments) override;
    std::string describe() const override;

    /** @brief Article title used for the breakdown folder: the source filename without .md. */
    static std::string LabelFor(const std::string& sourcePath);

private:
    struct Breakdown {
        std::string source;
        domain::ArticleTree tree;
        domain::OutputDocumentSet documents;
    };

    domain::ToolResult writeNotes(const nlohmann::json& arguments);
    domain::ToolResult writeCanvas(const nlohmann::json& arguments);

    std::shared_ptr<domain::ToolHost> m_delegate;
    DocumentMaterializer m_materializer;
    CanvasLayoutEngine m_layout;
    DateProvider m_date;
    std::optional<Breakdown> m_last;
    std::mutex m_mutex;
};

} // namespace vaultbreakdown::application
