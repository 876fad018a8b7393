/**
 * @file DocumentMaterializer.hpp
 * @brief Turns an ArticleTree into linked markdown notes inside a breakdown folder.
 */

#pragma once

#include "domain/ArticleTree.hpp"
#include "domain/OutputDocument.hpp"
#include "domain/Result.hpp"
#include <functional>
#include <string>

namespace vaultbreakdown::application {

/**
 * @class DocumentMaterializer
 * @brief Writes one note per summary/section/subsection/special node.
 *
 * Layout of the breakdown folder "<label>-Breakdown":
 * - 00-Summary.md
 * - NN-<section>.md
 * - NN.MM-<subsection>.md
 * - <special>.md
 * - <label>-Breakdown.canvas (see addCanvas)
 */
class DocumentMaterializer {
public:
    using WriteFile = std::function<domain::Status(const std::string& path, const std::string& content)>;

    static constexpr const char* kSummaryFilename = "00-Summary.md";
    static constexpr const char* kUntitled = "Untitled";

    explicit DocumentMaterializer(WriteFile writeFile);

    /**
     * @brief Writes summary, then each section followed by its subsections, then specials.
     * A failed write is logged and skipped; later writes still happen.
     * @param tree Parsed article.
     * @param rootLabel Article title; names the folder and the canvas.
     * @param sourcePath Vault-relative path of the original article.
     * @param date Front-matter date (YYYY-MM-DD).
     * @return The documents that were written, in write order.
     */
    domain::OutputDocumentSet materialize(const domain::ArticleTree& tree,
                                          const std::string& rootLabel,
                                          const std::string& sourcePath,
                                          const std::string& date) const;

    /** @brief Writes the canvas document into the set's folder and records it. */
    domain::Status addCanvas(domain::OutputDocumentSet& set,
                             const std::string& rootLabel,
                             const std::string& canvasJson) const;

    // --- Naming ---
    static std::string SanitizeFilename(const std::string& name);
    static std::string FolderFor(const std::string& rootLabel);
    static std::string SummaryPath(const std::string& rootLabel);
    static std::string CanvasPath(const std::string& rootLabel);
    static std::string SectionFilename(size_t sectionNumber, const std::string& title);
    static std::string SubsectionFilename(size_t sectionNumber, size_t subsectionNumber, const std::string& title);
    static std::string SpecialFilename(const std::string& title);

    // --- Content ---
    static std::string SummaryContent(const domain::ArticleTree& tree, const std::string& rootLabel,
                                      const std::string& sourcePath, const std::string& date);
    static std::string SectionContent(const domain::Section& section, size_t sectionNumber,
                                      const std::string& sourcePath, const std::string& date);
    static std::string SubsectionContent(const domain::Subsection& subsection, const std::string& parentFilename,
                                         const std::string& sourcePath, const std::string& date);
    static std::string SpecialContent(const domain::SpecialNode& special,
                                      const std::string& sourcePath, const std::string& date);

private:
    bool writeInto(domain::OutputDocumentSet& set, const std::string& path, const std::string& content) const;

    WriteFile m_writeFile;
};

} // namespace vaultbreakdown::application
