/**
 * @file DocumentMaterializer.cpp
 * @brief Implementation of DocumentMaterializer.
 */

#include "application/DocumentMaterializer.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace vaultbreakdown::application {

namespace {
    std::string DisplayTitle(const std::string& title) {
        return title.empty() ? DocumentMaterializer::kUntitled : title;
    }

    std::string Number(size_t n) {
        std::ostringstream ss;
        ss << std::setw(2) << std::setfill('0') << n;
        return ss.str();
    }

    std::string WikiLink(const std::string& target, const std::string& alias) {
        return "[[" + target + "|" + alias + "]]";
    }

    // "01-Intro.md" -> "Intro"
    std::string BackLinkLabel(const std::string& parentFilename) {
        if (parentFilename.size() <= 6) return parentFilename;
        return parentFilename.substr(3, parentFilename.size() - 6);
    }
}

DocumentMaterializer::DocumentMaterializer(WriteFile writeFile)
    : m_writeFile(std::move(writeFile)) {}

std::string DocumentMaterializer::SanitizeFilename(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        switch (c) {
            case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|':
                c = '-';
                break;
            default:
                break;
        }
    }
    return out;
}

std::string DocumentMaterializer::FolderFor(const std::string& rootLabel) {
    return SanitizeFilename(DisplayTitle(rootLabel)) + "-Breakdown";
}

std::string DocumentMaterializer::SummaryPath(const std::string& rootLabel) {
    return FolderFor(rootLabel) + "/" + kSummaryFilename;
}

std::string DocumentMaterializer::CanvasPath(const std::string& rootLabel) {
    return FolderFor(rootLabel) + "/" + FolderFor(rootLabel) + ".canvas";
}

std::string DocumentMaterializer::SectionFilename(size_t sectionNumber, const std::string& title) {
    return Number(sectionNumber) + "-" + SanitizeFilename(DisplayTitle(title)) + ".md";
}

std::string DocumentMaterializer::SubsectionFilename(size_t sectionNumber, size_t subsectionNumber,
                                                     const std::string& title) {
    return Number(sectionNumber) + "." + Number(subsectionNumber) + "-" +
           SanitizeFilename(DisplayTitle(title)) + ".md";
}

std::string DocumentMaterializer::SpecialFilename(const std::string& title) {
    return SanitizeFilename(DisplayTitle(title)) + ".md";
}

std::string DocumentMaterializer::SummaryContent(const domain::ArticleTree& tree, const std::string& rootLabel,
                                                 const std::string& sourcePath, const std::string& date) {
    std::ostringstream ss;
    ss << "---\n"
       << "title: Summary of " << rootLabel << "\n"
       << "date: " << date << "\n"
       << "original_article: " << sourcePath << "\n"
       << "tags: [summary, article-breakdown]\n"
       << "---\n\n"
       << "# Summary\n\n"
       << tree.summary << "\n\n"
       << "## Table of Contents\n\n";

    for (size_t i = 0; i < tree.sections.size(); ++i) {
        const auto& section = tree.sections[i];
        ss << "- " << WikiLink(SectionFilename(i + 1, section.title), DisplayTitle(section.title)) << "\n";
        if (!section.subsections.empty()) {
            ss << "  - ";
            for (size_t j = 0; j < section.subsections.size(); ++j) {
                const auto& sub = section.subsections[j];
                if (j > 0) ss << " | ";
                ss << WikiLink(SubsectionFilename(i + 1, j + 1, sub.title), DisplayTitle(sub.title));
            }
            ss << "\n";
        }
    }

    if (!tree.specialNodes.empty()) {
        ss << "\n## Special Nodes\n\n";
        for (const auto& special : tree.specialNodes) {
            ss << "- " << WikiLink(SpecialFilename(special.title), DisplayTitle(special.title)) << "\n";
        }
    }
    return ss.str();
}

std::string DocumentMaterializer::SectionContent(const domain::Section& section, size_t sectionNumber,
                                                 const std::string& sourcePath, const std::string& date) {
    std::ostringstream ss;
    ss << "---\n"
       << "title: " << DisplayTitle(section.title) << "\n"
       << "date: " << date << "\n"
       << "parent: [[" << kSummaryFilename << "]]\n"
       << "original_article: " << sourcePath << "\n"
       << "tags: [section, article-breakdown]\n"
       << "---\n\n"
       << "# " << DisplayTitle(section.title) << "\n\n"
       << section.body << "\n\n";

    if (!section.subsections.empty()) {
        ss << "## Subsections\n\n";
        for (size_t j = 0; j < section.subsections.size(); ++j) {
            const auto& sub = section.subsections[j];
            ss << "- " << WikiLink(SubsectionFilename(sectionNumber, j + 1, sub.title), DisplayTitle(sub.title)) << "\n";
        }
    }

    ss << "\n" << WikiLink(kSummaryFilename, "Back to Summary") << "\n";
    return ss.str();
}

std::string DocumentMaterializer::SubsectionContent(const domain::Subsection& subsection,
                                                    const std::string& parentFilename,
                                                    const std::string& sourcePath, const std::string& date) {
    std::ostringstream ss;
    ss << "---\n"
       << "title: " << DisplayTitle(subsection.title) << "\n"
       << "date: " << date << "\n"
       << "parent: [[" << parentFilename << "]]\n"
       << "original_article: " << sourcePath << "\n"
       << "tags: [subsection, article-breakdown]\n"
       << "---\n\n"
       << "# " << DisplayTitle(subsection.title) << "\n\n"
       << subsection.body << "\n\n"
       << WikiLink(parentFilename, "Back to " + BackLinkLabel(parentFilename)) << "\n";
    return ss.str();
}

std::string DocumentMaterializer::SpecialContent(const domain::SpecialNode& special,
                                                 const std::string& sourcePath, const std::string& date) {
    std::ostringstream ss;
    ss << "---\n"
       << "title: " << DisplayTitle(special.title) << "\n"
       << "date: " << date << "\n"
       << "original_article: " << sourcePath << "\n"
       << "tags: [special-node, article-breakdown]\n"
       << "---\n\n"
       << "# " << DisplayTitle(special.title) << "\n\n"
       << special.body << "\n";
    return ss.str();
}

bool DocumentMaterializer::writeInto(domain::OutputDocumentSet& set, const std::string& path,
                                     const std::string& content) const {
    auto status = m_writeFile(path, content);
    if (!status) {
        std::cerr << "[DocumentMaterializer] Failed to write " << path << ": " << status.error().message << std::endl;
        set.failedPaths.push_back(path);
        return false;
    }
    set.documents.push_back({path, content});
    return true;
}

domain::OutputDocumentSet DocumentMaterializer::materialize(const domain::ArticleTree& tree,
                                                            const std::string& rootLabel,
                                                            const std::string& sourcePath,
                                                            const std::string& date) const {
    domain::OutputDocumentSet set;
    set.rootFolder = FolderFor(rootLabel);
    const std::string prefix = set.rootFolder + "/";

    writeInto(set, prefix + kSummaryFilename, SummaryContent(tree, rootLabel, sourcePath, date));

    for (size_t i = 0; i < tree.sections.size(); ++i) {
        const auto& section = tree.sections[i];
        const std::string sectionFile = SectionFilename(i + 1, section.title);
        writeInto(set, prefix + sectionFile, SectionContent(section, i + 1, sourcePath, date));

        for (size_t j = 0; j < section.subsections.size(); ++j) {
            const auto& sub = section.subsections[j];
            writeInto(set, prefix + SubsectionFilename(i + 1, j + 1, sub.title),
                      SubsectionContent(sub, sectionFile, sourcePath, date));
        }
    }

    for (const auto& special : tree.specialNodes) {
        writeInto(set, prefix + SpecialFilename(special.title), SpecialContent(special, sourcePath, date));
    }

    std::cout << "[DocumentMaterializer] Wrote " << set.documents.size() << " note(s) to "
              << set.rootFolder;
    if (!set.failedPaths.empty()) std::cout << " (" << set.failedPaths.size() << " failed)";
    std::cout << std::endl;
    return set;
}

domain::Status DocumentMaterializer::addCanvas(domain::OutputDocumentSet& set,
                                               const std::string& rootLabel,
                                               const std::string& canvasJson) const {
    const std::string path = CanvasPath(rootLabel);
    if (!writeInto(set, path, canvasJson)) {
        return domain::Status::Fail(domain::ErrorKind::ToolExecution, "failed to write canvas " + path);
    }
    return domain::Status::Ok();
}

} // namespace vaultbreakdown::application
