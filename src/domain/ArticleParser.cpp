#include "domain/ArticleParser.hpp"
#include <cstring>
#include <sstream>

namespace vaultbreakdown::domain {

namespace {
    bool StartsWith(const std::string& text, const char* prefix) {
        return text.compare(0, std::strlen(prefix), prefix) == 0;
    }

    std::string Trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    std::string TrimRight(const std::string& s) {
        size_t last = s.find_last_not_of(" \t\r");
        if (last == std::string::npos) return "";
        return s.substr(0, last + 1);
    }

    // "#" alone or "# ..." ; "##" is not top-level.
    bool IsTopLevelHeading(const std::string& line) {
        return line == "#" || StartsWith(line, "# ");
    }

    bool IsSecondLevelHeading(const std::string& line) {
        return line == "##" || StartsWith(line, "## ");
    }

    std::string HeadingTitle(const std::string& line, size_t markerLength) {
        if (line.size() <= markerLength) return "";
        return Trim(line.substr(markerLength));
    }

    void AppendLine(std::string& body, const std::string& line) {
        body += line;
        body += '\n';
    }

    enum class Context { None, Summary, Section, Subsection, Special };
}

ArticleTree ArticleParser::Parse(const std::string& text) {
    ArticleTree tree;
    std::stringstream ss(text);
    std::string rawLine;

    Context context = Context::None;
    std::string summaryBuffer;
    // Indices instead of pointers: the vectors grow while parsing.
    int sectionIndex = -1;
    int subsectionIndex = -1;
    int specialIndex = -1;

    while (std::getline(ss, rawLine)) {
        if (!rawLine.empty() && rawLine.back() == '\r') rawLine.pop_back();
        std::string line = TrimRight(rawLine);

        if (line == kSummaryMarker) {
            summaryBuffer.clear();
            context = Context::Summary;
            sectionIndex = subsectionIndex = specialIndex = -1;
            continue;
        }

        if (StartsWith(line, kSpecialPrefix)) {
            tree.specialNodes.push_back({HeadingTitle(line, std::strlen(kSpecialPrefix)), ""});
            specialIndex = static_cast<int>(tree.specialNodes.size()) - 1;
            sectionIndex = subsectionIndex = -1;
            context = Context::Special;
            continue;
        }

        if (IsTopLevelHeading(line)) {
            Section section;
            section.title = HeadingTitle(line, 2);
            tree.sections.push_back(section);
            sectionIndex = static_cast<int>(tree.sections.size()) - 1;
            subsectionIndex = -1;
            specialIndex = -1;
            context = Context::Section;
            continue;
        }

        if (IsSecondLevelHeading(line) && (context == Context::Section || context == Context::Subsection)) {
            auto& subsections = tree.sections[sectionIndex].subsections;
            subsections.push_back({HeadingTitle(line, 3), ""});
            subsectionIndex = static_cast<int>(subsections.size()) - 1;
            context = Context::Subsection;
            continue;
        }

        switch (context) {
            case Context::Summary:
                AppendLine(summaryBuffer, rawLine);
                break;
            case Context::Subsection:
                AppendLine(tree.sections[sectionIndex].subsections[subsectionIndex].body, rawLine);
                break;
            case Context::Section:
                AppendLine(tree.sections[sectionIndex].body, rawLine);
                break;
            case Context::Special:
                AppendLine(tree.specialNodes[specialIndex].body, rawLine);
                break;
            case Context::None:
                // Orphan line before any heading.
                break;
        }
    }

    tree.summary = Trim(summaryBuffer);
    for (auto& section : tree.sections) {
        section.body = Trim(section.body);
        for (auto& sub : section.subsections) {
            sub.body = Trim(sub.body);
        }
    }
    for (auto& special : tree.specialNodes) {
        special.body = Trim(special.body);
    }
    return tree;
}

} // namespace vaultbreakdown::domain
