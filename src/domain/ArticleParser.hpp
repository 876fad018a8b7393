#pragma once

#include "domain/ArticleTree.hpp"
#include <string>

namespace vaultbreakdown::domain {

/**
 * @brief Parses heading-delimited breakdown text into an ArticleTree.
 * This service is stateless and never throws; malformed input degrades to a
 * partial or empty tree.
 *
 * Recognised lines:
 * - "# Summary"          starts summary capture until the next top-level heading.
 * - "# Special: <title>" starts a special node and closes section/subsection.
 * - "# <title>"          starts a section and closes any open subsection.
 * - "## <title>"         starts a subsection, only while a section is open.
 */
class ArticleParser {
public:
    static constexpr const char* kSummaryMarker = "# Summary";
    static constexpr const char* kSpecialPrefix = "# Special:";

    static ArticleTree Parse(const std::string& text);
};

} // namespace vaultbreakdown::domain
