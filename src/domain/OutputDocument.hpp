/**
 * @file OutputDocument.hpp
 * @brief Documents produced by materializing an ArticleTree.
 */

#pragma once
#include <algorithm>
#include <string>
#include <vector>

namespace vaultbreakdown::domain {

/**
 * @struct OutputDocument
 * @brief A vault-relative path and the content written there.
 */
struct OutputDocument {
    std::string path;
    std::string content;
};

/**
 * @struct OutputDocumentSet
 * @brief Ordered documents of one breakdown, rooted at a single folder.
 */
struct OutputDocumentSet {
    std::string rootFolder;                 ///< e.g. "My Article-Breakdown".
    std::vector<OutputDocument> documents;  ///< Only successfully written documents.
    std::vector<std::string> failedPaths;   ///< Paths whose write failed.

    bool contains(const std::string& path) const {
        return std::any_of(documents.begin(), documents.end(),
                           [&](const OutputDocument& d) { return d.path == path; });
    }
};

} // namespace vaultbreakdown::domain
