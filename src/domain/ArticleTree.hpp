/**
 * @file ArticleTree.hpp
 * @brief Heading structure of a broken-down article.
 */

#pragma once
#include <string>
#include <vector>

namespace vaultbreakdown::domain {

/**
 * @struct Subsection
 * @brief Second-level heading and its body.
 */
struct Subsection {
    std::string title;
    std::string body;
};

/**
 * @struct Section
 * @brief Top-level heading, its body and its ordered subsections.
 */
struct Section {
    std::string title;
    std::string body;
    std::vector<Subsection> subsections;
};

/**
 * @struct SpecialNode
 * @brief Output with no section parent (e.g. a references list). Never has children.
 */
struct SpecialNode {
    std::string title;
    std::string body;
};

/**
 * @struct ArticleTree
 * @brief Summary, sections and special nodes in first-appearance order.
 */
struct ArticleTree {
    std::string summary;
    std::vector<Section> sections;
    std::vector<SpecialNode> specialNodes;

    bool empty() const {
        return summary.empty() && sections.empty() && specialNodes.empty();
    }

    size_t subsectionCount() const {
        size_t count = 0;
        for (const auto& section : sections) {
            count += section.subsections.size();
        }
        return count;
    }
};

} // namespace vaultbreakdown::domain
