/**
 * @file PlanInterpreter.hpp
 * @brief Extracts numbered steps from planner output and prepares them for the executor.
 */

#pragma once

#include <string>
#include <vector>

namespace vaultbreakdown::application {

/**
 * @enum StepKind
 * @brief Best-effort category of a plan step, used only to decide what context to inject.
 */
enum class StepKind {
    Directory, ///< "create directory ..."; sent unchanged.
    Content,   ///< "create summary/section/subsection file ..."; article content appended.
    Canvas,    ///< Mentions a canvas; original article path appended.
    Other      ///< Sent unchanged.
};

class PlanInterpreter {
public:
    /**
     * @brief Keeps lines whose first non-blank character is a digit.
     * The step text is what follows the first '.', trimmed; the whole line when there is no '.'.
     */
    static std::vector<std::string> ExtractSteps(const std::string& planText);

    /** @brief Case-insensitive prefix match first, then a "canvas" substring match. */
    static StepKind Classify(const std::string& step);

    /**
     * @brief Appends the context the executor needs for this kind of step.
     * @param content Full article text.
     * @param articlePath Vault-relative path of the article.
     */
    static std::string Enrich(const std::string& step, StepKind kind,
                              const std::string& content, const std::string& articlePath);

    static std::string KindToString(StepKind kind);
};

} // namespace vaultbreakdown::application
