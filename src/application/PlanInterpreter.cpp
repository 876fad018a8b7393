/**
 * @file PlanInterpreter.cpp
 * @brief Implementation of PlanInterpreter.
 */

#include "application/PlanInterpreter.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace vaultbreakdown::application {

namespace {
    bool StartsWith(const std::string& text, const char* prefix) {
        return text.compare(0, std::string(prefix).length(), prefix) == 0;
    }

    void Trim(std::string& s) {
        if (s.empty()) return;
        s.erase(0, s.find_first_not_of(" \t\r\n"));
        if (!s.empty()) s.erase(s.find_last_not_of(" \t\r\n") + 1);
    }

    std::string ToLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }
}

std::vector<std::string> PlanInterpreter::ExtractSteps(const std::string& planText) {
    std::vector<std::string> steps;
    std::stringstream ss(planText);
    std::string line;
    while (std::getline(ss, line)) {
        Trim(line);
        if (line.empty() || !std::isdigit(static_cast<unsigned char>(line[0]))) continue;

        std::string step = line;
        size_t dot = line.find('.');
        if (dot != std::string::npos) {
            step = line.substr(dot + 1);
            Trim(step);
        }
        steps.push_back(step);
    }
    return steps;
}

StepKind PlanInterpreter::Classify(const std::string& step) {
    const std::string lower = ToLower(step);

    if (StartsWith(lower, "create directory")) return StepKind::Directory;
    if (StartsWith(lower, "create summary file") ||
        StartsWith(lower, "create section file") ||
        StartsWith(lower, "create subsection file")) {
        return StepKind::Content;
    }
    if (StartsWith(lower, "create canvas")) return StepKind::Canvas;

    if (lower.find("canvas") != std::string::npos) return StepKind::Canvas;
    return StepKind::Other;
}

std::string PlanInterpreter::Enrich(const std::string& step, StepKind kind,
                                    const std::string& content, const std::string& articlePath) {
    switch (kind) {
        case StepKind::Content:
            return step + ". Use this content:\n\n" + content +
                   "\nOriginal article path for linking: " + articlePath;
        case StepKind::Canvas:
            return step + "\nOriginal article path for canvas node: " + articlePath;
        case StepKind::Directory:
        case StepKind::Other:
            break;
    }
    return step;
}

std::string PlanInterpreter::KindToString(StepKind kind) {
    switch (kind) {
        case StepKind::Directory: return "directory";
        case StepKind::Content: return "content";
        case StepKind::Canvas: return "canvas";
        case StepKind::Other: return "other";
    }
    return "other";
}

} // namespace vaultbreakdown::application
