/**
 * @file ToolHost.hpp
 * @brief Interface for externally hosted named operations over the vault.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vaultbreakdown::domain {

/**
 * @struct ToolSpec
 * @brief Name, description and JSON schema of one tool.
 */
struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
};

/**
 * @struct ToolResult
 * @brief Outcome of a tool call. On failure, text holds the failure message.
 */
struct ToolResult {
    bool ok = false;
    std::string text;

    static ToolResult Success(std::string text) { return {true, std::move(text)}; }
    static ToolResult Failure(std::string text) { return {false, std::move(text)}; }
};

/**
 * @class ToolHost
 * @brief call(name, arguments) -> result|error.
 *
 * Implementations never throw out of call(); every failure is reported as a
 * ToolResult with ok == false.
 */
class ToolHost {
public:
    virtual ~ToolHost() = default;

    /** @brief Tools currently exposed by the host. */
    virtual std::vector<ToolSpec> listTools() = 0;

    /**
     * @brief Invokes a tool.
     * @param name Tool name as listed by listTools().
     * @param arguments JSON object of arguments.
     */
    virtual ToolResult call(const std::string& name, const nlohmann::json& arguments) = 0;

    /** @brief Short human readable description for status output. */
    virtual std::string describe() const = 0;
};

} // namespace vaultbreakdown::domain
