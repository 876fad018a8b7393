/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Result.hpp"

namespace vaultbreakdown::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a POST request to /api/chat (non-streaming).
     * @param tools Function schemas in Ollama's format; omitted when empty.
     * @return The "message" object of the response, or a Transport error.
     */
    domain::Result<nlohmann::json> chat(const std::string& model,
                                        const nlohmann::json& messages,
                                        const nlohmann::json& tools = nlohmann::json::array());

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    std::string endpoint() const { return m_host + ":" + std::to_string(m_port); }

private:
    std::string m_host;
    int m_port;
};

} // namespace vaultbreakdown::infrastructure
