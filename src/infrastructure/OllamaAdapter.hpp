/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for communication with a local Ollama server.
 */

#pragma once
#include "domain/AIService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace vaultbreakdown::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Implements AIService using the Ollama REST API with tool calling.
 */
class OllamaAdapter : public domain::AIService {
public:
    /**
     * @brief Constructor for OllamaAdapter.
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Model to use; empty selects one from the server's list in initialize().
     */
    OllamaAdapter(const std::string& host = "localhost", int port = 11434, const std::string& model = "");

    /** @brief Picks a model when none was configured. */
    void initialize() override;

    /** @brief Sends a chat history to the model. @see domain::AIService::chat */
    domain::Result<ChatMessage> chat(const std::vector<ChatMessage>& history,
                                     const std::vector<domain::ToolSpec>& tools) override;

    std::string getCurrentModel() const override;

    /** @brief Ollama wire form of one message. */
    static nlohmann::json ToWire(const ChatMessage& message);

    /** @brief Parses an Ollama "message" object. Tool arguments given as a JSON string are decoded. */
    static ChatMessage FromWire(const nlohmann::json& message);

    /** @brief Ollama "tools" array for the given specs. */
    static nlohmann::json ToolsToWire(const std::vector<domain::ToolSpec>& tools);

private:
    void detectBestModel();

    OllamaClient m_client;
    std::string m_model = "qwen2.5:7b"; ///< Target model name.
    bool m_modelPinned = false;         ///< True when the model came from configuration.
};

} // namespace vaultbreakdown::infrastructure
