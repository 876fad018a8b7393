/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include <iostream>

using json = nlohmann::json;

namespace vaultbreakdown::infrastructure {

OllamaAdapter::OllamaAdapter(const std::string& host, int port, const std::string& model)
    : m_client(host, port) {
    if (!model.empty()) {
        m_model = model;
        m_modelPinned = true;
    }
}

void OllamaAdapter::initialize() {
    if (m_modelPinned) {
        std::cout << "[OllamaAdapter] Using configured model: " << m_model << std::endl;
        return;
    }
    detectBestModel();
}

void OllamaAdapter::detectBestModel() {
    std::vector<std::string> availableModels = m_client.getAvailableModels();
    if (availableModels.empty()) {
        std::cerr << "[OllamaAdapter] Failed to list models. Is Ollama running? Keeping default: " << m_model << std::endl;
        return;
    }

    // Priority Hierarchy (models with reliable tool calling first)
    const std::vector<std::string> priorities = {
        "qwen2.5:7b",
        "qwen2.5",
        "llama3.1",
        "llama3.2",
        "mistral-nemo",
        "mistral"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : availableModels) {
            if (model.find(priority) != std::string::npos) {
                m_model = model;
                std::cout << "[OllamaAdapter] Auto-selected model: " << m_model << std::endl;
                return;
            }
        }
    }

    // Fallback: Pick the first available
    m_model = availableModels[0];
    std::cout << "[OllamaAdapter] Fallback model: " << m_model << std::endl;
}

json OllamaAdapter::ToWire(const ChatMessage& message) {
    json j = {
        {"role", ChatMessage::RoleToString(message.role)},
        {"content", message.content}
    };
    if (!message.toolCalls.empty()) {
        j["tool_calls"] = json::array();
        for (const auto& call : message.toolCalls) {
            j["tool_calls"].push_back({{"function", {{"name", call.name}, {"arguments", call.arguments}}}});
        }
    }
    if (message.role == ChatMessage::Role::Tool && !message.toolName.empty()) {
        j["tool_name"] = message.toolName;
    }
    return j;
}

domain::AIService::ChatMessage OllamaAdapter::FromWire(const json& message) {
    ChatMessage out;
    out.role = ChatMessage::Role::Assistant;
    if (message.contains("content") && message["content"].is_string()) {
        out.content = message["content"].get<std::string>();
    }
    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& raw : message["tool_calls"]) {
            if (!raw.contains("function") || !raw["function"].is_object()) continue;
            const auto& fn = raw["function"];
            ToolCall call;
            call.name = fn.value("name", "");
            if (fn.contains("arguments")) {
                const auto& args = fn["arguments"];
                if (args.is_string()) {
                    // Some models send the arguments as an encoded JSON string.
                    call.arguments = json::parse(args.get<std::string>(), nullptr, false);
                    if (call.arguments.is_discarded() || !call.arguments.is_object()) {
                        call.arguments = json::object();
                    }
                } else if (args.is_object()) {
                    call.arguments = args;
                }
            }
            if (!call.name.empty()) out.toolCalls.push_back(std::move(call));
        }
    }
    return out;
}

json OllamaAdapter::ToolsToWire(const std::vector<domain::ToolSpec>& tools) {
    json wire = json::array();
    for (const auto& tool : tools) {
        wire.push_back({
            {"type", "function"},
            {"function", {
                {"name", tool.name},
                {"description", tool.description},
                {"parameters", tool.inputSchema}
            }}
        });
    }
    return wire;
}

domain::Result<domain::AIService::ChatMessage> OllamaAdapter::chat(const std::vector<ChatMessage>& history,
                                                                 const std::vector<domain::ToolSpec>& tools) {
    json messages = json::array();
    for (const auto& msg : history) {
        messages.push_back(ToWire(msg));
    }

    auto response = m_client.chat(m_model, messages, ToolsToWire(tools));
    if (!response) {
        return response.error();
    }
    return FromWire(response.value());
}

std::string OllamaAdapter::getCurrentModel() const {
    return m_model;
}

} // namespace vaultbreakdown::infrastructure
