#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace vaultbreakdown::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

domain::Result<json> OllamaClient::chat(const std::string& model,
                                        const json& messages,
                                        const json& tools) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(600); // 10 min

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (tools.is_array() && !tools.empty()) {
        requestData["tools"] = tools;
    }

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res) {
        std::cerr << "[OllamaClient] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        return domain::Result<json>::Fail(domain::ErrorKind::Transport,
                                          "cannot reach Ollama at " + endpoint() + ": " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        return domain::Result<json>::Fail(domain::ErrorKind::Transport,
                                          "HTTP " + std::to_string(res->status) + " from /api/chat: " + res->body);
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("message") && body["message"].is_object()) {
            return body["message"];
        }
        return domain::Result<json>::Fail(domain::ErrorKind::Transport, "response has no message object");
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
        return domain::Result<json>::Fail(domain::ErrorKind::Transport,
                                          std::string("unparseable /api/chat response: ") + e.what());
    }
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Error parsing /api/tags: " << e.what() << std::endl;
        }
    } else {
        std::cerr << "[OllamaClient] Failed to list models at " << endpoint() << std::endl;
    }
    return models;
}

} // namespace vaultbreakdown::infrastructure
