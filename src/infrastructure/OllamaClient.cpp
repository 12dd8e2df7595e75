#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace roundtable::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDefaultTopP = 1.0;
constexpr int kTagsTimeoutSeconds = 5;
}

OllamaClient::OllamaClient(OllamaSettings settings)
    : m_settings(std::move(settings)) {}

json OllamaClient::buildChatRequest(const std::string& model, const json& messages) const {
    return {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", m_settings.temperature},
            {"top_p", kDefaultTopP},
            {"seed", m_settings.seed}
        }}
    };
}

std::optional<std::string> OllamaClient::parseChatResponse(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (parsed.contains("message") && parsed["message"].contains("content") &&
            parsed["message"]["content"].is_string()) {
            return parsed["message"]["content"].get<std::string>();
        }
        std::cerr << "[OllamaClient] Chat response without message.content" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<std::string> OllamaClient::chat(const std::string& model, const json& messages) {
    httplib::Client cli(m_settings.host, m_settings.port);
    cli.set_read_timeout(m_settings.readTimeoutSeconds);

    auto res = cli.Post("/api/chat", buildChatRequest(model, messages).dump(), "application/json");
    if (res && res->status == 200) {
        return parseChatResponse(res->body);
    }

    if (res) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_settings.host, m_settings.port);
    cli.set_read_timeout(kTagsTimeoutSeconds);

    std::vector<std::string> models;
    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) {
        return models;
    }

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
        std::cerr << "[OllamaClient] Failed to parse model list: " << e.what() << std::endl;
    }
    return models;
}

} // namespace roundtable::infrastructure
