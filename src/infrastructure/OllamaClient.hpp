/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace roundtable::infrastructure {

/**
 * @struct OllamaSettings
 * @brief Connection and sampling options shared by every request.
 */
struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model;             ///< Empty means auto-detect.
    int readTimeoutSeconds = 600;
    double temperature = 0.0;
    int seed = 42;
};

class OllamaClient {
public:
    explicit OllamaClient(OllamaSettings settings = {});

    /** @brief Sends a non-streaming POST request to /api/chat. */
    std::optional<std::string> chat(const std::string& model,
                                    const nlohmann::json& messages);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    const OllamaSettings& settings() const { return m_settings; }

    /** @brief Builds the /api/chat body. Exposed for tests. */
    nlohmann::json buildChatRequest(const std::string& model, const nlohmann::json& messages) const;

    /** @brief Extracts message.content from an /api/chat response body. */
    static std::optional<std::string> parseChatResponse(const std::string& body);

private:
    OllamaSettings m_settings;
};

} // namespace roundtable::infrastructure
