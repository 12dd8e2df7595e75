/**
 * @file OllamaOracle.cpp
 * @brief Implementation of the OllamaOracle class.
 */
#include "infrastructure/OllamaOracle.hpp"
#include <iostream>

namespace roundtable::infrastructure {

namespace {
constexpr const char* kFallbackModel = "qwen2.5:7b";
}

OllamaOracle::OllamaOracle(OllamaSettings settings)
    : m_client(settings), m_model(settings.model) {}

std::optional<std::string> OllamaOracle::ChooseModel(const std::vector<std::string>& available) {
    if (available.empty()) {
        return std::nullopt;
    }

    // Priority Hierarchy
    const std::vector<std::string> priorities = {
        "qwen2.5",
        "llama3",
        "mistral",
        "gemma"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : available) {
            if (model.find(priority) != std::string::npos) {
                return model;
            }
        }
    }
    return available.front();
}

void OllamaOracle::initialize() {
    if (!m_model.empty()) {
        return;
    }

    auto chosen = ChooseModel(m_client.getAvailableModels());
    if (chosen) {
        m_model = *chosen;
        std::cout << "[OllamaOracle] Auto-selected model: " << m_model << std::endl;
    } else {
        m_model = kFallbackModel;
        std::cerr << "[OllamaOracle] Failed to list models. Is Ollama running? Using default: " << m_model << std::endl;
    }
}

std::optional<std::string> OllamaOracle::generate(const std::string& directive,
                                                  const std::string& content) {
    if (m_model.empty()) {
        initialize();
    }

    nlohmann::json messages = nlohmann::json::array({
        {{"role", "system"}, {"content", directive}},
        {{"role", "user"}, {"content", content}}
    });
    return m_client.chat(m_model, messages);
}

} // namespace roundtable::infrastructure
