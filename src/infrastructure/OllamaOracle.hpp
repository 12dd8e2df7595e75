/**
 * @file OllamaOracle.hpp
 * @brief TextOracle backed by a local Ollama server.
 */

#pragma once
#include "domain/TextOracle.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace roundtable::infrastructure {

/**
 * @class OllamaOracle
 * @brief Sends the directive as a system message and the content as a user message.
 */
class OllamaOracle : public domain::TextOracle {
public:
    explicit OllamaOracle(OllamaSettings settings);

    /** @brief Picks a model from /api/tags when none was configured. */
    void initialize();

    std::optional<std::string> generate(const std::string& directive,
                                        const std::string& content) override;

    const std::string& model() const { return m_model; }

    /** @brief Returns the preferred model from the list, or the first one. */
    static std::optional<std::string> ChooseModel(const std::vector<std::string>& available);

private:
    OllamaClient m_client;
    std::string m_model;
};

} // namespace roundtable::infrastructure
