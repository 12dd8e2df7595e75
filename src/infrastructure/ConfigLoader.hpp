/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading conversation settings (roundtable.json).
 *
 * Keeps JSON parsing of the settings file in one place so the CLI only deals
 * with typed values.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "infrastructure/OllamaClient.hpp"

namespace roundtable::infrastructure {

/**
 * @struct SpeakerProfile
 * @brief Identity and directive for one roster member.
 */
struct SpeakerProfile {
    std::string identity;
    std::string directive;
};

/**
 * @enum SelectionPolicy
 * @brief Which SpeakerSelector the CLI should build.
 */
enum class SelectionPolicy {
    RoundRobin,
    SeededRandom
};

/**
 * @struct ConversationSettings
 * @brief Everything needed to run one conversation.
 */
struct ConversationSettings {
    OllamaSettings ollama;
    std::string initiator = "Narrator";
    std::string openingLine;
    std::size_t maxTurns = 10;
    std::size_t maxAttemptsPerTurn = 1;
    std::string stopPhrase;
    SelectionPolicy selection = SelectionPolicy::RoundRobin;
    std::uint32_t selectionSeed = 0;
    std::vector<SpeakerProfile> speakers;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param path Path to roundtable.json.
     * @return Parsed settings, or nullopt if the file is missing, malformed or incomplete.
     */
    static std::optional<ConversationSettings> Load(const std::string& path);

    /**
     * @brief Parses settings from an already-decoded JSON document.
     * @return nullopt (after logging the reason) if required keys are missing or invalid.
     */
    static std::optional<ConversationSettings> FromJson(const nlohmann::json& j);
};

} // namespace roundtable::infrastructure
