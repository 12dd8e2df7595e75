/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <system_error>

namespace roundtable::infrastructure {

using json = nlohmann::json;

namespace {

// Reads a non-negative integer that must fit in T. Missing keys keep outValue.
template <typename T>
bool ReadCount(const json& j, const char* key, const std::string& section, T& outValue) {
    if (!j.contains(key)) return true;

    const json& v = j.at(key);
    const std::string name = section + "." + key;
    if (!v.is_number_integer()) {
        std::cerr << "[ConfigLoader] " << name << " must be an integer." << std::endl;
        return false;
    }
    if (v.is_number_unsigned()) {
        auto raw = v.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            std::cerr << "[ConfigLoader] " << name << " is out of range." << std::endl;
            return false;
        }
        outValue = static_cast<T>(raw);
        return true;
    }

    auto raw = v.get<std::int64_t>();
    if (raw < 0) {
        std::cerr << "[ConfigLoader] " << name << " must be non-negative." << std::endl;
        return false;
    }
    if (static_cast<std::uint64_t>(raw) > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        std::cerr << "[ConfigLoader] " << name << " is out of range." << std::endl;
        return false;
    }
    outValue = static_cast<T>(raw);
    return true;
}

bool ReadOllama(const json& j, OllamaSettings& s) {
    if (!j.is_object()) return true;
    s.host = j.value("host", s.host);
    s.port = j.value("port", s.port);
    s.model = j.value("model", s.model);
    s.temperature = j.value("temperature", s.temperature);
    s.seed = j.value("seed", s.seed);
    return ReadCount(j, "read_timeout_seconds", "ollama", s.readTimeoutSeconds);
}

std::optional<SelectionPolicy> ParseSelection(const std::string& value) {
    if (value == "round_robin") return SelectionPolicy::RoundRobin;
    if (value == "seeded_random") return SelectionPolicy::SeededRandom;
    return std::nullopt;
}

} // namespace

std::optional<ConversationSettings> ConfigLoader::FromJson(const json& j) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Settings root must be a JSON object." << std::endl;
        return std::nullopt;
    }

    try {
        ConversationSettings settings;
        if (j.contains("ollama") && !ReadOllama(j["ollama"], settings.ollama)) {
            return std::nullopt;
        }

        const json conversation = j.contains("conversation") ? j.at("conversation") : json::object();
        settings.initiator = conversation.value("initiator", settings.initiator);
        settings.openingLine = conversation.value("opening_line", std::string());
        settings.stopPhrase = conversation.value("stop_phrase", std::string());
        if (!ReadCount(conversation, "max_turns", "conversation", settings.maxTurns) ||
            !ReadCount(conversation, "max_attempts_per_turn", "conversation", settings.maxAttemptsPerTurn) ||
            !ReadCount(conversation, "selection_seed", "conversation", settings.selectionSeed)) {
            return std::nullopt;
        }

        std::string selection = conversation.value("selection", std::string("round_robin"));
        auto policy = ParseSelection(selection);
        if (!policy) {
            std::cerr << "[ConfigLoader] Unknown selection policy: " << selection << std::endl;
            return std::nullopt;
        }
        settings.selection = *policy;

        if (settings.openingLine.empty()) {
            std::cerr << "[ConfigLoader] conversation.opening_line is required." << std::endl;
            return std::nullopt;
        }

        if (!j.contains("speakers") || !j["speakers"].is_array() || j["speakers"].empty()) {
            std::cerr << "[ConfigLoader] At least one entry in 'speakers' is required." << std::endl;
            return std::nullopt;
        }

        for (const auto& item : j["speakers"]) {
            SpeakerProfile profile;
            profile.identity = item.value("identity", std::string());
            profile.directive = item.value("directive", std::string());
            if (profile.identity.empty()) {
                std::cerr << "[ConfigLoader] Speaker entry without identity." << std::endl;
                return std::nullopt;
            }
            settings.speakers.push_back(std::move(profile));
        }

        return settings;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Invalid settings: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<ConversationSettings> ConfigLoader::Load(const std::string& path) {
    std::filesystem::path configPath(path);
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        std::cerr << "[ConfigLoader] Settings file not found: " << configPath;
        if (ec) {
            std::cerr << " (" << ec.message() << ")";
        }
        std::cerr << std::endl;
        return std::nullopt;
    }

    try {
        std::ifstream f(configPath);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath.filename() << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace roundtable::infrastructure
