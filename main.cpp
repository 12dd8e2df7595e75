#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/ConversationRunner.hpp"
#include "application/Orchestrator.hpp"
#include "domain/Speaker.hpp"
#include "domain/SpeakerSelector.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OllamaOracle.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace roundtable;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitOracleFailure = 2;

std::unique_ptr<domain::SpeakerSelector> MakeSelector(const infrastructure::ConversationSettings& settings) {
    switch (settings.selection) {
        case infrastructure::SelectionPolicy::SeededRandom:
            return std::make_unique<domain::SeededRandomSelector>(settings.selectionSeed);
        case infrastructure::SelectionPolicy::RoundRobin:
            break;
    }
    return std::make_unique<domain::RoundRobinSelector>();
}

} // namespace

int main(int argc, char** argv) {
    std::string settingsPath = argc > 1
        ? std::string(argv[1])
        : infrastructure::PathUtils::GetDefaultSettingsPath().string();

    auto settings = infrastructure::ConfigLoader::Load(settingsPath);
    if (!settings) {
        std::cerr << "Usage: " << argv[0] << " [settings.json]" << std::endl;
        return kExitConfigError;
    }

    auto oracle = std::make_shared<infrastructure::OllamaOracle>(settings->ollama);
    oracle->initialize();

    std::unique_ptr<application::Orchestrator> orchestrator;
    try {
        std::vector<domain::Speaker> roster;
        roster.reserve(settings->speakers.size());
        for (const auto& profile : settings->speakers) {
            roster.emplace_back(profile.identity, profile.directive, oracle);
        }
        orchestrator = std::make_unique<application::Orchestrator>(std::move(roster), MakeSelector(*settings));
    } catch (const std::invalid_argument& e) {
        std::cerr << "[RoundTable] Invalid roster: " << e.what() << std::endl;
        return kExitConfigError;
    }

    orchestrator->prime(settings->initiator, settings->openingLine);
    std::cout << settings->initiator << ": " << settings->openingLine << "\n" << std::endl;

    application::RunOptions options;
    options.maxTurns = settings->maxTurns;
    options.maxAttemptsPerTurn = settings->maxAttemptsPerTurn;
    options.stopPhrase = settings->stopPhrase;

    application::ConversationRunner runner(*orchestrator, options);
    auto report = runner.run([](const application::TurnResult& turn) {
        std::cout << turn.identity << ": " << turn.text << "\n" << std::endl;
    });

    std::cout << "[RoundTable] " << report.turnsCompleted << " turn(s) completed, stopped by "
              << application::StopReasonToString(report.reason) << "." << std::endl;

    if (report.reason == application::StopReason::OracleFailure) {
        std::cerr << "[RoundTable] " << report.lastError << std::endl;
        return kExitOracleFailure;
    }
    return kExitOk;
}
