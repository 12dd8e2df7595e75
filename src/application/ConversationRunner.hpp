/**
 * @file ConversationRunner.hpp
 * @brief Host-side loop that applies a termination and retry policy to an Orchestrator.
 */

#pragma once
#include <string>
#include <functional>
#include "application/Orchestrator.hpp"

namespace roundtable::application {

/**
 * @struct RunOptions
 * @brief External stopping and retry rules for one conversation run.
 */
struct RunOptions {
    std::size_t maxTurns = 10;          ///< Turn budget for this run.
    std::size_t maxAttemptsPerTurn = 1; ///< advance() calls allowed per turn before giving up.
    std::string stopPhrase;             ///< Ends the run once an utterance contains it. Empty disables.
};

/**
 * @enum StopReason
 * @brief Why a run ended.
 */
enum class StopReason {
    TurnBudget,
    StopPhrase,
    OracleFailure
};

std::string StopReasonToString(StopReason reason);

/**
 * @struct RunReport
 * @brief Outcome of ConversationRunner::run.
 */
struct RunReport {
    std::size_t turnsCompleted = 0;
    std::size_t failedAttempts = 0;
    StopReason reason = StopReason::TurnBudget;
    std::string lastError;
};

/**
 * @class ConversationRunner
 * @brief Repeatedly advances an Orchestrator until the budget, a stop phrase or an unrecoverable failure.
 */
class ConversationRunner {
public:
    using TurnCallback = std::function<void(const TurnResult&)>;

    ConversationRunner(Orchestrator& orchestrator, RunOptions options);

    /**
     * @brief Runs the conversation.
     * @param onTurn Optional observer called after every completed turn.
     */
    RunReport run(TurnCallback onTurn = nullptr);

private:
    Orchestrator& m_orchestrator;
    RunOptions m_options;
};

} // namespace roundtable::application
