/**
 * @file ConversationRunner.cpp
 * @brief Implementation of ConversationRunner.
 */

#include "application/ConversationRunner.hpp"
#include "domain/OracleUnavailable.hpp"
#include <algorithm>
#include <iostream>

namespace roundtable::application {

std::string StopReasonToString(StopReason reason) {
    switch (reason) {
        case StopReason::TurnBudget: return "turn budget reached";
        case StopReason::StopPhrase: return "stop phrase";
        case StopReason::OracleFailure: return "oracle failure";
    }
    return "unknown";
}

ConversationRunner::ConversationRunner(Orchestrator& orchestrator, RunOptions options)
    : m_orchestrator(orchestrator), m_options(std::move(options)) {
    m_options.maxAttemptsPerTurn = std::max<std::size_t>(m_options.maxAttemptsPerTurn, 1);
}

RunReport ConversationRunner::run(TurnCallback onTurn) {
    RunReport report;

    while (report.turnsCompleted < m_options.maxTurns) {
        bool completed = false;
        TurnResult result;

        for (std::size_t attempt = 1; attempt <= m_options.maxAttemptsPerTurn; ++attempt) {
            try {
                result = m_orchestrator.advance();
                completed = true;
                break;
            } catch (const domain::OracleUnavailable& e) {
                ++report.failedAttempts;
                report.lastError = e.what();
                std::cerr << "[ConversationRunner] Turn " << m_orchestrator.turnIndex()
                          << " attempt " << attempt << "/" << m_options.maxAttemptsPerTurn
                          << " failed: " << e.what() << std::endl;
            }
        }

        if (!completed) {
            report.reason = StopReason::OracleFailure;
            return report;
        }

        ++report.turnsCompleted;
        if (onTurn) {
            onTurn(result);
        }

        if (!m_options.stopPhrase.empty() &&
            result.text.find(m_options.stopPhrase) != std::string::npos) {
            report.reason = StopReason::StopPhrase;
            return report;
        }
    }

    report.reason = StopReason::TurnBudget;
    return report;
}

} // namespace roundtable::application
