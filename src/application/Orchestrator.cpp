/**
 * @file Orchestrator.cpp
 * @brief Implementation of Orchestrator.
 */

#include "application/Orchestrator.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace roundtable::application {

Orchestrator::Orchestrator(std::vector<domain::Speaker> roster,
                           std::unique_ptr<domain::SpeakerSelector> selector)
    : m_roster(std::move(roster)), m_selector(std::move(selector)) {
    if (m_roster.empty()) {
        throw std::invalid_argument("Orchestrator: Roster cannot be empty.");
    }

    std::unordered_set<std::string> seen;
    for (const auto& speaker : m_roster) {
        if (!seen.insert(speaker.identity()).second) {
            throw std::invalid_argument("Orchestrator: Duplicate speaker identity '" + speaker.identity() + "'.");
        }
    }

    if (!m_selector) {
        m_selector = std::make_unique<domain::RoundRobinSelector>();
    }
}

void Orchestrator::prime(const std::string& identity, const std::string& text) {
    if (m_primed) {
        std::cerr << "[Orchestrator] prime() called again; seed will appear twice in every transcript." << std::endl;
    }
    for (auto& speaker : m_roster) {
        speaker.absorb(identity, text);
    }
    m_primed = true;
}

std::size_t Orchestrator::selectSpeaker(std::size_t turnIndex) const {
    std::size_t index = m_selector->select(turnIndex, m_roster.size(), history());
    if (index >= m_roster.size()) {
        throw std::out_of_range("Orchestrator: Selection policy returned index " + std::to_string(index) +
                                " for a roster of " + std::to_string(m_roster.size()) + ".");
    }
    return index;
}

TurnResult Orchestrator::advance() {
    const domain::Speaker& speaker = m_roster[selectSpeaker(m_turnIndex)];

    // Throws before any absorb; nothing to roll back.
    std::string text = speaker.produce();

    TurnResult result{speaker.identity(), std::move(text)};
    for (auto& member : m_roster) {
        member.absorb(result.identity, result.text);
    }
    ++m_turnIndex;
    return result;
}

const std::vector<domain::TranscriptEntry>& Orchestrator::history() const {
    return m_roster.front().transcript();
}

} // namespace roundtable::application
