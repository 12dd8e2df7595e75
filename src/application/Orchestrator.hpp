/**
 * @file Orchestrator.hpp
 * @brief Drives turn-taking across a fixed roster of speakers.
 */

#pragma once
#include <string>
#include <vector>
#include <memory>
#include "domain/Speaker.hpp"
#include "domain/SpeakerSelector.hpp"
#include "domain/TranscriptEntry.hpp"

namespace roundtable::application {

/**
 * @struct TurnResult
 * @brief What a completed turn produced, handed back to the caller for display.
 */
struct TurnResult {
    std::string identity;
    std::string text;
};

/**
 * @class Orchestrator
 * @brief Owns the roster, the turn counter and the selection policy.
 *
 * After every completed turn all speakers hold identical transcripts. A turn
 * whose oracle call fails leaves every transcript and the turn counter untouched.
 */
class Orchestrator {
public:
    /**
     * @param roster Speakers in speaking order. Must be non-empty with unique identities.
     * @param selector Selection policy. Defaults to RoundRobinSelector when null.
     * @throws std::invalid_argument on an empty roster or duplicate identities.
     */
    explicit Orchestrator(std::vector<domain::Speaker> roster,
                          std::unique_ptr<domain::SpeakerSelector> selector = nullptr);

    /**
     * @brief Seeds every speaker with the opening utterance.
     *
     * Call exactly once before advance(). A second call appends the seed again.
     */
    void prime(const std::string& identity, const std::string& text);

    /**
     * @brief Resolves the roster index that speaks on the given turn.
     * @throws std::out_of_range if the policy returns an index outside the roster.
     */
    std::size_t selectSpeaker(std::size_t turnIndex) const;

    /**
     * @brief Runs one full turn: select, produce, broadcast, count.
     * @throws domain::OracleUnavailable unchanged from the speaker; state is untouched.
     */
    TurnResult advance();

    std::size_t turnIndex() const { return m_turnIndex; }
    std::size_t rosterSize() const { return m_roster.size(); }
    const std::vector<domain::Speaker>& roster() const { return m_roster; }
    bool isPrimed() const { return m_primed; }

    /** @brief The shared history (every speaker's transcript is identical). */
    const std::vector<domain::TranscriptEntry>& history() const;

private:
    std::vector<domain::Speaker> m_roster;
    std::unique_ptr<domain::SpeakerSelector> m_selector;
    std::size_t m_turnIndex = 0;
    bool m_primed = false;
};

} // namespace roundtable::application
