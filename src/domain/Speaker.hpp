/**
 * @file Speaker.hpp
 * @brief A persona taking part in a turn-based conversation.
 */

#pragma once
#include <string>
#include <vector>
#include <memory>
#include "domain/TranscriptEntry.hpp"
#include "domain/TextOracle.hpp"

namespace roundtable::domain {

/**
 * @class Speaker
 * @brief Holds a persona's identity, its fixed directive and a private view of the transcript.
 *
 * The transcript only grows through absorb(). produce() never records its own
 * output; the orchestrator broadcasts it back afterwards.
 */
class Speaker {
public:
    /** @brief Framing sentence that opens every rendered narrative. */
    static constexpr const char* kNarrativeHeader = "Here is the conversation so far.";

    /**
     * @param identity Display name, unique within a roster.
     * @param directive System-level instruction sent with every request.
     * @param oracle Backend used by produce(). Must not be null.
     */
    Speaker(std::string identity, std::string directive, std::shared_ptr<TextOracle> oracle);

    /**
     * @brief Asks the oracle for this speaker's next utterance.
     * @return The oracle's reply, verbatim.
     * @throws OracleUnavailable if the oracle returns nothing or throws.
     */
    std::string produce() const;

    /** @brief Appends an utterance to the private transcript. */
    void absorb(const std::string& identity, const std::string& text);

    /** @brief Flattens the transcript into the narrative block (without the turn cue). */
    std::string renderNarrative() const;

    const std::string& identity() const { return m_identity; }
    const std::string& directive() const { return m_directive; }
    const std::vector<TranscriptEntry>& transcript() const { return m_transcript; }

private:
    std::string m_identity;
    std::string m_directive;
    std::shared_ptr<TextOracle> m_oracle;
    std::vector<TranscriptEntry> m_transcript;
};

} // namespace roundtable::domain
