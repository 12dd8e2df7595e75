/**
 * @file SpeakerSelector.hpp
 * @brief Policies deciding who speaks on a given turn.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "domain/TranscriptEntry.hpp"

namespace roundtable::domain {

/**
 * @class SpeakerSelector
 * @brief Maps the current turn (and optionally the history) to a roster index.
 *
 * Implementations must be deterministic and return a value in [0, rosterSize).
 */
class SpeakerSelector {
public:
    virtual ~SpeakerSelector() = default;

    /**
     * @param turnIndex Number of turns completed so far.
     * @param rosterSize Number of speakers (always >= 1).
     * @param history Shared transcript, seed included.
     */
    virtual std::size_t select(std::size_t turnIndex,
                               std::size_t rosterSize,
                               const std::vector<TranscriptEntry>& history) const = 0;
};

/**
 * @class RoundRobinSelector
 * @brief Default policy: (turnIndex + 1) mod rosterSize.
 *
 * The offset lets roster[0] open via prime() and roster[1] answer first.
 */
class RoundRobinSelector : public SpeakerSelector {
public:
    std::size_t select(std::size_t turnIndex,
                       std::size_t rosterSize,
                       const std::vector<TranscriptEntry>& history) const override;
};

/**
 * @class SeededRandomSelector
 * @brief Pseudo-random policy, reproducible for a given seed and turn.
 */
class SeededRandomSelector : public SpeakerSelector {
public:
    explicit SeededRandomSelector(std::uint32_t seed) : m_seed(seed) {}

    std::size_t select(std::size_t turnIndex,
                       std::size_t rosterSize,
                       const std::vector<TranscriptEntry>& history) const override;

    std::uint32_t seed() const { return m_seed; }

private:
    std::uint32_t m_seed;
};

} // namespace roundtable::domain
