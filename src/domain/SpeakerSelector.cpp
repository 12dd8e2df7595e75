#include "domain/SpeakerSelector.hpp"
#include <random>

namespace roundtable::domain {

std::size_t RoundRobinSelector::select(std::size_t turnIndex,
                                       std::size_t rosterSize,
                                       const std::vector<TranscriptEntry>& history) const {
    (void)history;
    return (turnIndex + 1) % rosterSize;
}

std::size_t SeededRandomSelector::select(std::size_t turnIndex,
                                         std::size_t rosterSize,
                                         const std::vector<TranscriptEntry>& history) const {
    (void)history;
    // Fresh engine per call keeps the result a function of (seed, turn) only.
    std::seed_seq seq{m_seed,
                      static_cast<std::uint32_t>(turnIndex & 0xFFFFFFFFu),
                      static_cast<std::uint32_t>((static_cast<std::uint64_t>(turnIndex) >> 32) & 0xFFFFFFFFu)};
    std::mt19937 engine(seq);
    return static_cast<std::size_t>(engine() % rosterSize);
}

} // namespace roundtable::domain
