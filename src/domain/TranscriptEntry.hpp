/**
 * @file TranscriptEntry.hpp
 * @brief A single attributed utterance in a conversation transcript.
 */

#pragma once
#include <string>

namespace roundtable::domain {

/**
 * @struct TranscriptEntry
 * @brief Pairs the identity of a speaker with the text it uttered.
 */
struct TranscriptEntry {
    std::string identity;
    std::string text;

    bool operator==(const TranscriptEntry& other) const {
        return identity == other.identity && text == other.text;
    }

    bool operator!=(const TranscriptEntry& other) const {
        return !(*this == other);
    }
};

} // namespace roundtable::domain
