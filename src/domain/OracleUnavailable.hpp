/**
 * @file OracleUnavailable.hpp
 * @brief Error raised when a speaker's oracle fails to produce an utterance.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace roundtable::domain {

class OracleUnavailable : public std::runtime_error {
public:
    OracleUnavailable(const std::string& identity, const std::string& reason)
        : std::runtime_error("Oracle unavailable for speaker '" + identity + "': " + reason),
          m_identity(identity) {}

    /** @brief Identity of the speaker whose turn failed. */
    const std::string& identity() const { return m_identity; }

private:
    std::string m_identity;
};

} // namespace roundtable::domain
