/**
 * @file Speaker.cpp
 * @brief Implementation of Speaker.
 */

#include "domain/Speaker.hpp"
#include "domain/OracleUnavailable.hpp"
#include <sstream>
#include <stdexcept>

namespace roundtable::domain {

Speaker::Speaker(std::string identity, std::string directive, std::shared_ptr<TextOracle> oracle)
    : m_identity(std::move(identity)),
      m_directive(std::move(directive)),
      m_oracle(std::move(oracle)) {
    if (m_identity.empty()) {
        throw std::invalid_argument("Speaker: Identity cannot be empty.");
    }
    if (!m_oracle) {
        throw std::invalid_argument("Speaker: Oracle is required for '" + m_identity + "'.");
    }
}

std::string Speaker::renderNarrative() const {
    std::stringstream ss;
    ss << kNarrativeHeader;
    for (const auto& entry : m_transcript) {
        ss << "\n" << entry.identity << ": " << entry.text;
    }
    return ss.str();
}

std::string Speaker::produce() const {
    std::string content = renderNarrative() + "\n" + m_identity + ":";

    std::optional<std::string> reply;
    try {
        reply = m_oracle->generate(m_directive, content);
    } catch (const std::exception& e) {
        throw OracleUnavailable(m_identity, e.what());
    }

    if (!reply) {
        throw OracleUnavailable(m_identity, "no response");
    }
    return *reply;
}

void Speaker::absorb(const std::string& identity, const std::string& text) {
    m_transcript.push_back({identity, text});
}

} // namespace roundtable::domain
