/**
 * @file TextOracle.hpp
 * @brief Interface for external text-generation backends.
 */

#pragma once
#include <string>
#include <optional>

namespace roundtable::domain {

/**
 * @class TextOracle
 * @brief Abstract capability that turns a directive and a content block into one reply.
 *
 * Implementations may block on network I/O. An empty optional means the
 * oracle could not answer (transport, auth, rate limit, malformed response).
 */
class TextOracle {
public:
    virtual ~TextOracle() = default;

    /**
     * @brief Generates a reply.
     * @param directive System-level behavioral instruction.
     * @param content User content (the rendered conversation).
     * @return The raw reply, or nullopt if no reply could be produced.
     */
    virtual std::optional<std::string> generate(const std::string& directive,
                                                const std::string& content) = 0;
};

} // namespace roundtable::domain
