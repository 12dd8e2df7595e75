// Test double for domain::TextOracle
#pragma once
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/TextOracle.hpp"

namespace roundtable::test {

/**
 * Replays queued replies in order. std::nullopt entries simulate an
 * unavailable backend; once the queue is empty every call returns the fallback.
 */
class ScriptedOracle : public domain::TextOracle {
public:
    struct Call {
        std::string directive;
        std::string content;
    };

    void enqueue(std::optional<std::string> reply) { m_replies.push_back(std::move(reply)); }
    void setFallback(std::string fallback) { m_fallback = std::move(fallback); }
    void setThrowOnNextCall(bool value) { m_throwNext = value; }

    std::optional<std::string> generate(const std::string& directive,
                                        const std::string& content) override {
        m_calls.push_back({directive, content});
        if (m_throwNext) {
            m_throwNext = false;
            throw std::runtime_error("connection reset");
        }
        if (m_replies.empty()) {
            return m_fallback;
        }
        auto reply = m_replies.front();
        m_replies.pop_front();
        return reply;
    }

    const std::vector<Call>& calls() const { return m_calls; }

private:
    std::deque<std::optional<std::string>> m_replies;
    std::string m_fallback = "...";
    bool m_throwNext = false;
    std::vector<Call> m_calls;
};

} // namespace roundtable::test
