#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>
#include "application/Orchestrator.hpp"
#include "domain/OracleUnavailable.hpp"
#include "test/ScriptedOracle.hpp"

using namespace roundtable;
using roundtable::test::ScriptedOracle;

namespace {

using History = std::vector<domain::TranscriptEntry>;

void assertConverged(const application::Orchestrator& orch, const History& expected) {
    for (const auto& speaker : orch.roster()) {
        assert(speaker.transcript() == expected);
    }
    assert(orch.history() == expected);
}

std::vector<domain::Speaker> MakeRoster(const std::vector<std::string>& names,
                                        const std::shared_ptr<ScriptedOracle>& oracle) {
    std::vector<domain::Speaker> roster;
    for (const auto& name : names) {
        roster.emplace_back(name, "You are " + name + ".", oracle);
    }
    return roster;
}

/** Always picks the same index, valid or not. */
class FixedSelector : public domain::SpeakerSelector {
public:
    explicit FixedSelector(std::size_t index) : m_index(index) {}
    std::size_t select(std::size_t, std::size_t, const History&) const override { return m_index; }

private:
    std::size_t m_index;
};

} // namespace

static void testNarratorHeroScenario() {
    auto oracle = std::make_shared<ScriptedOracle>();
    oracle->enqueue(std::string("I go north."));
    oracle->enqueue(std::string("The road forks."));

    application::Orchestrator orch(MakeRoster({"N", "H"}, oracle));
    assert(!orch.isPrimed());
    orch.prime("N", "Begin the quest.");
    assert(orch.isPrimed());

    auto first = orch.advance();
    assert(first.identity == "H");
    assert(first.text == "I go north.");
    assertConverged(orch, {{"N", "Begin the quest."}, {"H", "I go north."}});

    // The hero was prompted with its own cue.
    assert(oracle->calls()[0].directive == "You are H.");
    assert(oracle->calls()[0].content == "Here is the conversation so far.\nN: Begin the quest.\nH:");

    auto second = orch.advance();
    assert(second.identity == "N");
    assertConverged(orch, {{"N", "Begin the quest."}, {"H", "I go north."}, {"N", "The road forks."}});
    assert(oracle->calls()[1].content ==
           "Here is the conversation so far.\nN: Begin the quest.\nH: I go north.\nN:");
}

static void testRoundRobinOrder() {
    auto oracle = std::make_shared<ScriptedOracle>();
    application::Orchestrator orch(MakeRoster({"A", "B"}, oracle));
    assert(orch.rosterSize() == 2);
    orch.prime("Narrator", "seed");

    assert(orch.selectSpeaker(0) == 1);
    assert(orch.selectSpeaker(1) == 0);
    assert(orch.selectSpeaker(2) == 1);

    assert(orch.advance().identity == "B");
    assert(orch.advance().identity == "A");
    assert(orch.advance().identity == "B");
}

static void testConvergenceAcrossRosterSizes() {
    for (std::size_t size = 1; size <= 4; ++size) {
        std::vector<std::string> names;
        for (std::size_t i = 0; i < size; ++i) {
            names.push_back("S" + std::to_string(i));
        }

        auto oracle = std::make_shared<ScriptedOracle>();
        application::Orchestrator orch(MakeRoster(names, oracle));
        orch.prime("Initiator", "Hello.");

        History expected = {{"Initiator", "Hello."}};
        for (std::size_t turn = 0; turn < 7; ++turn) {
            std::string reply = "reply " + std::to_string(turn);
            oracle->enqueue(reply);
            auto result = orch.advance();
            assert(result.identity == names[(turn + 1) % size]);
            expected.push_back({result.identity, reply});
            assertConverged(orch, expected);
            assert(orch.turnIndex() == turn + 1);
        }
    }
}

static void testFailedTurnIsAtomic() {
    auto oracle = std::make_shared<ScriptedOracle>();
    oracle->enqueue(std::string("ok"));
    oracle->enqueue(std::nullopt);

    application::Orchestrator orch(MakeRoster({"A", "B", "C"}, oracle));
    orch.prime("N", "seed");
    assert(orch.turnIndex() == 0);

    orch.advance();
    assert(orch.turnIndex() == 1);
    History before = orch.history();

    bool thrown = false;
    try {
        orch.advance();
    } catch (const domain::OracleUnavailable& e) {
        thrown = true;
        assert(e.identity() == "C");
    }
    assert(thrown);
    assert(orch.turnIndex() == 1);
    assertConverged(orch, before);

    // Retrying the same turn goes to the same speaker.
    oracle->enqueue(std::string("recovered"));
    auto result = orch.advance();
    assert(result.identity == "C");
    assert(orch.turnIndex() == 2);
    assert(orch.history().back().text == "recovered");
    assert(orch.history().size() == before.size() + 1);
}

static void testPrimeTwiceDoubleSeeds() {
    auto oracle = std::make_shared<ScriptedOracle>();
    application::Orchestrator orch(MakeRoster({"A", "B"}, oracle));
    orch.prime("N", "seed");
    orch.prime("N", "seed");
    assertConverged(orch, {{"N", "seed"}, {"N", "seed"}});
}

static void testRosterValidation() {
    auto oracle = std::make_shared<ScriptedOracle>();

    bool thrown = false;
    try {
        application::Orchestrator orch(std::vector<domain::Speaker>{});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        application::Orchestrator orch(MakeRoster({"A", "B", "A"}, oracle));
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
}

static void testCustomSelectorAndOutOfRange() {
    auto oracle = std::make_shared<ScriptedOracle>();
    application::Orchestrator fixed(MakeRoster({"A", "B", "C"}, oracle), std::make_unique<FixedSelector>(2));
    fixed.prime("N", "seed");
    assert(fixed.advance().identity == "C");
    assert(fixed.advance().identity == "C");

    application::Orchestrator broken(MakeRoster({"A", "B"}, oracle), std::make_unique<FixedSelector>(5));
    broken.prime("N", "seed");
    bool thrown = false;
    try {
        broken.advance();
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
    assert(broken.turnIndex() == 0);
    assertConverged(broken, {{"N", "seed"}});
}

int main() {
    std::cout << "[Test] Starting Orchestrator Test..." << std::endl;

    testNarratorHeroScenario();
    testRoundRobinOrder();
    testConvergenceAcrossRosterSizes();
    testFailedTurnIsAtomic();
    testPrimeTwiceDoubleSeeds();
    testRosterValidation();
    testCustomSelectorAndOutOfRange();

    std::cout << "[PASS] Orchestrator Test." << std::endl;
    return 0;
}
