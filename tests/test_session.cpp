#include <doctest/doctest.h>

#include "content_loader.h"
#include "decision_policy.h"
#include "simulation_runner.h"
#include "simulation_session.h"

#include <limits>
#include <memory>
#include <string>
#include <vector>

#ifndef AQUASIM_DATA_DIR
#define AQUASIM_DATA_DIR "data"
#endif

namespace {

EventRecord tideEvent() {
    EventRecord e;
    e.id = "tide";
    e.name = "Rising Tide";
    e.minTick = 0;
    e.maxTick = std::numeric_limits<int>::max();
    e.effects.pollution = 2;
    return e;
}

EventRecord voteEvent() {
    EventRecord e;
    e.id = "vote";
    e.name = "Harbor Vote";
    e.kind = EventKind::Interactive;
    e.minTick = 0;
    e.maxTick = std::numeric_limits<int>::max();
    EventChoice ban{"Ban", {}};
    ban.effects.trust = -5;
    EventChoice ignore{"Ignore", {}};
    ignore.effects.pollution = 3;
    e.choices = {ban, ignore};
    return e;
}

ContentCatalog decreeCatalog(std::vector<EventRecord> events) {
    ContentCatalog catalog;
    catalog.events = std::move(events);

    ActionRecord cleanup;
    cleanup.id = "cleanup";
    cleanup.name = "Community Cleanup";
    cleanup.cost = 10;
    cleanup.effects.pollution = -1;
    cleanup.repeatable = true;

    ActionRecord ban;
    ban.id = "ban";
    ban.name = "Bag Ban";
    ban.cost = 30;
    ban.effects.treasury = 5;
    ban.effects.growthRate = -0.5;

    ActionRecord grand;
    grand.id = "grand";
    grand.name = "Grand Treaty";
    grand.unlockTick = 1000;

    catalog.actions = {cleanup, ban, grand};
    return catalog;
}

// Zero base growth keeps pollution flat so treasury arithmetic is easy to follow:
// 20 income * 1.0 (vitality 80) * 0.9 (trust 60) = 18 per year.
std::unique_ptr<SimulationSession> makeSession(ContentCatalog catalog, std::uint64_t seed = 11) {
    SimulationContext ctx(seed, "");
    ctx.config.ocean.baseGrowth = 0.0;
    return std::make_unique<SimulationSession>(std::move(ctx), std::move(catalog));
}

} // namespace

TEST_CASE("Session: phases must be called in order") {
    auto session = makeSession(decreeCatalog({tideEvent()}));
    const std::uint64_t before = computeStateHash(session->state());
    std::string err;

    CHECK_FALSE(session->advanceGeneration(&err));
    CHECK(err.find("advanceGeneration") != std::string::npos);
    CHECK_FALSE(session->offerActions(&err));
    CHECK_FALSE(session->chooseAction(0, &err));
    CHECK_FALSE(session->resolveEventChoice(0, &err));
    CHECK(computeStateHash(session->state()) == before);
    CHECK(session->phase() == TurnPhase::AwaitingTurn);

    REQUIRE(session->beginTurn(&err));
    CHECK_FALSE(session->beginTurn(&err));
    CHECK(session->phase() == TurnPhase::AwaitingDrift);
}

TEST_CASE("Session: a full turn applies event, drift, cost and effects in order") {
    auto session = makeSession(decreeCatalog({tideEvent()}));
    std::string err;

    REQUIRE(session->beginTurn(&err));
    CHECK(session->state().pollution == 12);
    CHECK(session->state().lastEvent == "Rising Tide");
    CHECK(session->state().lastEventChoice == kAutomaticEventChoice);

    REQUIRE(session->advanceGeneration(&err));
    CHECK(session->state().tick == 5);
    CHECK(session->lastDrift().size() == 5);
    CHECK(session->state().treasury == 190);

    REQUIRE(session->offerActions(&err));
    REQUIRE(session->currentOffers().size() == 2);
    CHECK(session->currentOffers()[0]->id == "cleanup");
    CHECK(session->currentOffers()[1]->id == "ban");

    REQUIRE(session->chooseAction(1, &err));
    const WorldState& s = session->state();
    CHECK(s.treasury == 165);
    CHECK(s.growthModifier == doctest::Approx(-0.5));
    CHECK(s.lastAction == "Bag Ban");
    CHECK(s.lastActionEffects.treasury == 5);
    CHECK(s.usedActionIds.count("ban") == 1);
    CHECK(session->turnIndex() == 1);
    CHECK(session->phase() == TurnPhase::AwaitingTurn);
}

TEST_CASE("Session: non-repeatable actions are offered once, repeatable ones again") {
    auto session = makeSession(decreeCatalog({tideEvent()}));
    std::string err;

    auto playTurn = [&](int pick) {
        REQUIRE(session->beginTurn(&err));
        REQUIRE(session->advanceGeneration(&err));
        REQUIRE(session->offerActions(&err));
        REQUIRE(session->chooseAction(pick, &err));
    };

    playTurn(1); // ban
    REQUIRE(session->beginTurn(&err));
    REQUIRE(session->advanceGeneration(&err));
    REQUIRE(session->offerActions(&err));
    REQUIRE(session->currentOffers().size() == 1);
    CHECK(session->currentOffers()[0]->id == "cleanup");
    REQUIRE(session->chooseAction(0, &err));
    CHECK(session->state().usedActionIds.count("cleanup") == 0);

    playTurn(0); // cleanup again
    CHECK(session->lastChosenAction()->id == "cleanup");
    CHECK(session->state().usedActionIds.size() == 1);
}

TEST_CASE("Session: out-of-range selections are rejected without mutation") {
    auto session = makeSession(decreeCatalog({tideEvent()}));
    std::string err;
    REQUIRE(session->beginTurn(&err));
    REQUIRE(session->advanceGeneration(&err));
    REQUIRE(session->offerActions(&err));
    const std::uint64_t before = computeStateHash(session->state());

    CHECK_FALSE(session->chooseAction(3, &err));
    CHECK_FALSE(err.empty());
    CHECK_FALSE(session->chooseAction(-1, &err));
    CHECK(computeStateHash(session->state()) == before);
    CHECK(session->phase() == TurnPhase::AwaitingActionChoice);

    // Index == offer count is the wait slot.
    REQUIRE(session->chooseAction(2, &err));
    CHECK(computeStateHash(session->state()) == before);
    CHECK(session->lastChosenAction() == nullptr);
}

TEST_CASE("Session: an offer that became unaffordable is rejected") {
    auto session = makeSession(decreeCatalog({tideEvent()}));
    std::string err;
    REQUIRE(session->beginTurn(&err));
    REQUIRE(session->advanceGeneration(&err));
    REQUIRE(session->offerActions(&err));

    session->mutableState().treasury = 0;
    const std::uint64_t before = computeStateHash(session->state());
    CHECK_FALSE(session->chooseAction(1, &err));
    CHECK(err.find("ban") != std::string::npos);
    CHECK(computeStateHash(session->state()) == before);
    CHECK(session->waitAndObserve(&err));
}

TEST_CASE("Session: interactive events wait for a branch") {
    auto session = makeSession(decreeCatalog({voteEvent()}));
    std::string err;
    const std::uint64_t before = computeStateHash(session->state());

    REQUIRE(session->beginTurn(&err));
    CHECK(session->phase() == TurnPhase::AwaitingEventChoice);
    CHECK(computeStateHash(session->state()) == before);
    CHECK_FALSE(session->advanceGeneration(&err));

    CHECK_FALSE(session->resolveEventChoice(2, &err));
    CHECK_FALSE(session->resolveEventChoice(-1, &err));
    CHECK(computeStateHash(session->state()) == before);

    REQUIRE(session->resolveEventChoice(0, &err));
    CHECK(session->state().trust == 55);
    CHECK(session->state().lastEvent == "Harbor Vote");
    CHECK(session->state().lastEventChoice == "Ban");
    CHECK(session->phase() == TurnPhase::AwaitingDrift);
}

TEST_CASE("Session: a turn without eligible events skips to drift") {
    auto session = makeSession(decreeCatalog({}));
    std::string err;
    REQUIRE(session->beginTurn(&err));
    CHECK(session->currentEvent() == nullptr);
    CHECK(session->state().lastEvent.empty());
    CHECK(session->phase() == TurnPhase::AwaitingDrift);
}

TEST_CASE("Session: terminal states refuse new turns") {
    auto session = makeSession(decreeCatalog({tideEvent()}));
    session->mutableState().vitality = 0;
    std::string err;
    CHECK_FALSE(session->beginTurn(&err));
    CHECK(err.find("collapse") != std::string::npos);
    CHECK(session->phase() == TurnPhase::Finished);

    SimulationContext ctx(1, "");
    ctx.config.ocean.startTrust = 0;
    SimulationSession dead(std::move(ctx), decreeCatalog({}));
    CHECK(dead.phase() == TurnPhase::Finished);
    CHECK(dead.checkEnding() == Ending::Uprising);
}

TEST_CASE("Runner: planned turns cover the configured horizon") {
    SimulationConfig config;
    CHECK(plannedTurns(config) == 30);
    config.world.endTick = 151;
    CHECK(plannedTurns(config) == 31);
    config.world.endTick = 0;
    CHECK(plannedTurns(config) == 1);
}

TEST_CASE("Runner: a session stops at the first terminal ending") {
    EventRecord plague = tideEvent();
    plague.effects = EffectBundle{};
    plague.effects.vitality = -100;
    auto session = makeSession(decreeCatalog({plague}));

    WaitPolicy policy;
    std::vector<TurnReport> reports;
    std::string err;
    REQUIRE(runSession(*session, policy, 10, reports, &err));
    REQUIRE(reports.size() == 1);
    CHECK(reports[0].ending == Ending::Collapse);
    CHECK(reports[0].eventChoice == kAutomaticEventChoice);
    CHECK(reports[0].actionId.empty());
    CHECK(session->phase() == TurnPhase::Finished);
}

TEST_CASE("Runner: a rejected policy choice aborts the session") {
    auto session = makeSession(decreeCatalog({tideEvent()}));
    ScriptedPolicy policy({}, {99});
    std::vector<TurnReport> reports;
    std::string err;
    CHECK_FALSE(runSession(*session, policy, 3, reports, &err));
    CHECK(err.find("chooseAction") != std::string::npos);
    CHECK(reports.empty());
}

TEST_CASE("Runner: scripted choices are reported per turn") {
    auto session = makeSession(decreeCatalog({voteEvent()}));
    ScriptedPolicy policy({1, 0}, {0, 2});
    std::vector<TurnReport> reports;
    REQUIRE(runSession(*session, policy, 2, reports));
    REQUIRE(reports.size() == 2);

    CHECK(reports[0].eventId == "vote");
    CHECK(reports[0].eventInteractive);
    CHECK(reports[0].eventChoice == "Ignore");
    CHECK(reports[0].actionId == "cleanup");
    CHECK(reports[0].startTick == 0);
    CHECK(reports[0].endTick == 5);

    CHECK(reports[1].eventChoice == "Ban");
    CHECK(reports[1].actionId.empty()); // index 2 of two offers is the wait slot
    CHECK(reports[1].offeredActionIds.size() == 2);
}

TEST_CASE("Runner: the same seed reproduces a whole run") {
    ContentCatalog catalog;
    std::string err;
    REQUIRE_MESSAGE(loadContentCatalog(AQUASIM_DATA_DIR, catalog, &err), err);

    auto play = [&](std::uint64_t seed) {
        SimulationSession session(SimulationContext(seed, ""), catalog);
        SeededRandomPolicy policy(session.context());
        std::vector<TurnReport> reports;
        std::string runErr;
        REQUIRE_MESSAGE(runSession(session, policy, plannedTurns(session.config()), reports, &runErr), runErr);
        return reports;
    };

    const std::vector<TurnReport> first = play(2024);
    const std::vector<TurnReport> second = play(2024);
    REQUIRE(!first.empty());
    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        CHECK(first[i].stateHash == second[i].stateHash);
        CHECK(first[i].eventId == second[i].eventId);
        CHECK(first[i].offeredActionIds == second[i].offeredActionIds);
        CHECK(first[i].actionId == second[i].actionId);
        CHECK(checkStateInvariants(first[i].state));
        CHECK(first[i].offeredActionIds.size() <= 5);
    }
}

TEST_CASE("Runner: a rejected pick leaves the session resumable") {
    auto session = makeSession(decreeCatalog({tideEvent()}));
    ScriptedPolicy policy({}, {99});
    std::vector<TurnReport> reports;
    std::string err;
    REQUIRE_FALSE(runSession(*session, policy, 1, reports, &err));
    CHECK(session->phase() == TurnPhase::AwaitingActionChoice);

    REQUIRE(session->chooseAction(0, &err));
    CHECK(session->lastChosenAction()->id == "cleanup");
    CHECK(session->phase() == TurnPhase::AwaitingTurn);
    CHECK(session->turnIndex() == 1);
}
