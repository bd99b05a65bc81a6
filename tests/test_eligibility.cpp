#include <doctest/doctest.h>

#include "eligibility.h"
#include "simulation_context.h"

#include <algorithm>
#include <set>
#include <string>

namespace {

EventRecord makeEvent(const std::string& id, int minTick, int maxTick, int weight,
                      EventKind kind = EventKind::Automatic) {
    EventRecord e;
    e.id = id;
    e.name = id;
    e.minTick = minTick;
    e.maxTick = maxTick;
    e.weight = weight;
    e.kind = kind;
    if (kind == EventKind::Interactive) {
        e.choices.push_back(EventChoice{"Act", {}});
    }
    return e;
}

ActionRecord makeAction(const std::string& id, int unlockTick = 0, int minTrust = 0, int cost = 0) {
    ActionRecord a;
    a.id = id;
    a.name = id;
    a.unlockTick = unlockTick;
    a.minTrust = minTrust;
    a.cost = cost;
    return a;
}

WorldState richState() {
    WorldState s;
    s.tick = 50;
    s.treasury = 1000;
    s.pollution = 20;
    s.vitality = 80;
    s.trust = 70;
    s.incomeBase = 20;
    return s;
}

std::vector<std::string> ids(const std::vector<const ActionRecord*>& offers) {
    std::vector<std::string> out;
    for (const ActionRecord* a : offers) out.push_back(a->id);
    return out;
}

} // namespace

TEST_CASE("Eligibility: events outside their tick range are excluded") {
    const std::vector<EventRecord> events = {
        makeEvent("early", 0, 9, 1),
        makeEvent("mid", 10, 20, 1),
        makeEvent("late", 21, 99, 1),
    };

    const auto pool = availableEvents(events, 10);
    REQUIRE(pool.size() == 1);
    CHECK(pool[0]->id == "mid");

    // Both ends of the range are inclusive.
    CHECK(availableEvents(events, 20).size() == 1);
    CHECK(availableEvents(events, 9).front()->id == "early");
    CHECK(availableEvents(events, 100).empty());
}

TEST_CASE("Eligibility: event weight expands the pool") {
    const std::vector<EventRecord> events = {
        makeEvent("common", 0, 10, 3),
        makeEvent("rare", 0, 10, 1),
    };
    const auto pool = availableEvents(events, 5);
    REQUIRE(pool.size() == 4);
    CHECK(std::count_if(pool.begin(), pool.end(), [](const EventRecord* e) { return e->id == "common"; }) == 3);
    CHECK(std::count_if(pool.begin(), pool.end(), [](const EventRecord* e) { return e->id == "rare"; }) == 1);
}

TEST_CASE("Eligibility: weighted draws favour the heavier event") {
    const std::vector<EventRecord> events = {
        makeEvent("common", 0, 10, 3),
        makeEvent("rare", 0, 10, 1),
    };
    SimulationContext ctx(7, "");
    const auto pool = availableEvents(events, 5);

    int common = 0;
    const int draws = 4000;
    for (int i = 0; i < draws; ++i) {
        if (drawEvent(pool, ctx)->id == "common") ++common;
    }
    // Expected 3000; the bound is loose enough for any seed.
    CHECK(common > 2700);
    CHECK(common < 3300);
}

TEST_CASE("Eligibility: interactive pool only holds interactive events") {
    const std::vector<EventRecord> events = {
        makeEvent("auto", 0, 10, 2),
        makeEvent("choice", 0, 10, 2, EventKind::Interactive),
    };
    const auto pool = availableInteractiveEvents(events, 3);
    REQUIRE(pool.size() == 2);
    CHECK(pool[0]->id == "choice");
    CHECK(pool[1]->id == "choice");
}

TEST_CASE("Eligibility: drawing from an empty pool consumes no randomness") {
    SimulationContext a(99, "");
    SimulationContext b(99, "");
    CHECK(drawEvent({}, a) == nullptr);
    CHECK(a.randInt(0, 1000000) == b.randInt(0, 1000000));
}

TEST_CASE("Eligibility: the same seed draws the same event") {
    const std::vector<EventRecord> events = {
        makeEvent("a", 0, 10, 1), makeEvent("b", 0, 10, 2), makeEvent("c", 0, 10, 5),
    };
    SimulationContext x(1234, "");
    SimulationContext y(1234, "");
    for (int i = 0; i < 20; ++i) {
        CHECK(drawEvent(availableEvents(events, 4), x) == drawEvent(availableEvents(events, 4), y));
    }
}

TEST_CASE("Eligibility: action predicate checks tick, trust, treasury and use") {
    WorldState s = richState();
    CHECK(isActionEligible(makeAction("ok", 50, 70, 1000), s));
    CHECK_FALSE(isActionEligible(makeAction("locked", 51), s));
    CHECK_FALSE(isActionEligible(makeAction("distrusted", 0, 71), s));
    CHECK_FALSE(isActionEligible(makeAction("expensive", 0, 0, 1001), s));

    s.usedActionIds.insert("ok");
    CHECK_FALSE(isActionEligible(makeAction("ok"), s));
}

TEST_CASE("Eligibility: small eligible sets are returned whole and in order") {
    const std::vector<ActionRecord> actions = {
        makeAction("a"), makeAction("b", 999), makeAction("c"), makeAction("d"),
    };
    SimulationContext ctx(3, "");
    const auto offers = availableActions(actions, richState(), ctx);
    CHECK(ids(offers) == std::vector<std::string>{"a", "c", "d"});
}

TEST_CASE("Eligibility: nothing eligible yields an empty offer") {
    const std::vector<ActionRecord> actions = {makeAction("a", 999), makeAction("b", 0, 0, 5000)};
    SimulationContext ctx(3, "");
    CHECK(availableActions(actions, richState(), ctx).empty());
}

TEST_CASE("Eligibility: never more than five of fifty eligible actions") {
    std::vector<ActionRecord> actions;
    for (int i = 0; i < 50; ++i) {
        actions.push_back(makeAction("act_" + std::to_string(i)));
    }
    WorldState s = richState();
    for (int i = 0; i < 50; i += 3) {
        s.usedActionIds.insert("act_" + std::to_string(i));
    }

    SimulationContext ctx(2024, "");
    for (int round = 0; round < 200; ++round) {
        const auto offers = availableActions(actions, s, ctx);
        REQUIRE(offers.size() == 5);
        std::set<std::string> distinct;
        for (const ActionRecord* a : offers) {
            CHECK(s.usedActionIds.count(a->id) == 0);
            distinct.insert(a->id);
        }
        CHECK(distinct.size() == 5);
    }
}

TEST_CASE("Eligibility: the same seed offers the same subset") {
    std::vector<ActionRecord> actions;
    for (int i = 0; i < 20; ++i) {
        actions.push_back(makeAction("act_" + std::to_string(i)));
    }
    SimulationContext x(77, "");
    SimulationContext y(77, "");
    for (int round = 0; round < 10; ++round) {
        CHECK(ids(availableActions(actions, richState(), x)) == ids(availableActions(actions, richState(), y)));
    }
}

TEST_CASE("Eligibility: every eligible action is eventually offered") {
    std::vector<ActionRecord> actions;
    for (int i = 0; i < 12; ++i) {
        actions.push_back(makeAction("act_" + std::to_string(i)));
    }
    SimulationContext ctx(5, "");
    std::set<std::string> seen;
    for (int round = 0; round < 200; ++round) {
        for (const ActionRecord* a : availableActions(actions, richState(), ctx)) {
            seen.insert(a->id);
        }
    }
    CHECK(seen.size() == 12);
}
