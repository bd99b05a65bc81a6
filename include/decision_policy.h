#pragma once

#include <cstdint>
#include <deque>
#include <random>
#include <vector>

#include "content.h"
#include "world_state.h"

struct SimulationContext;

// The caller side of a turn: picks an event branch and an action.
class DecisionPolicy {
public:
    virtual ~DecisionPolicy() = default;

    // Index into event.choices.
    virtual int chooseEventBranch(const WorldState& state, const EventRecord& event) = 0;
    // Index into offers; offers.size() means "wait and observe".
    virtual int chooseAction(const WorldState& state, const std::vector<const ActionRecord*>& offers) = 0;
};

class FirstOptionPolicy : public DecisionPolicy {
public:
    int chooseEventBranch(const WorldState& state, const EventRecord& event) override;
    int chooseAction(const WorldState& state, const std::vector<const ActionRecord*>& offers) override;
};

class WaitPolicy : public DecisionPolicy {
public:
    int chooseEventBranch(const WorldState& state, const EventRecord& event) override;
    int chooseAction(const WorldState& state, const std::vector<const ActionRecord*>& offers) override;
};

// Uniform picks (waiting included) from a stream derived from the world seed,
// so the engine's own draws are not shifted by the policy.
class SeededRandomPolicy : public DecisionPolicy {
public:
    explicit SeededRandomPolicy(const SimulationContext& ctx);

    int chooseEventBranch(const WorldState& state, const EventRecord& event) override;
    int chooseAction(const WorldState& state, const std::vector<const ActionRecord*>& offers) override;

private:
    std::mt19937_64 m_rng;
};

// Replays fixed indices; falls back to 0 / wait when a queue runs dry.
class ScriptedPolicy : public DecisionPolicy {
public:
    ScriptedPolicy(std::vector<int> eventBranches, std::vector<int> actionChoices);

    int chooseEventBranch(const WorldState& state, const EventRecord& event) override;
    int chooseAction(const WorldState& state, const std::vector<const ActionRecord*>& offers) override;

private:
    std::deque<int> m_eventBranches;
    std::deque<int> m_actionChoices;
};
