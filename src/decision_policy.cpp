#include "decision_policy.h"

#include "simulation_context.h"

int FirstOptionPolicy::chooseEventBranch(const WorldState&, const EventRecord&) {
    return 0;
}

// With no offers, index 0 is the wait slot.
int FirstOptionPolicy::chooseAction(const WorldState&, const std::vector<const ActionRecord*>&) {
    return 0;
}

int WaitPolicy::chooseEventBranch(const WorldState&, const EventRecord&) {
    return 0;
}

int WaitPolicy::chooseAction(const WorldState&, const std::vector<const ActionRecord*>& offers) {
    return static_cast<int>(offers.size());
}

SeededRandomPolicy::SeededRandomPolicy(const SimulationContext& ctx)
    : m_rng(ctx.makeRng(0x504F4C4943590000ull)) { // "POLICY"
}

int SeededRandomPolicy::chooseEventBranch(const WorldState&, const EventRecord& event) {
    if (event.choices.empty()) {
        return 0;
    }
    std::uniform_int_distribution<int> dist(0, static_cast<int>(event.choices.size()) - 1);
    return dist(m_rng);
}

int SeededRandomPolicy::chooseAction(const WorldState&, const std::vector<const ActionRecord*>& offers) {
    std::uniform_int_distribution<int> dist(0, static_cast<int>(offers.size()));
    return dist(m_rng);
}

ScriptedPolicy::ScriptedPolicy(std::vector<int> eventBranches, std::vector<int> actionChoices)
    : m_eventBranches(eventBranches.begin(), eventBranches.end()),
      m_actionChoices(actionChoices.begin(), actionChoices.end()) {
}

int ScriptedPolicy::chooseEventBranch(const WorldState&, const EventRecord&) {
    if (m_eventBranches.empty()) {
        return 0;
    }
    const int v = m_eventBranches.front();
    m_eventBranches.pop_front();
    return v;
}

int ScriptedPolicy::chooseAction(const WorldState&, const std::vector<const ActionRecord*>& offers) {
    if (m_actionChoices.empty()) {
        return static_cast<int>(offers.size());
    }
    const int v = m_actionChoices.front();
    m_actionChoices.pop_front();
    return v;
}
