#include "eligibility.h"

#include "simulation_context.h"

#include <algorithm>
#include <utility>

namespace {

template <typename Pred>
std::vector<const EventRecord*> expandByWeight(const std::vector<EventRecord>& events, int tick, Pred keep) {
    std::vector<const EventRecord*> pool;
    for (const EventRecord& e : events) {
        if (!e.activeAt(tick) || !keep(e)) {
            continue;
        }
        pool.insert(pool.end(), static_cast<std::size_t>(std::max(0, e.weight)), &e);
    }
    return pool;
}

} // namespace

std::vector<const EventRecord*> availableEvents(const std::vector<EventRecord>& events, int tick) {
    return expandByWeight(events, tick, [](const EventRecord&) { return true; });
}

std::vector<const EventRecord*> availableInteractiveEvents(const std::vector<EventRecord>& events, int tick) {
    return expandByWeight(events, tick, [](const EventRecord& e) { return e.isInteractive(); });
}

const EventRecord* drawEvent(const std::vector<const EventRecord*>& pool, SimulationContext& ctx) {
    if (pool.empty()) {
        return nullptr;
    }
    return pool[ctx.randIndex(pool.size())];
}

bool isActionEligible(const ActionRecord& action, const WorldState& state) {
    return state.tick >= action.unlockTick &&
           state.trust >= action.minTrust &&
           state.treasury >= action.cost &&
           state.usedActionIds.count(action.id) == 0;
}

std::vector<const ActionRecord*> availableActions(const std::vector<ActionRecord>& actions,
                                                  const WorldState& state,
                                                  SimulationContext& ctx,
                                                  int limit) {
    std::vector<const ActionRecord*> eligible;
    for (const ActionRecord& a : actions) {
        if (isActionEligible(a, state)) {
            eligible.push_back(&a);
        }
    }

    const std::size_t k = static_cast<std::size_t>(std::max(0, limit));
    if (eligible.size() <= k) {
        return eligible;
    }

    // Partial Fisher-Yates: the first k slots end up as the sample, in draw order.
    for (std::size_t i = 0; i < k; ++i) {
        const std::size_t j = i + ctx.randIndex(eligible.size() - i);
        std::swap(eligible[i], eligible[j]);
    }
    eligible.resize(k);
    return eligible;
}
