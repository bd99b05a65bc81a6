#include "effect_engine.h"

#include <limits>

namespace {

// Sums in 64-bit so that huge content deltas saturate instead of wrapping.
int saturatingAdd(int value, int delta) {
    const long long sum = static_cast<long long>(value) + static_cast<long long>(delta);
    if (sum > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (sum < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(sum);
}

} // namespace

void applyEffects(WorldState& state, const EffectBundle& bundle) {
    if (bundle.treasury) {
        state.treasury = floorAtZero(saturatingAdd(state.treasury, *bundle.treasury));
    }
    if (bundle.pollution) {
        state.pollution = clampStat(saturatingAdd(state.pollution, *bundle.pollution));
    }
    if (bundle.vitality) {
        state.vitality = clampStat(saturatingAdd(state.vitality, *bundle.vitality));
    }
    if (bundle.trust) {
        state.trust = clampStat(saturatingAdd(state.trust, *bundle.trust));
    }
    if (bundle.growthRate) {
        state.growthModifier += *bundle.growthRate;
    }
    if (bundle.incomeBase) {
        state.incomeBase = floorAtZero(saturatingAdd(state.incomeBase, *bundle.incomeBase));
    }
}

