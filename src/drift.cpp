#include "drift.h"

#include "simulation_context.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {

// Growth accelerates with the current pollution level.
double growthFactorFor(int pollution) {
    return 1.0 + (pollution / 100.0) * 0.5;
}

int truncateToInt(double v) {
    if (!std::isfinite(v)) {
        return 0;
    }
    if (v >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
    if (v <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
    return static_cast<int>(v);
}

int incomeFor(int incomeBase, int vitality, int trust) {
    // Two flooring stages, in this order.
    const int scaled = truncateToInt(incomeBase * incomeMultiplierFor(vitality));
    return truncateToInt(scaled * supportMultiplierFor(trust));
}

} // namespace

int vitalityDeclineFor(int pollution) {
    if (pollution >= 80) return 8;
    if (pollution >= 60) return 5;
    if (pollution >= 40) return 3;
    if (pollution >= 20) return 1;
    return 0;
}

double incomeMultiplierFor(int vitality) {
    if (vitality >= 80) return 1.0;
    if (vitality >= 60) return 0.8;
    if (vitality >= 40) return 0.6;
    if (vitality >= 20) return 0.4;
    return 0.2;
}

double supportMultiplierFor(int trust) {
    if (trust >= 80) return 1.0;
    if (trust >= 60) return 0.9;
    if (trust >= 40) return 0.7;
    if (trust >= 20) return 0.5;
    return 0.3;
}

YearlyDriftResult applyYearlyDrift(WorldState& state, const SimulationConfig& config) {
    YearlyDriftResult result;

    result.pollutionGrowth = projectedGrowthRate(state, config);
    const long long pollution = static_cast<long long>(state.pollution) + result.pollutionGrowth;
    state.pollution = static_cast<int>(std::clamp<long long>(pollution, kStatMin, kStatMax));

    result.vitalityDecline = vitalityDeclineFor(state.pollution);
    state.vitality = clampStat(state.vitality - result.vitalityDecline);

    result.income = incomeFor(state.incomeBase, state.vitality, state.trust);
    const long long treasury = static_cast<long long>(state.treasury) + result.income;
    state.treasury = treasury > std::numeric_limits<int>::max()
        ? std::numeric_limits<int>::max()
        : floorAtZero(static_cast<int>(treasury));

    ++state.tick;
    return result;
}

int projectedGrowthRate(const WorldState& state, const SimulationConfig& config) {
    const double baseGrowth = config.ocean.baseGrowth + state.growthModifier;
    return truncateToInt(baseGrowth * growthFactorFor(state.pollution));
}

int projectedIncome(const WorldState& state) {
    return incomeFor(state.incomeBase, state.vitality, state.trust);
}
