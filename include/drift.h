#pragma once

#include "world_state.h"

struct SimulationConfig;

// What one yearly drift call did, for reporting.
struct YearlyDriftResult {
    int pollutionGrowth = 0; // Truncated rate before clamping.
    int vitalityDecline = 0;
    int income = 0;
};

// Passive change for one simulated year, in fixed order:
//   1. pollution grows by (baseGrowth + growthModifier) * (1 + pollution/100 * 0.5), truncated
//   2. vitality declines by a step function of the post-growth pollution
//   3. treasury gains incomeBase scaled by the post-decline vitality and by trust
// Each step sees the values written by the previous one. Advances tick by one.
YearlyDriftResult applyYearlyDrift(WorldState& state, const SimulationConfig& config);

int vitalityDeclineFor(int pollution);
double incomeMultiplierFor(int vitality);
double supportMultiplierFor(int trust);

// Status projections that do not mutate state.
int projectedGrowthRate(const WorldState& state, const SimulationConfig& config);
int projectedIncome(const WorldState& state);
