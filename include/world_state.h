#pragma once

#include <cstdint>
#include <set>
#include <string>

#include "effect_bundle.h"

struct SimulationConfig;

// Bounds shared by every statistic that lives on a percentage scale.
constexpr int kStatMin = 0;
constexpr int kStatMax = 100;

struct WorldState {
    int tick = 0;

    // treasury has no ceiling; pollution/vitality/trust are kept in [0,100].
    int treasury = 0;
    int pollution = 0;
    int vitality = 0;
    int trust = 0;

    int incomeBase = 0;
    double growthModifier = 0.0; // Never clamped; persists for the rest of the run.

    // Ordered so that hashing and reporting stay deterministic.
    std::set<std::string> usedActionIds;

    // Audit fields for the narration layer. No engine rule reads these.
    std::string lastEvent;
    std::string lastEventChoice;
    std::string lastAction;
    EffectBundle lastActionEffects;
};

WorldState makeInitialState(const SimulationConfig& config);

int clampStat(int value);
int floorAtZero(int value);

bool checkStateInvariants(const WorldState& state, std::string* errorMessage = nullptr);
std::uint64_t computeStateHash(const WorldState& state);
