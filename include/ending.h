#pragma once

#include <string>

#include "world_state.h"

struct SimulationConfig;

enum class Ending {
    Running,
    Collapse,  // vitality exhausted
    ToxicSeas, // pollution saturated
    Uprising,  // trust exhausted
    Victory
};

// First matching rule wins: collapse, toxic seas, uprising, victory, running.
Ending checkEnding(const WorldState& state, const SimulationConfig& config);

bool isTerminal(Ending ending);
const char* endingName(Ending ending);

// False for any value outside the five outcomes.
bool isKnownEnding(Ending ending);
// Fails with "invariant broken: unknown ending <n>" for an unknown value.
bool validateEnding(Ending ending, std::string* errorMessage = nullptr);
