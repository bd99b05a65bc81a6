#include "ending.h"

#include "simulation_context.h"

#include <string>

Ending checkEnding(const WorldState& state, const SimulationConfig& config) {
    if (state.vitality <= 0) {
        return Ending::Collapse;
    }
    if (state.pollution >= 100) {
        return Ending::ToxicSeas;
    }
    if (state.trust <= 0) {
        return Ending::Uprising;
    }
    if (state.tick >= config.world.endTick &&
        state.pollution < config.victory.winPollutionThreshold &&
        state.vitality >= config.victory.winVitalityThreshold) {
        return Ending::Victory;
    }
    return Ending::Running;
}

bool isTerminal(Ending ending) {
    return ending != Ending::Running;
}

const char* endingName(Ending ending) {
    switch (ending) {
        case Ending::Running: return "running";
        case Ending::Collapse: return "collapse";
        case Ending::ToxicSeas: return "toxic_seas";
        case Ending::Uprising: return "uprising";
        case Ending::Victory: return "victory";
    }
    return "unknown";
}

bool isKnownEnding(Ending ending) {
    switch (ending) {
        case Ending::Running:
        case Ending::Collapse:
        case Ending::ToxicSeas:
        case Ending::Uprising:
        case Ending::Victory:
            return true;
    }
    return false;
}

bool validateEnding(Ending ending, std::string* errorMessage) {
    if (isKnownEnding(ending)) {
        return true;
    }
    if (errorMessage) {
        *errorMessage = "invariant broken: unknown ending " + std::to_string(static_cast<int>(ending));
    }
    return false;
}
