#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "drift.h"
#include "ending.h"
#include "world_state.h"

class SimulationSession;
class DecisionPolicy;
struct SimulationConfig;

struct TurnReport {
    int turnIndex = 0;
    int startTick = 0;
    int endTick = 0;

    std::string eventId;     // empty when no event was active
    std::string eventChoice; // branch text or the automatic label
    bool eventInteractive = false;

    std::vector<YearlyDriftResult> drift;
    std::vector<std::string> offeredActionIds;
    std::string actionId; // empty when the policy waited

    WorldState state;
    std::uint64_t stateHash = 0;
    Ending ending = Ending::Running;
};

// Turns needed to carry the configured start tick to the end tick.
int plannedTurns(const SimulationConfig& config);

// Authoritative turn: event, drift, action offer, action, ending check.
// Returns false (and leaves the session mid-turn) when the policy asks for
// something the session rejects, when a stage breaks a state invariant, or
// when the ending is not one of the five outcomes ("invariant broken: ...").
bool runTurn(SimulationSession& session, DecisionPolicy& policy, TurnReport& report, std::string* errorMessage = nullptr);

// Runs turns until a terminal ending or `maxTurns` completed turns.
// The first rejected policy pick aborts the run here. The session itself is
// left in the rejected phase and can be resumed by calling
// resolveEventChoice()/chooseAction() again.
bool runSession(SimulationSession& session,
                DecisionPolicy& policy,
                int maxTurns,
                std::vector<TurnReport>& reports,
                std::string* errorMessage = nullptr);
