#include "simulation_runner.h"

#include "decision_policy.h"
#include "simulation_session.h"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <utility>

namespace {

int determinismTraceTurn() {
    static int turn = []() {
        const char* v = std::getenv("AQUASIM_TRACE_TURN");
        if (!v || !*v) return std::numeric_limits<int>::max();
        return std::atoi(v);
    }();
    return turn;
}

void maybeTraceDeterminismStage(const char* stage, int turn, const SimulationSession& session) {
    if (turn != determinismTraceTurn()) {
        return;
    }
    const std::uint64_t h = computeStateHash(session.state());
    std::cout << "[det-trace] turn=" << turn << " stage=" << stage << " hash=" << h << std::endl;
}

bool checkStage(const char* stage, const SimulationSession& session, std::string* errorMessage) {
    std::string err;
    if (checkStateInvariants(session.state(), &err)) {
        return true;
    }
    if (errorMessage) {
        *errorMessage = std::string("invariant broken after ") + stage + ": " + err;
    }
    return false;
}

} // namespace

int plannedTurns(const SimulationConfig& config) {
    const int span = config.world.endTick - config.world.startTick;
    if (span <= 0) {
        return 1;
    }
    const int len = config.world.generationLength;
    return (span + len - 1) / len;
}

bool runTurn(SimulationSession& session, DecisionPolicy& policy, TurnReport& report, std::string* errorMessage) {
    const int turn = session.turnIndex();
    report = TurnReport{};
    report.turnIndex = turn;
    report.startTick = session.state().tick;

    maybeTraceDeterminismStage("start", turn, session);
    if (!session.beginTurn(errorMessage)) {
        return false;
    }
    if (const EventRecord* event = session.currentEvent()) {
        report.eventId = event->id;
        report.eventInteractive = event->isInteractive();
        if (event->isInteractive()) {
            const int branch = policy.chooseEventBranch(session.state(), *event);
            if (!session.resolveEventChoice(branch, errorMessage)) {
                return false;
            }
        }
        report.eventChoice = session.state().lastEventChoice;
    }
    maybeTraceDeterminismStage("event", turn, session);
    if (!checkStage("event", session, errorMessage)) return false;

    if (!session.advanceGeneration(errorMessage)) {
        return false;
    }
    report.drift = session.lastDrift();
    maybeTraceDeterminismStage("drift", turn, session);
    if (!checkStage("drift", session, errorMessage)) return false;

    if (!session.offerActions(errorMessage)) {
        return false;
    }
    for (const ActionRecord* a : session.currentOffers()) {
        report.offeredActionIds.push_back(a->id);
    }
    const int pick = policy.chooseAction(session.state(), session.currentOffers());
    if (!session.chooseAction(pick, errorMessage)) {
        return false;
    }
    if (const ActionRecord* chosen = session.lastChosenAction()) {
        report.actionId = chosen->id;
    }
    maybeTraceDeterminismStage("action", turn, session);
    if (!checkStage("action", session, errorMessage)) return false;

    report.state = session.state();
    report.endTick = session.state().tick;
    report.stateHash = computeStateHash(session.state());
    report.ending = session.checkEnding();
    return validateEnding(report.ending, errorMessage);
}

bool runSession(SimulationSession& session,
                DecisionPolicy& policy,
                int maxTurns,
                std::vector<TurnReport>& reports,
                std::string* errorMessage) {
    int played = 0;
    while (played < maxTurns) {
        std::string err;
        const Ending ending = session.checkEnding();
        if (!validateEnding(ending, &err)) {
            std::cerr << "[Session] turn " << session.turnIndex() << " aborted: " << err << "\n";
            if (errorMessage) {
                *errorMessage = err;
            }
            return false;
        }
        if (isTerminal(ending)) {
            break;
        }
        TurnReport report;
        if (!runTurn(session, policy, report, &err)) {
            std::cerr << "[Session] turn " << session.turnIndex() << " aborted: " << err << "\n";
            if (errorMessage) {
                *errorMessage = err;
            }
            return false;
        }
        reports.push_back(std::move(report));
        ++played;
    }
    return true;
}
