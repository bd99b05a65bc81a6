#pragma once

#include <string>
#include <vector>

#include "content.h"
#include "drift.h"
#include "ending.h"
#include "simulation_context.h"
#include "world_state.h"

// Where a session stands inside the current turn.
enum class TurnPhase {
    AwaitingTurn,         // beginTurn()
    AwaitingEventChoice,  // resolveEventChoice()
    AwaitingDrift,        // advanceGeneration()
    AwaitingOffer,        // offerActions()
    AwaitingActionChoice, // chooseAction() / waitAndObserve()
    Finished              // a terminal ending was reached
};

const char* turnPhaseName(TurnPhase phase);

// Label recorded in lastEventChoice when the event offered no branches.
extern const char* const kAutomaticEventChoice;

// One single-actor run: owns the RNG/config context, the world state and the
// immutable content. Every fallible call returns false with a message and
// leaves the state untouched.
class SimulationSession {
public:
    SimulationSession(SimulationContext ctx, ContentCatalog catalog);
    // Offers and the current event point into m_catalog.
    SimulationSession(const SimulationSession&) = delete;
    SimulationSession& operator=(const SimulationSession&) = delete;

    Ending checkEnding() const;

    bool beginTurn(std::string* errorMessage = nullptr);
    bool resolveEventChoice(int choiceIndex, std::string* errorMessage = nullptr);
    bool advanceGeneration(std::string* errorMessage = nullptr);
    bool offerActions(std::string* errorMessage = nullptr);
    // choiceIndex == currentOffers().size() means "wait and observe".
    bool chooseAction(int choiceIndex, std::string* errorMessage = nullptr);
    bool waitAndObserve(std::string* errorMessage = nullptr);

    const WorldState& state() const { return m_state; }
    const SimulationContext& context() const { return m_ctx; }
    const SimulationConfig& config() const { return m_ctx.config; }
    const ContentCatalog& catalog() const { return m_catalog; }
    TurnPhase phase() const { return m_phase; }
    int turnIndex() const { return m_turnIndex; }

    const EventRecord* currentEvent() const { return m_currentEvent; }
    const std::vector<const ActionRecord*>& currentOffers() const { return m_offers; }
    const std::vector<YearlyDriftResult>& lastDrift() const { return m_drift; }
    const ActionRecord* lastChosenAction() const { return m_chosenAction; }

    // Test and tooling hook; bypasses phase rules.
    WorldState& mutableState() { return m_state; }

private:
    bool requirePhase(TurnPhase expected, const char* operation, std::string* errorMessage) const;
    void finishTurn();

    SimulationContext m_ctx;
    ContentCatalog m_catalog;
    WorldState m_state;
    TurnPhase m_phase = TurnPhase::AwaitingTurn;
    int m_turnIndex = 0;

    const EventRecord* m_currentEvent = nullptr;
    std::vector<const ActionRecord*> m_offers;
    std::vector<YearlyDriftResult> m_drift;
    const ActionRecord* m_chosenAction = nullptr;
};
