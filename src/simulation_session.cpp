#include "simulation_session.h"

#include "effect_engine.h"
#include "eligibility.h"

#include <sstream>
#include <utility>

const char* const kAutomaticEventChoice = "Automatic Event";

const char* turnPhaseName(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::AwaitingTurn: return "awaiting_turn";
        case TurnPhase::AwaitingEventChoice: return "awaiting_event_choice";
        case TurnPhase::AwaitingDrift: return "awaiting_drift";
        case TurnPhase::AwaitingOffer: return "awaiting_offer";
        case TurnPhase::AwaitingActionChoice: return "awaiting_action_choice";
        case TurnPhase::Finished: return "finished";
    }
    return "unknown";
}

SimulationSession::SimulationSession(SimulationContext ctx, ContentCatalog catalog)
    : m_ctx(std::move(ctx)), m_catalog(std::move(catalog)), m_state(makeInitialState(m_ctx.config)) {
    if (isTerminal(checkEnding())) {
        m_phase = TurnPhase::Finished;
    }
}

Ending SimulationSession::checkEnding() const {
    return ::checkEnding(m_state, m_ctx.config);
}

bool SimulationSession::requirePhase(TurnPhase expected, const char* operation, std::string* errorMessage) const {
    if (m_phase == expected) {
        return true;
    }
    if (errorMessage) {
        std::ostringstream oss;
        oss << operation << " called in phase " << turnPhaseName(m_phase)
            << " (expected " << turnPhaseName(expected) << ")";
        *errorMessage = oss.str();
    }
    return false;
}

bool SimulationSession::beginTurn(std::string* errorMessage) {
    if (!requirePhase(TurnPhase::AwaitingTurn, "beginTurn", errorMessage)) {
        return false;
    }
    // Endings are checked before a turn as well as after it.
    if (isTerminal(checkEnding())) {
        m_phase = TurnPhase::Finished;
        if (errorMessage) {
            *errorMessage = std::string("beginTurn: session already ended (") + endingName(checkEnding()) + ")";
        }
        return false;
    }

    m_offers.clear();
    m_drift.clear();
    m_chosenAction = nullptr;
    m_currentEvent = drawEvent(availableEvents(m_catalog.events, m_state.tick), m_ctx);

    if (!m_currentEvent) {
        m_phase = TurnPhase::AwaitingDrift;
        return true;
    }
    if (m_currentEvent->isInteractive()) {
        m_phase = TurnPhase::AwaitingEventChoice;
        return true;
    }

    m_state.lastEvent = m_currentEvent->name;
    m_state.lastEventChoice = kAutomaticEventChoice;
    applyEffects(m_state, m_currentEvent->effects);
    m_phase = TurnPhase::AwaitingDrift;
    return true;
}

bool SimulationSession::resolveEventChoice(int choiceIndex, std::string* errorMessage) {
    if (!requirePhase(TurnPhase::AwaitingEventChoice, "resolveEventChoice", errorMessage)) {
        return false;
    }
    const std::vector<EventChoice>& choices = m_currentEvent->choices;
    if (choiceIndex < 0 || choiceIndex >= static_cast<int>(choices.size())) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "resolveEventChoice: choice " << choiceIndex << " is not offered by event '"
                << m_currentEvent->id << "' (" << choices.size() << " choices)";
            *errorMessage = oss.str();
        }
        return false;
    }

    const EventChoice& choice = choices[static_cast<std::size_t>(choiceIndex)];
    m_state.lastEvent = m_currentEvent->name;
    m_state.lastEventChoice = choice.text;
    applyEffects(m_state, choice.effects);
    m_phase = TurnPhase::AwaitingDrift;
    return true;
}

bool SimulationSession::advanceGeneration(std::string* errorMessage) {
    if (!requirePhase(TurnPhase::AwaitingDrift, "advanceGeneration", errorMessage)) {
        return false;
    }
    m_drift.clear();
    for (int year = 0; year < m_ctx.config.world.generationLength; ++year) {
        m_drift.push_back(applyYearlyDrift(m_state, m_ctx.config));
    }
    m_phase = TurnPhase::AwaitingOffer;
    return true;
}

bool SimulationSession::offerActions(std::string* errorMessage) {
    if (!requirePhase(TurnPhase::AwaitingOffer, "offerActions", errorMessage)) {
        return false;
    }
    m_offers = availableActions(m_catalog.actions, m_state, m_ctx, m_ctx.config.offers.actionOfferLimit);
    m_phase = TurnPhase::AwaitingActionChoice;
    return true;
}

bool SimulationSession::chooseAction(int choiceIndex, std::string* errorMessage) {
    if (!requirePhase(TurnPhase::AwaitingActionChoice, "chooseAction", errorMessage)) {
        return false;
    }
    const int offerCount = static_cast<int>(m_offers.size());
    if (choiceIndex == offerCount) {
        finishTurn();
        return true;
    }
    if (choiceIndex < 0 || choiceIndex > offerCount) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "chooseAction: index " << choiceIndex << " outside the " << offerCount
                << " offered actions (use " << offerCount << " to wait)";
            *errorMessage = oss.str();
        }
        return false;
    }

    const ActionRecord& action = *m_offers[static_cast<std::size_t>(choiceIndex)];
    // The offer was computed for this state; re-check in case the state was edited since.
    if (!isActionEligible(action, m_state)) {
        if (errorMessage) {
            *errorMessage = "chooseAction: action '" + action.id + "' is no longer eligible";
        }
        return false;
    }

    m_state.treasury = floorAtZero(m_state.treasury - action.cost);
    applyEffects(m_state, action.effects);
    m_state.lastAction = action.name;
    m_state.lastActionEffects = action.effects;
    if (!action.repeatable) {
        m_state.usedActionIds.insert(action.id);
    }
    m_chosenAction = &action;
    finishTurn();
    return true;
}

bool SimulationSession::waitAndObserve(std::string* errorMessage) {
    if (!requirePhase(TurnPhase::AwaitingActionChoice, "waitAndObserve", errorMessage)) {
        return false;
    }
    finishTurn();
    return true;
}

void SimulationSession::finishTurn() {
    ++m_turnIndex;
    m_phase = isTerminal(checkEnding()) ? TurnPhase::Finished : TurnPhase::AwaitingTurn;
}
