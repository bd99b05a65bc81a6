#pragma once

#include <cstddef>
#include <vector>

#include "content.h"
#include "world_state.h"

struct SimulationContext;

constexpr int kDefaultActionOfferLimit = 5;

// Every event whose [minTick, maxTick] contains `tick`, repeated `weight` times.
// Drawing uniformly from the result is weighted selection over the records.
std::vector<const EventRecord*> availableEvents(const std::vector<EventRecord>& events, int tick);

// Same expansion, restricted to interactive events.
std::vector<const EventRecord*> availableInteractiveEvents(const std::vector<EventRecord>& events, int tick);

// Uniform draw from an expanded pool. Returns nullptr for an empty pool
// without consuming randomness.
const EventRecord* drawEvent(const std::vector<const EventRecord*>& pool, SimulationContext& ctx);

// Predicate shared by availableActions and the session's selection checks.
bool isActionEligible(const ActionRecord& action, const WorldState& state);

// Eligible actions in catalog order, or a uniformly random `limit`-sized
// subset (no replacement) when more than `limit` qualify.
std::vector<const ActionRecord*> availableActions(const std::vector<ActionRecord>& actions,
                                                  const WorldState& state,
                                                  SimulationContext& ctx,
                                                  int limit = kDefaultActionOfferLimit);
