#pragma once

#include "effect_bundle.h"
#include "world_state.h"

// Applies every present delta of `bundle` to `state`.
// treasury/incomeBase are floored at 0, pollution/vitality/trust are clamped
// to [0,100], growthRate accumulates into growthModifier unclamped.
// Each key targets its own field, so the result does not depend on order.
void applyEffects(WorldState& state, const EffectBundle& bundle);

