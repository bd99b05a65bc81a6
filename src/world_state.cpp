#include "world_state.h"

#include "simulation_context.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

std::uint64_t mixHash(std::uint64_t h, std::uint64_t v) {
    h ^= v + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
    return h;
}

std::uint64_t hashDouble(double v, double scale = 1.0e6) {
    if (!std::isfinite(v)) {
        return 0xFFFFFFFFFFFFFFFFull;
    }
    const double q = std::round(v * scale) / scale;
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(q * scale));
}

std::uint64_t hashString(std::uint64_t h, const std::string& s) {
    // FNV-1a over the bytes, then folded into the running hash.
    std::uint64_t f = 1469598103934665603ull;
    for (unsigned char ch : s) {
        f ^= ch;
        f *= 1099511628211ull;
    }
    return mixHash(h, f);
}

std::uint64_t hashOptional(std::uint64_t h, const std::optional<int>& v) {
    h = mixHash(h, v ? 1u : 0u);
    return mixHash(h, v ? static_cast<std::uint64_t>(static_cast<std::int64_t>(*v)) : 0u);
}

} // namespace

WorldState makeInitialState(const SimulationConfig& config) {
    WorldState state;
    state.tick = config.world.startTick;
    state.treasury = floorAtZero(config.economy.startTreasury);
    state.incomeBase = floorAtZero(config.economy.startIncome);
    state.pollution = clampStat(config.ocean.startPollution);
    state.vitality = clampStat(config.ocean.startVitality);
    state.trust = clampStat(config.ocean.startTrust);
    state.growthModifier = 0.0;
    return state;
}

int clampStat(int value) {
    return std::clamp(value, kStatMin, kStatMax);
}

int floorAtZero(int value) {
    return std::max(0, value);
}

bool checkStateInvariants(const WorldState& state, std::string* errorMessage) {
    std::ostringstream oss;
    auto checkBounded = [&](const char* name, int v) {
        if (v < kStatMin || v > kStatMax) {
            oss << name << "=" << v << " outside [" << kStatMin << "," << kStatMax << "]; ";
        }
    };
    checkBounded("pollution", state.pollution);
    checkBounded("vitality", state.vitality);
    checkBounded("trust", state.trust);
    if (state.treasury < 0) {
        oss << "treasury=" << state.treasury << " below 0; ";
    }
    if (state.incomeBase < 0) {
        oss << "incomeBase=" << state.incomeBase << " below 0; ";
    }
    if (!std::isfinite(state.growthModifier)) {
        oss << "growthModifier is not finite; ";
    }

    const std::string problems = oss.str();
    if (problems.empty()) {
        return true;
    }
    if (errorMessage) {
        *errorMessage = "tick " + std::to_string(state.tick) + ": " + problems;
    }
    return false;
}

std::uint64_t computeStateHash(const WorldState& state) {
    std::uint64_t h = 0xA0CEA05EEDull;
    h = mixHash(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(state.tick)));
    h = mixHash(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(state.treasury)));
    h = mixHash(h, static_cast<std::uint64_t>(state.pollution));
    h = mixHash(h, static_cast<std::uint64_t>(state.vitality));
    h = mixHash(h, static_cast<std::uint64_t>(state.trust));
    h = mixHash(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(state.incomeBase)));
    h = mixHash(h, hashDouble(state.growthModifier));
    h = mixHash(h, static_cast<std::uint64_t>(state.usedActionIds.size()));
    for (const std::string& id : state.usedActionIds) {
        h = hashString(h, id);
    }
    h = hashString(h, state.lastEvent);
    h = hashString(h, state.lastEventChoice);
    h = hashString(h, state.lastAction);

    const EffectBundle& fx = state.lastActionEffects;
    h = hashOptional(h, fx.treasury);
    h = hashOptional(h, fx.pollution);
    h = hashOptional(h, fx.vitality);
    h = hashOptional(h, fx.trust);
    h = hashOptional(h, fx.incomeBase);
    h = mixHash(h, fx.growthRate ? hashDouble(*fx.growthRate) : 0u);
    return h;
}
