#include "simulation_context.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = root[section][key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

void sanitizeConfig(SimulationConfig& config) {
    config.world.generationLength = std::max(1, config.world.generationLength);
    if (config.world.endTick < config.world.startTick) {
        config.world.endTick = config.world.startTick;
    }
    config.economy.startTreasury = std::max(0, config.economy.startTreasury);
    config.economy.startIncome = std::max(0, config.economy.startIncome);
    config.ocean.startPollution = std::clamp(config.ocean.startPollution, 0, 100);
    config.ocean.startVitality = std::clamp(config.ocean.startVitality, 0, 100);
    config.ocean.startTrust = std::clamp(config.ocean.startTrust, 0, 100);
    config.victory.winPollutionThreshold = std::clamp(config.victory.winPollutionThreshold, 0, 100);
    config.victory.winVitalityThreshold = std::clamp(config.victory.winVitalityThreshold, 0, 100);
    config.offers.actionOfferLimit = std::max(1, config.offers.actionOfferLimit);
}

} // namespace

SimulationContext::SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath)
    : worldSeed(seed), worldRng(seed), config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            std::cerr << "[Config] " << err << " Using built-in defaults.\n";
        }
    }
}

double SimulationContext::rand01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(worldRng);
}

int SimulationContext::randInt(int a, int b) {
    if (a > b) {
        std::swap(a, b);
    }
    std::uniform_int_distribution<int> dist(a, b);
    return dist(worldRng);
}

std::size_t SimulationContext::randIndex(std::size_t count) {
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(worldRng);
}

bool SimulationContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = SimulationConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        sanitizeConfig(config);
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "world", "startTick", config.world.startTick);
        readTomlValue(root, "world", "generationLength", config.world.generationLength);
        readTomlValue(root, "world", "endTick", config.world.endTick);
        if (const toml::array* names = root["world"]["generationNames"].as_array()) {
            std::vector<std::string> parsed;
            for (const toml::node& node : *names) {
                if (const auto name = node.value<std::string>()) {
                    parsed.push_back(*name);
                }
            }
            config.world.generationNames = std::move(parsed);
        }

        readTomlValue(root, "economy", "startTreasury", config.economy.startTreasury);
        readTomlValue(root, "economy", "startIncome", config.economy.startIncome);

        readTomlValue(root, "ocean", "startPollution", config.ocean.startPollution);
        readTomlValue(root, "ocean", "startVitality", config.ocean.startVitality);
        readTomlValue(root, "ocean", "startTrust", config.ocean.startTrust);
        readTomlValue(root, "ocean", "baseGrowth", config.ocean.baseGrowth);

        readTomlValue(root, "victory", "winPollutionThreshold", config.victory.winPollutionThreshold);
        readTomlValue(root, "victory", "winVitalityThreshold", config.victory.winVitalityThreshold);

        readTomlValue(root, "offers", "actionOfferLimit", config.offers.actionOfferLimit);

        sanitizeConfig(config);
        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    config = SimulationConfig{};
    sanitizeConfig(config);
    return false;
}

std::string SimulationContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

std::mt19937_64 SimulationContext::makeRng(std::uint64_t salt) const {
    return std::mt19937_64(mix64(worldSeed ^ salt));
}

std::uint64_t SimulationContext::mix64(std::uint64_t x) {
    // SplitMix64 finalizer (fast, deterministic, good bit diffusion).
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

const std::string& SimulationConfig::generationName(int generation) const {
    static const std::vector<std::string> kDefaults = defaultGenerationNames();
    const std::vector<std::string>& names = world.generationNames.empty() ? kDefaults : world.generationNames;
    const int count = static_cast<int>(names.size());
    const int idx = ((generation % count) + count) % count;
    return names[static_cast<std::size_t>(idx)];
}

std::vector<std::string> SimulationConfig::defaultGenerationNames() {
    return {
        "The Age of First Tides",
        "The Age of Drifting Nets",
        "The Age of Bright Harbors",
        "The Age of Floating Markets",
        "The Age of Murky Currents",
        "The Age of the Great Vortex",
        "The Age of Awakening",
        "The Age of Reckoning",
        "The Age of Deep Renewal",
        "The Age of Clear Waters",
    };
}
