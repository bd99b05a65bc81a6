#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

struct SimulationConfig {
    struct World {
        int startTick = 0;
        int generationLength = 5; // Simulated years per turn.
        int endTick = 150;
        std::vector<std::string> generationNames; // Empty means defaultGenerationNames().
    } world{};

    struct Economy {
        int startTreasury = 100;
        int startIncome = 20;
    } economy{};

    struct Ocean {
        int startPollution = 10;
        int startVitality = 80;
        int startTrust = 60;
        double baseGrowth = 2.0;
    } ocean{};

    struct Victory {
        int winPollutionThreshold = 30;
        int winVitalityThreshold = 60;
    } victory{};

    struct Offers {
        int actionOfferLimit = 5;
    } offers{};

    static std::vector<std::string> defaultGenerationNames();
    const std::string& generationName(int generation) const;
};

struct SimulationContext {
    std::uint64_t worldSeed = 0;
    std::mt19937_64 worldRng;
    SimulationConfig config;
    std::string configPath;
    std::string configHash;

    explicit SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath = "data/sim_config.toml");

    double rand01();
    int randInt(int a, int b); // inclusive
    std::size_t randIndex(std::size_t count); // [0, count), count must be > 0

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);

    std::mt19937_64 makeRng(std::uint64_t salt) const;

    static std::uint64_t mix64(std::uint64_t x);
};
