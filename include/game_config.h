#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct GameConfig {
    struct CountrySeed {
        std::string name;
        std::string isoCode;
        double resourceGenerationRate = 1.0;
        double terrainModifier = 1.0;
        double defenseStrength = 1.0;
        int maxSoldiers = 0; // 0 means "use server.maxPlayersPerCountry"
    };

    struct Conflict {
        int tickIntervalMs = 5000;
        double completionDistanceM = 10000.0;
        long long pushCost = 10;
        long long pushCooldownMs = 5000;
        double baseSpeed = 1.0;       // m/s at strength == resistance, terrain 1.0
        double baseStrength = 1.0;
        double baseResistance = 1.0;
        double minSpeed = 0.1;
        double maxSpeed = 5.0;
        double resistanceFloor = 0.1;
        bool parallelTick = false;
    } conflict{};

    struct Economy {
        int tickIntervalMs = 60000;
        long long playerStartingResources = 100;
        long long countryStartingResources = 1000;
        double defaultGenerationRate = 1.0;
    } economy{};

    struct Cooldowns {
        long long movementMs = 1000;
        long long warDeclarationMs = 300000;
    } cooldowns{};

    struct Server {
        int port = 5000;
        int statsIntervalMs = 30000;
        int maxPlayersPerCountry = 50;
        int maxOutboxEvents = 256;
        // Accept hello{player_id}. Only for deployments behind an auth front-end.
        bool trustPlayerIdHello = false;
    } server{};

    struct Log {
        std::string level = "info";
    } log{};

    std::vector<CountrySeed> countries;

    static std::vector<CountrySeed> defaultCountries();
};

struct GameContext {
    GameConfig config;
    std::string configPath;
    std::string configHash;

    explicit GameContext(const std::string& runtimeConfigPath = "data/frontline.toml");

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);
};
