#include "game_config.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <type_traits>

#include <toml++/toml.hpp>

#include "log.h"

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
    } else if constexpr (std::is_same_v<T, long long>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<long long>(*v);
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

double readTableDouble(const toml::table& t, std::string_view key, double fallback) {
    if (const auto v = t[key].value<double>()) return *v;
    if (const auto vi = t[key].value<std::int64_t>()) return static_cast<double>(*vi);
    return fallback;
}

void readCountrySeeds(const toml::table& root, std::vector<GameConfig::CountrySeed>& out) {
    const toml::array* arr = root["countries"].as_array();
    if (!arr) return;
    for (const toml::node& node : *arr) {
        const toml::table* t = node.as_table();
        if (!t) continue;
        GameConfig::CountrySeed seed;
        seed.name = (*t)["name"].value_or(std::string{});
        if (seed.name.empty()) {
            logging::warn("Config", "Skipping [[countries]] entry without a name.");
            continue;
        }
        seed.isoCode = (*t)["iso_code"].value_or(std::string{});
        seed.resourceGenerationRate = readTableDouble(*t, "resource_generation_rate", seed.resourceGenerationRate);
        seed.terrainModifier = readTableDouble(*t, "terrain_modifier", seed.terrainModifier);
        seed.defenseStrength = readTableDouble(*t, "defense_strength", seed.defenseStrength);
        seed.maxSoldiers = static_cast<int>((*t)["max_soldiers"].value_or(std::int64_t{0}));
        out.push_back(std::move(seed));
    }
}

void sanitize(GameConfig& config) {
    auto& c = config.conflict;
    c.tickIntervalMs = std::max(50, c.tickIntervalMs);
    c.completionDistanceM = std::max(1.0, c.completionDistanceM);
    c.pushCost = std::max(0LL, c.pushCost);
    c.pushCooldownMs = std::max(0LL, c.pushCooldownMs);
    c.minSpeed = std::max(0.0, c.minSpeed);
    if (c.maxSpeed < c.minSpeed) {
        std::swap(c.maxSpeed, c.minSpeed);
    }
    c.resistanceFloor = std::max(1.0e-3, c.resistanceFloor);
    c.baseResistance = std::max(c.resistanceFloor, c.baseResistance);

    auto& e = config.economy;
    e.tickIntervalMs = std::max(50, e.tickIntervalMs);
    e.playerStartingResources = std::max(0LL, e.playerStartingResources);
    e.countryStartingResources = std::max(0LL, e.countryStartingResources);
    e.defaultGenerationRate = std::clamp(e.defaultGenerationRate, 0.1, 100.0);

    config.cooldowns.movementMs = std::max(0LL, config.cooldowns.movementMs);
    config.cooldowns.warDeclarationMs = std::max(0LL, config.cooldowns.warDeclarationMs);

    auto& s = config.server;
    s.port = std::clamp(s.port, 1, 65535);
    s.statsIntervalMs = std::max(50, s.statsIntervalMs);
    s.maxPlayersPerCountry = std::max(1, s.maxPlayersPerCountry);
    s.maxOutboxEvents = std::max(1, s.maxOutboxEvents);

    for (auto& seed : config.countries) {
        seed.resourceGenerationRate = std::clamp(seed.resourceGenerationRate, 0.1, 100.0);
        seed.terrainModifier = std::clamp(seed.terrainModifier, 0.1, 5.0);
        seed.defenseStrength = std::clamp(seed.defenseStrength, 0.1, 10.0);
        if (seed.maxSoldiers <= 0) {
            seed.maxSoldiers = s.maxPlayersPerCountry;
        }
    }
}

} // namespace

GameContext::GameContext(const std::string& runtimeConfigPath)
    : config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            logging::warn("Config", err + " Using built-in defaults.");
        }
    }
    if (config.countries.empty()) {
        config.countries = GameConfig::defaultCountries();
        sanitize(config);
    }
}

bool GameContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = GameConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "conflict", "tick_interval_ms", config.conflict.tickIntervalMs);
        readTomlValue(root, "conflict", "completion_distance_m", config.conflict.completionDistanceM);
        readTomlValue(root, "conflict", "push_cost", config.conflict.pushCost);
        readTomlValue(root, "conflict", "push_cooldown_ms", config.conflict.pushCooldownMs);
        readTomlValue(root, "conflict", "base_speed", config.conflict.baseSpeed);
        readTomlValue(root, "conflict", "base_strength", config.conflict.baseStrength);
        readTomlValue(root, "conflict", "base_resistance", config.conflict.baseResistance);
        readTomlValue(root, "conflict", "min_speed", config.conflict.minSpeed);
        readTomlValue(root, "conflict", "max_speed", config.conflict.maxSpeed);
        readTomlValue(root, "conflict", "resistance_floor", config.conflict.resistanceFloor);
        readTomlValue(root, "conflict", "parallel_tick", config.conflict.parallelTick);

        readTomlValue(root, "economy", "tick_interval_ms", config.economy.tickIntervalMs);
        readTomlValue(root, "economy", "player_starting_resources", config.economy.playerStartingResources);
        readTomlValue(root, "economy", "country_starting_resources", config.economy.countryStartingResources);
        readTomlValue(root, "economy", "default_generation_rate", config.economy.defaultGenerationRate);

        readTomlValue(root, "cooldowns", "movement_ms", config.cooldowns.movementMs);
        readTomlValue(root, "cooldowns", "war_declaration_ms", config.cooldowns.warDeclarationMs);

        readTomlValue(root, "server", "port", config.server.port);
        readTomlValue(root, "server", "stats_interval_ms", config.server.statsIntervalMs);
        readTomlValue(root, "server", "max_players_per_country", config.server.maxPlayersPerCountry);
        readTomlValue(root, "server", "max_outbox_events", config.server.maxOutboxEvents);
        readTomlValue(root, "server", "trust_player_id_hello", config.server.trustPlayerIdHello);

        readTomlValue(root, "log", "level", config.log.level);

        readCountrySeeds(root, config.countries);
        sanitize(config);

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

    config = GameConfig{};
    return false;
}

std::string GameContext::hashFileFNV1a(const std::string& path) {
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

std::vector<GameConfig::CountrySeed> GameConfig::defaultCountries() {
    return {
        {"Aldoria", "ALD", 1.0, 1.0, 1.0, 0},
        {"Brevik", "BRV", 1.5, 1.2, 1.0, 0},
        {"Castellan", "CST", 0.8, 2.0, 1.4, 0},
        {"Duneshar", "DUN", 1.2, 1.6, 0.9, 0},
        {"Estmark", "EST", 1.0, 0.9, 1.1, 0},
    };
}
