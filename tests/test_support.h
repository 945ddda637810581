#pragma once

// Shared fixtures for the test runner. Each test file keeps its own FL_ASSERT.

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "broadcast_hub.h"
#include "conflict_engine.h"
#include "game_clock.h"
#include "game_config.h"
#include "log.h"

class RecordingObserver : public EventObserver {
public:
    void deliver(const GameEvent& event) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(event);
    }

    std::vector<GameEvent> events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

    int count(const std::string& type) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        int n = 0;
        for (const GameEvent& e : m_events) {
            if (e.type == type) ++n;
        }
        return n;
    }

    bool last(const std::string& type, GameEvent& out) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_events.rbegin(); it != m_events.rend(); ++it) {
            if (it->type == type) {
                out = *it;
                return true;
            }
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<GameEvent> m_events;
};

// Three countries (ids 1, 2, 3), three soldiers each.
inline GameConfig testConfig() {
    GameConfig config;
    config.server.maxPlayersPerCountry = 3;
    config.conflict.tickIntervalMs = 50;
    config.economy.tickIntervalMs = 50;
    config.server.statsIntervalMs = 50;
    config.countries = {
        {"Aldoria", "ALD", 1.0, 1.0, 1.0, 0},
        {"Brevik", "BRV", 1.5, 1.0, 1.0, 0},
        {"Castellan", "CST", 2.7, 2.0, 1.4, 0},
    };
    return config;
}

struct TestHarness {
    GameConfig config;
    ManualGameClock clock;
    BroadcastHub hub;
    ConflictEngine engine;

    explicit TestHarness(const GameConfig& cfg = testConfig())
        : config(cfg), clock(), hub(), engine(config, clock, hub) {
        logging::setLevel(logging::Level::Off);
        engine.seedCountries();
    }

    EntityId addPlayer(const std::string& name) {
        return engine.registerPlayer(name);
    }

    // Registers a player and joins the country; the first joiner owns it.
    EntityId addMember(const std::string& name, EntityId countryId) {
        const EntityId id = engine.registerPlayer(name);
        engine.joinCountry(id, countryId);
        return id;
    }

    // Observer bound to the player; engine room moves carry it along.
    std::shared_ptr<RecordingObserver> watch(EntityId playerId) {
        auto observer = std::make_shared<RecordingObserver>();
        const ConnectionId connection = hub.connect(playerId, observer);
        Player p;
        if (engine.world().getPlayer(playerId, p) && p.hasCountry()) {
            hub.joinRoom(connection, p.getCountryId());
        }
        return observer;
    }

    long long balanceOf(const AccountKey& key) {
        long long value = -1;
        engine.ledger().balance(key, value);
        return value;
    }
};
