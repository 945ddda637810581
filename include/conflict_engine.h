#pragma once

#include <memory>
#include <string>

#include "border_push.h"
#include "broadcast_hub.h"
#include "game_clock.h"
#include "game_config.h"
#include "game_types.h"
#include "resource_ledger.h"
#include "war.h"
#include "world_state.h"

// Request-facing facade over the ledger, the world, the war registry and the
// push directory. Every operation validates, mutates and then broadcasts after
// all locks are released.
//
// Lock order: player, ledger account, war registry, war, push directory, push,
// countries (ascending id). No ledger call is made while a war or push lock is
// held. Side effects of a push transition (war statistics, country territory,
// clearing the initiator's active push) run after the push lock is dropped.
class ConflictEngine {
public:
    ConflictEngine(const GameConfig& config, const GameClock& clock, BroadcastHub& hub);

    ConflictEngine(const ConflictEngine&) = delete;
    ConflictEngine& operator=(const ConflictEngine&) = delete;

    const GameConfig& config() const { return m_config; }
    const GameClock& clock() const { return m_clock; }
    ResourceLedger& ledger() { return m_ledger; }
    WorldState& world() { return m_world; }
    WarRegistry& wars() { return m_wars; }
    BorderPushEngine& pushes() { return m_pushes; }
    BroadcastHub& hub() { return m_hub; }

    // Adds config.countries (or the built-in set when empty). Returns the count.
    int seedCountries();
    EntityId registerPlayer(const std::string& name, OpError* error = nullptr);

    // World
    bool joinCountry(EntityId playerId, EntityId countryId, bool* becameOwner = nullptr, OpError* error = nullptr);
    bool leaveCountry(EntityId playerId, bool* wasOwner = nullptr, OpError* error = nullptr);
    bool movePlayer(EntityId playerId, const GeoPoint& position, OpError* error = nullptr);

    // Wars
    bool declareWar(EntityId declarerPlayerId,
                    EntityId aggressorCountryId,
                    EntityId targetCountryId,
                    const std::string& reason,
                    War* out = nullptr,
                    OpError* error = nullptr);
    // winnerCountryId may be kNoEntity.
    bool endWar(EntityId warId, EntityId requestorPlayerId, EntityId winnerCountryId,
                War* out = nullptr, OpError* error = nullptr);
    bool findActiveWarBetween(EntityId countryA, EntityId countryB, War* out = nullptr) const;

    // Border pushes
    bool startPush(EntityId playerId,
                   EntityId warId,
                   const GeoPoint& position,
                   const GeoPoint& direction,
                   double terrainModifier = 1.0,
                   BorderPushRecord* out = nullptr,
                   OpError* error = nullptr);
    bool joinPush(EntityId pushId, EntityId playerId, BorderPushRecord* out = nullptr, OpError* error = nullptr);
    bool defendPush(EntityId pushId, EntityId playerId, BorderPushRecord* out = nullptr, OpError* error = nullptr);
    // "successful" ends the push as successful, any other reason cancels it.
    bool stopPush(EntityId pushId, const std::string& reason, BorderPushRecord* out = nullptr, OpError* error = nullptr);
    bool peekProgress(EntityId pushId, PushProgress& out, OpError* error = nullptr) const;
    bool commitProgress(EntityId pushId, BorderPushRecord* out = nullptr, OpError* error = nullptr);

    struct ConflictTickReport {
        int processed = 0;
        int completed = 0;
        int cancelled = 0;
        int failed = 0;
    };

    struct EconomyTickReport {
        int countries = 0;
        long long generated = 0;
        int failed = 0;
    };

    ConflictTickReport runConflictTick();
    EconomyTickReport runEconomyTick();
    void broadcastServerStats();

    // Recomputes every country's active war count from the live wars.
    void recountActiveWars();

private:
    enum class TickOutcome {
        Progressed,
        Completed,
        Cancelled,
        Skipped
    };

    TickOutcome tickPush(const std::shared_ptr<BorderPush>& push, TimestampMs now);

    // Applied after a push reached a terminal state; takes no push lock.
    void applyTerminalEffects(const BorderPushRecord& record, TimestampMs now);
    void broadcastPushCancelled(const BorderPushRecord& record, TimestampMs now, const std::string& reason);
    std::string playerName(EntityId playerId) const;
    std::string countryName(EntityId countryId) const;

    const GameConfig& m_config;
    const GameClock& m_clock;
    BroadcastHub& m_hub;

    ResourceLedger m_ledger;
    WorldState m_world;
    WarRegistry m_wars;
    BorderPushEngine m_pushes;
};
