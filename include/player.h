#pragma once

#include <string>

#include "game_types.h"

// Core-relevant slice of a player. Resources live in the ledger
// (AccountKey::player(id)); identity and credentials belong to the auth layer.
class Player {
public:
    Player() = default;
    Player(EntityId id, const std::string& name) : m_id(id), m_name(name) {}

    EntityId getId() const { return m_id; }
    const std::string& getName() const { return m_name; }

    EntityId getCountryId() const { return m_countryId; }
    bool hasCountry() const { return m_countryId != kNoEntity; }
    void setCountryId(EntityId countryId) { m_countryId = countryId; }

    bool hasPosition() const { return m_hasPosition; }
    const GeoPoint& getPosition() const { return m_position; }
    void setPosition(const GeoPoint& p) { m_position = p; m_hasPosition = true; }
    void clearPosition() { m_hasPosition = false; m_position = GeoPoint{}; }

    TimestampMs getLastMovement() const { return m_lastMovement; }
    // Remaining cooldown in ms, 0 when the player may move.
    long long movementCooldownRemaining(TimestampMs now, long long cooldownMs) const;
    void recordMovement(const GeoPoint& p, TimestampMs now);

    TimestampMs getLastWarDeclaredAt() const { return m_lastWarDeclaredAt; }
    long long warCooldownRemaining(TimestampMs now, long long cooldownMs) const;
    void recordWarDeclared(TimestampMs now) { m_lastWarDeclaredAt = now; ++m_warsDeclared; }
    int getWarsDeclared() const { return m_warsDeclared; }

    TimestampMs getLastPushStartedAt() const { return m_lastPushStartedAt; }
    long long pushCooldownRemaining(TimestampMs now, long long cooldownMs) const;
    EntityId getActivePushId() const { return m_activePushId; }
    void recordPushStarted(EntityId pushId, TimestampMs now) { m_activePushId = pushId; m_lastPushStartedAt = now; }
    void clearActivePush(EntityId pushId);

    // Snapshot restore.
    void restoreTimers(TimestampMs lastMovement, TimestampMs lastWarDeclaredAt, TimestampMs lastPushStartedAt,
                       EntityId activePushId, int warsDeclared);

private:
    EntityId m_id = kNoEntity;
    std::string m_name;
    EntityId m_countryId = kNoEntity;

    bool m_hasPosition = false;
    GeoPoint m_position{};

    TimestampMs m_lastMovement = kNoTimestamp;
    TimestampMs m_lastWarDeclaredAt = kNoTimestamp;
    TimestampMs m_lastPushStartedAt = kNoTimestamp;
    EntityId m_activePushId = kNoEntity;
    int m_warsDeclared = 0;
};
