// country.h

#pragma once

#include <string>

#include "game_types.h"

// Claimable territorial entity. The resource balance lives in the ledger
// (AccountKey::country(id)); everything else is held here.
//
// Not synchronized: WorldState guards each Country with its own mutex.
class Country {
public:
    Country() = default;
    Country(EntityId id,
            const std::string& name,
            const std::string& isoCode,
            int maxSoldiers,
            double resourceGenerationRate,
            double terrainModifier,
            double defenseStrength);

    EntityId getId() const { return m_id; }
    const std::string& getName() const { return m_name; }
    const std::string& getIsoCode() const { return m_isoCode; }

    // Ownership
    bool isClaimed() const { return m_isClaimed; }
    EntityId getOwnerId() const { return m_ownerId; }
    TimestampMs getClaimedAt() const { return m_claimedAt; }
    bool claim(EntityId playerId, TimestampMs now, OpError* error = nullptr);

    // Soldiers
    int getSoldierCount() const { return m_soldierCount; }
    int getMaxSoldiers() const { return m_maxSoldiers; }
    bool canAcceptNewSoldier() const;
    bool addSoldier(OpError* error = nullptr);
    // Sets *becameUnclaimed when the last soldier left.
    bool removeSoldier(bool* becameUnclaimed = nullptr, OpError* error = nullptr);

    // Economy and terrain
    double getResourceGenerationRate() const { return m_resourceGenerationRate; }
    void setResourceGenerationRate(double rate);
    double getTerrainModifier() const { return m_terrainModifier; }
    double getDefenseStrength() const { return m_defenseStrength; }

    // War state; isAtWar() is derived from the active war count.
    bool isAtWar() const { return m_activeWars > 0; }
    int getActiveWars() const { return m_activeWars; }
    void onWarStarted();
    void onWarEnded();
    int getWarsWon() const { return m_warsWon; }
    int getWarsLost() const { return m_warsLost; }
    void recordWarWon() { ++m_warsWon; }
    void recordWarLost() { ++m_warsLost; }

    // Territory (km^2)
    double getTerritoryGained() const { return m_territoryGained; }
    double getTerritoryLost() const { return m_territoryLost; }
    void addTerritoryGained(double km2);
    void addTerritoryLost(double km2);

    TimestampMs getLastActivity() const { return m_lastActivity; }
    void touch(TimestampMs now) { m_lastActivity = now; }

    // Snapshot restore.
    void restoreState(bool claimed, EntityId ownerId, TimestampMs claimedAt, int soldierCount,
                      int activeWars, int warsWon, int warsLost,
                      double territoryGained, double territoryLost);
    void setActiveWars(int count);

private:
    EntityId m_id = kNoEntity;
    std::string m_name;
    std::string m_isoCode;

    bool m_isClaimed = false;
    EntityId m_ownerId = kNoEntity;
    TimestampMs m_claimedAt = kNoTimestamp;

    int m_soldierCount = 0;
    int m_maxSoldiers = 50;

    double m_resourceGenerationRate = 1.0;
    double m_terrainModifier = 1.0;
    double m_defenseStrength = 1.0;

    int m_activeWars = 0;
    int m_warsWon = 0;
    int m_warsLost = 0;

    double m_territoryGained = 0.0;
    double m_territoryLost = 0.0;

    TimestampMs m_lastActivity = kNoTimestamp;
};
