// country.cpp

#include "country.h"

#include <algorithm>
#include <cmath>

Country::Country(EntityId id,
                 const std::string& name,
                 const std::string& isoCode,
                 int maxSoldiers,
                 double resourceGenerationRate,
                 double terrainModifier,
                 double defenseStrength)
    : m_id(id),
      m_name(name),
      m_isoCode(isoCode),
      m_maxSoldiers(std::max(1, maxSoldiers)),
      m_resourceGenerationRate(std::clamp(resourceGenerationRate, 0.1, 100.0)),
      m_terrainModifier(std::clamp(terrainModifier, 0.1, 5.0)),
      m_defenseStrength(std::clamp(defenseStrength, 0.1, 10.0)) {}

// The claiming player becomes owner and first soldier.
bool Country::claim(EntityId playerId, TimestampMs now, OpError* error) {
    if (m_isClaimed) {
        return fail(error, ErrorKind::InvalidState, m_name + " is already claimed");
    }
    m_isClaimed = true;
    m_ownerId = playerId;
    m_claimedAt = now;
    m_soldierCount = 1;
    m_lastActivity = now;
    return true;
}

bool Country::canAcceptNewSoldier() const {
    return m_soldierCount < m_maxSoldiers;
}

bool Country::addSoldier(OpError* error) {
    if (!canAcceptNewSoldier()) {
        return fail(error, ErrorKind::InvalidState, m_name + " has reached maximum soldier capacity");
    }
    ++m_soldierCount;
    return true;
}

bool Country::removeSoldier(bool* becameUnclaimed, OpError* error) {
    if (becameUnclaimed) *becameUnclaimed = false;
    if (m_soldierCount <= 0) {
        return fail(error, ErrorKind::InvalidState, m_name + " has no soldiers to remove");
    }
    --m_soldierCount;

    // No soldiers left: the country goes back to the pool.
    if (m_soldierCount == 0 && m_isClaimed) {
        m_isClaimed = false;
        m_ownerId = kNoEntity;
        m_claimedAt = kNoTimestamp;
        if (becameUnclaimed) *becameUnclaimed = true;
    }
    return true;
}

void Country::setResourceGenerationRate(double rate) {
    if (!std::isfinite(rate)) return;
    m_resourceGenerationRate = std::clamp(rate, 0.1, 100.0);
}

void Country::onWarStarted() {
    ++m_activeWars;
}

void Country::onWarEnded() {
    m_activeWars = std::max(0, m_activeWars - 1);
}

void Country::addTerritoryGained(double km2) {
    if (!std::isfinite(km2) || km2 <= 0.0) return;
    m_territoryGained += km2;
}

void Country::addTerritoryLost(double km2) {
    if (!std::isfinite(km2) || km2 <= 0.0) return;
    m_territoryLost += km2;
}

void Country::restoreState(bool claimed, EntityId ownerId, TimestampMs claimedAt, int soldierCount,
                           int activeWars, int warsWon, int warsLost,
                           double territoryGained, double territoryLost) {
    m_isClaimed = claimed;
    m_ownerId = claimed ? ownerId : kNoEntity;
    m_claimedAt = claimed ? claimedAt : kNoTimestamp;
    m_soldierCount = std::clamp(soldierCount, 0, m_maxSoldiers);
    m_activeWars = std::max(0, activeWars);
    m_warsWon = std::max(0, warsWon);
    m_warsLost = std::max(0, warsLost);
    m_territoryGained = std::max(0.0, territoryGained);
    m_territoryLost = std::max(0.0, territoryLost);
}

void Country::setActiveWars(int count) {
    m_activeWars = std::max(0, count);
}
