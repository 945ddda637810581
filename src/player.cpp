#include "player.h"

#include <algorithm>

namespace {

long long remaining(TimestampMs last, TimestampMs now, long long cooldownMs) {
    if (last == kNoTimestamp) return 0;
    const long long elapsed = now - last;
    if (elapsed < 0) return cooldownMs; // clock went backwards; stay conservative
    return std::max(0LL, cooldownMs - elapsed);
}

} // namespace

long long Player::movementCooldownRemaining(TimestampMs now, long long cooldownMs) const {
    return remaining(m_lastMovement, now, cooldownMs);
}

void Player::recordMovement(const GeoPoint& p, TimestampMs now) {
    setPosition(p);
    m_lastMovement = now;
}

long long Player::warCooldownRemaining(TimestampMs now, long long cooldownMs) const {
    return remaining(m_lastWarDeclaredAt, now, cooldownMs);
}

long long Player::pushCooldownRemaining(TimestampMs now, long long cooldownMs) const {
    return remaining(m_lastPushStartedAt, now, cooldownMs);
}

void Player::clearActivePush(EntityId pushId) {
    if (m_activePushId == pushId) {
        m_activePushId = kNoEntity;
    }
}

void Player::restoreTimers(TimestampMs lastMovement, TimestampMs lastWarDeclaredAt, TimestampMs lastPushStartedAt,
                           EntityId activePushId, int warsDeclared) {
    m_lastMovement = lastMovement;
    m_lastWarDeclaredAt = lastWarDeclaredAt;
    m_lastPushStartedAt = lastPushStartedAt;
    m_activePushId = activePushId;
    m_warsDeclared = std::max(0, warsDeclared);
}
