#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "game_types.h"

enum class WarStatus {
    Active,
    Ended,
    Ceasefire // kept for the record format; no transition enters it
};

const char* warStatusName(WarStatus status);
bool parseWarStatus(const std::string& name, WarStatus& out);

struct War {
    EntityId id = kNoEntity;
    EntityId aggressorCountryId = kNoEntity;
    EntityId defenderCountryId = kNoEntity;
    EntityId declaredBy = kNoEntity;
    EntityId endedBy = kNoEntity;
    EntityId winnerCountryId = kNoEntity; // kNoEntity: ended without a winner
    std::string reason;
    WarStatus status = WarStatus::Active;
    TimestampMs declaredAt = kNoTimestamp;
    TimestampMs endedAt = kNoTimestamp;

    double territoryExchanged = 0.0;    // km^2
    int totalBorderPushes = 0;          // pushes that reached a terminal state
    int aggressorSoldiersParticipated = 0;
    int defenderSoldiersParticipated = 0;
    int maxSimultaneousPushes = 0;

    bool isActive() const { return status == WarStatus::Active; }
    bool involves(EntityId countryId) const;
    EntityId opponentOf(EntityId countryId) const;
    long long durationMinutes(TimestampMs now) const;
};

// Registry of every war ever declared.
//
// The registry mutex guards the id map and the index of active country pairs,
// which is what makes "one active war per unordered pair" hold: the check and
// the insert happen in one critical section. Each war also has its own mutex
// for status and statistics. Order: registry mutex, then a war's mutex.
class WarRegistry {
public:
    using WarHook = std::function<void(const War&)>;

    // Creates an active war. Fails with Conflict when the pair already has an
    // active war (either direction) and with Cooldown when the declarer's last
    // declaration is younger than declarationCooldownMs. onCreated runs inside
    // the registry critical section.
    bool create(EntityId aggressorCountryId,
                EntityId defenderCountryId,
                EntityId declaredBy,
                const std::string& reason,
                TimestampMs now,
                long long declarationCooldownMs,
                const WarHook& onCreated,
                War* out,
                OpError* error = nullptr);

    // Ends an active war. Only the declarer may end it. onEnded runs while the
    // registry and war locks are held, before the pair index is released.
    bool end(EntityId warId,
             EntityId requestorPlayerId,
             EntityId winnerCountryId,
             TimestampMs now,
             const WarHook& onEnded,
             War* out,
             OpError* error = nullptr);

    bool get(EntityId warId, War& out) const;
    bool exists(EntityId warId) const;
    bool findActiveBetween(EntityId countryA, EntityId countryB, War* out) const;
    // Most recent declaration by the player, kNoTimestamp if none.
    TimestampMs lastDeclarationBy(EntityId playerId) const;

    // Runs fn(War&) under the war's mutex without touching the registry lock.
    template <typename Fn>
    bool withWar(EntityId warId, Fn&& fn) {
        std::shared_ptr<Entry> entry = findEntry(warId);
        if (!entry) return false;
        std::lock_guard<std::mutex> lock(entry->mutex);
        fn(entry->war);
        return true;
    }

    std::vector<War> wars() const;
    std::vector<War> activeWars() const;
    std::size_t activeCount() const;

    // Snapshot restore.
    static bool validateRecord(const War& war, OpError* error = nullptr);
    void clear();
    bool restore(const War& war, OpError* error = nullptr);

private:
    struct Entry {
        mutable std::mutex mutex;
        War war;
    };

    static std::pair<EntityId, EntityId> pairKey(EntityId a, EntityId b);
    std::shared_ptr<Entry> findEntry(EntityId warId) const;

    mutable std::mutex m_registryMutex;
    std::map<EntityId, std::shared_ptr<Entry>> m_wars;
    std::map<std::pair<EntityId, EntityId>, EntityId> m_activePairs;
    std::map<EntityId, TimestampMs> m_lastDeclaration;
    EntityId m_nextId = 1;
};
