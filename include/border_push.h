#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "game_config.h"
#include "game_types.h"

enum class PushStatus {
    Active,
    Successful,
    Failed,
    Cancelled
};

const char* pushStatusName(PushStatus status);
bool parsePushStatus(const std::string& name, PushStatus& out);

struct PushPhysics {
    double baseSpeed = 1.0;
    double baseStrength = 1.0;
    double baseResistance = 1.0;
    double minSpeed = 0.1;
    double maxSpeed = 5.0;
    double resistanceFloor = 0.1;

    static PushPhysics fromConfig(const GameConfig::Conflict& conflict);
};

// clamp(base * strength / max(resistance, floor) / terrain, min, max) in m/s.
// Every path that changes strength, resistance or terrain goes through here.
double computePushSpeed(double strength, double resistance, double terrainModifier, const PushPhysics& physics);

// Circular-expansion approximation: pi * (meters / 1000)^2, in km^2.
double territoryForDistance(double meters);

// Full push state, also the snapshot record.
struct BorderPushRecord {
    EntityId id = kNoEntity;
    EntityId warId = kNoEntity;
    EntityId playerId = kNoEntity;
    EntityId sourceCountryId = kNoEntity;
    EntityId targetCountryId = kNoEntity;
    GeoPoint position{};
    GeoPoint direction{};
    PushStatus status = PushStatus::Active;

    double pushStrength = 1.0;
    double resistanceStrength = 1.0;
    double terrainModifier = 1.0;
    int supportingSoldiers = 1;
    int defendingSoldiers = 0;

    double distancePushed = 0.0;   // m
    double territoryGained = 0.0;  // km^2
    double pushSpeed = 1.0;        // m/s
    long long resourcesConsumed = 0;

    TimestampMs startedAt = kNoTimestamp;
    TimestampMs lastUpdate = kNoTimestamp;
    TimestampMs endedAt = kNoTimestamp;
    long long durationSeconds = 0;
    bool faulted = false;

    std::vector<EntityId> supporters;  // includes the initiator
    std::vector<EntityId> defenders;

    bool isActive() const { return status == PushStatus::Active; }
};

// What peekProgress reads. Replaced wholesale on every mutation, never edited.
struct PushKinematics {
    double distancePushed = 0.0;
    double pushSpeed = 0.0;
    TimestampMs lastUpdate = kNoTimestamp;
    PushStatus status = PushStatus::Active;
};

struct PushProgress {
    double distancePushed = 0.0;
    double territoryGained = 0.0;
    double pushSpeed = 0.0;
    PushStatus status = PushStatus::Active;
    bool isActive = false;
};

// One border push. All mutations serialize on the push mutex; peekProgress
// reads the published kinematics instead and never blocks on a writer.
class BorderPush {
public:
    BorderPush(const BorderPushRecord& record, const PushPhysics& physics);

    BorderPush(const BorderPush&) = delete;
    BorderPush& operator=(const BorderPush&) = delete;

    // Immutable after construction.
    EntityId getId() const { return m_id; }
    EntityId getWarId() const { return m_warId; }
    EntityId getPlayerId() const { return m_playerId; }
    EntityId getSourceCountryId() const { return m_sourceCountryId; }
    EntityId getTargetCountryId() const { return m_targetCountryId; }

    BorderPushRecord record() const;
    bool isActive() const;
    bool isFaulted() const;

    PushProgress peekProgress(TimestampMs now) const;

    // Commits the candidate distance. Fails with InvalidState once terminal.
    bool commitProgress(TimestampMs now, BorderPushRecord* out = nullptr, OpError* error = nullptr);

    // Tick step: commits, then completes the push as Successful when the
    // committed distance exceeds completionDistanceM. Both happen under one lock.
    bool advance(TimestampMs now, double completionDistanceM, bool* completed,
                 BorderPushRecord* out = nullptr, OpError* error = nullptr);

    bool addSupporter(EntityId playerId, BorderPushRecord* out = nullptr, OpError* error = nullptr);
    bool addDefender(EntityId playerId, BorderPushRecord* out = nullptr, OpError* error = nullptr);

    // Commits final progress and moves to `terminal` (not Active).
    bool finish(PushStatus terminal, TimestampMs now, BorderPushRecord* out = nullptr, OpError* error = nullptr);

    // Stops further mutation; reported as InvariantViolation from then on.
    void markFaulted(const std::string& reason);

private:
    bool checkMutableLocked(OpError* error) const;
    bool checkInvariantsLocked();
    void commitLocked(TimestampMs now);
    void finishLocked(PushStatus terminal, TimestampMs now);
    void recomputeSpeedLocked();
    void publishLocked();

    const EntityId m_id;
    const EntityId m_warId;
    const EntityId m_playerId;
    const EntityId m_sourceCountryId;
    const EntityId m_targetCountryId;
    const PushPhysics m_physics;

    mutable std::mutex m_mutex;
    BorderPushRecord m_record;
    std::set<EntityId> m_supporters;
    std::set<EntityId> m_defenders;

    // Accessed only through std::atomic_load / std::atomic_store.
    std::shared_ptr<const PushKinematics> m_published;
};

// Directory of every push, active or terminal, keyed by id.
class BorderPushEngine {
public:
    explicit BorderPushEngine(const PushPhysics& physics) : m_physics(physics) {}

    const PushPhysics& physics() const { return m_physics; }

    // Creates an active push with strength/resistance from the physics base
    // values and the terrain clamped to [0.1, 5.0].
    std::shared_ptr<BorderPush> create(EntityId warId,
                                       EntityId playerId,
                                       EntityId sourceCountryId,
                                       EntityId targetCountryId,
                                       const GeoPoint& position,
                                       const GeoPoint& direction,
                                       double terrainModifier,
                                       long long resourcesConsumed,
                                       TimestampMs now);

    std::shared_ptr<BorderPush> find(EntityId pushId) const;
    std::vector<std::shared_ptr<BorderPush>> all() const;
    std::vector<std::shared_ptr<BorderPush>> active() const;
    std::vector<std::shared_ptr<BorderPush>> forWar(EntityId warId) const;
    int activeCountForWar(EntityId warId) const;
    std::size_t size() const;

    // Snapshot restore.
    static bool validateRecord(const BorderPushRecord& record, OpError* error = nullptr);
    void clear();
    bool restore(const BorderPushRecord& record, OpError* error = nullptr);

private:
    PushPhysics m_physics;

    mutable std::shared_mutex m_directoryMutex;
    std::map<EntityId, std::shared_ptr<BorderPush>> m_pushes;
    EntityId m_nextId = 1;
};
