#include "border_push.h"

#include <algorithm>
#include <cmath>

#include "log.h"

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kMinTerrain = 0.1;
constexpr double kMaxTerrain = 5.0;

double clampTerrain(double terrain) {
    if (!std::isfinite(terrain)) return 1.0;
    return std::clamp(terrain, kMinTerrain, kMaxTerrain);
}

} // namespace

const char* pushStatusName(PushStatus status) {
    switch (status) {
        case PushStatus::Active: return "active";
        case PushStatus::Successful: return "successful";
        case PushStatus::Failed: return "failed";
        case PushStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

bool parsePushStatus(const std::string& name, PushStatus& out) {
    if (name == "active") { out = PushStatus::Active; return true; }
    if (name == "successful") { out = PushStatus::Successful; return true; }
    if (name == "failed") { out = PushStatus::Failed; return true; }
    if (name == "cancelled") { out = PushStatus::Cancelled; return true; }
    return false;
}

PushPhysics PushPhysics::fromConfig(const GameConfig::Conflict& conflict) {
    PushPhysics p;
    p.baseSpeed = conflict.baseSpeed;
    p.baseStrength = conflict.baseStrength;
    p.baseResistance = conflict.baseResistance;
    p.minSpeed = conflict.minSpeed;
    p.maxSpeed = conflict.maxSpeed;
    p.resistanceFloor = conflict.resistanceFloor;
    return p;
}

double computePushSpeed(double strength, double resistance, double terrainModifier, const PushPhysics& physics) {
    const double effectiveResistance = std::max(resistance, physics.resistanceFloor);
    const double terrain = clampTerrain(terrainModifier);
    const double raw = physics.baseSpeed * (strength / effectiveResistance) * (1.0 / terrain);
    if (!std::isfinite(raw)) return physics.maxSpeed;
    return std::clamp(raw, physics.minSpeed, physics.maxSpeed);
}

double territoryForDistance(double meters) {
    const double radiusKm = meters / 1000.0;
    return kPi * radiusKm * radiusKm;
}

BorderPush::BorderPush(const BorderPushRecord& record, const PushPhysics& physics)
    : m_id(record.id),
      m_warId(record.warId),
      m_playerId(record.playerId),
      m_sourceCountryId(record.sourceCountryId),
      m_targetCountryId(record.targetCountryId),
      m_physics(physics),
      m_record(record) {
    m_supporters.insert(record.supporters.begin(), record.supporters.end());
    m_defenders.insert(record.defenders.begin(), record.defenders.end());
    if (record.playerId != kNoEntity) {
        m_supporters.insert(record.playerId);
    }
    m_record.terrainModifier = clampTerrain(m_record.terrainModifier);
    publishLocked();
}

BorderPushRecord BorderPush::record() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    BorderPushRecord out = m_record;
    out.supporters.assign(m_supporters.begin(), m_supporters.end());
    out.defenders.assign(m_defenders.begin(), m_defenders.end());
    return out;
}

bool BorderPush::isActive() const {
    std::shared_ptr<const PushKinematics> k = std::atomic_load(&m_published);
    return k && k->status == PushStatus::Active;
}

bool BorderPush::isFaulted() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_record.faulted;
}

PushProgress BorderPush::peekProgress(TimestampMs now) const {
    std::shared_ptr<const PushKinematics> k = std::atomic_load(&m_published);
    PushProgress progress;
    if (!k) return progress;

    progress.pushSpeed = k->pushSpeed;
    progress.status = k->status;
    progress.isActive = (k->status == PushStatus::Active);
    progress.distancePushed = k->distancePushed;
    if (progress.isActive && k->lastUpdate != kNoTimestamp) {
        const long long elapsedMs = std::max<long long>(0, now - k->lastUpdate);
        progress.distancePushed += k->pushSpeed * (static_cast<double>(elapsedMs) / 1000.0);
    }
    progress.territoryGained = territoryForDistance(progress.distancePushed);
    return progress;
}

bool BorderPush::commitProgress(TimestampMs now, BorderPushRecord* out, OpError* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkMutableLocked(error)) return false;
    commitLocked(now);
    if (!checkInvariantsLocked()) {
        return fail(error, ErrorKind::InvariantViolation, "Border push " + std::to_string(m_id) + " is faulted");
    }
    publishLocked();
    if (out) *out = m_record;
    return true;
}

bool BorderPush::advance(TimestampMs now, double completionDistanceM, bool* completed,
                         BorderPushRecord* out, OpError* error) {
    if (completed) *completed = false;
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkMutableLocked(error)) return false;
    commitLocked(now);
    if (!checkInvariantsLocked()) {
        return fail(error, ErrorKind::InvariantViolation, "Border push " + std::to_string(m_id) + " is faulted");
    }
    if (m_record.distancePushed > completionDistanceM) {
        finishLocked(PushStatus::Successful, now);
        if (completed) *completed = true;
    }
    publishLocked();
    if (out) {
        *out = m_record;
        out->supporters.assign(m_supporters.begin(), m_supporters.end());
        out->defenders.assign(m_defenders.begin(), m_defenders.end());
    }
    return true;
}

bool BorderPush::addSupporter(EntityId playerId, BorderPushRecord* out, OpError* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkMutableLocked(error)) return false;
    if (!m_supporters.insert(playerId).second) {
        return fail(error, ErrorKind::Conflict, "Player already supports this border push");
    }
    m_record.supportingSoldiers += 1;
    m_record.pushStrength = m_physics.baseStrength * std::sqrt(static_cast<double>(m_record.supportingSoldiers));
    recomputeSpeedLocked();
    publishLocked();
    if (out) *out = m_record;
    return true;
}

bool BorderPush::addDefender(EntityId playerId, BorderPushRecord* out, OpError* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkMutableLocked(error)) return false;
    if (!m_defenders.insert(playerId).second) {
        return fail(error, ErrorKind::Conflict, "Player already defends against this border push");
    }
    m_record.defendingSoldiers += 1;
    // One defender resists like the undefended border; more add sqrt-wise.
    const int effective = std::max(1, m_record.defendingSoldiers);
    m_record.resistanceStrength = m_physics.baseResistance * std::sqrt(static_cast<double>(effective));
    recomputeSpeedLocked();
    publishLocked();
    if (out) *out = m_record;
    return true;
}

bool BorderPush::finish(PushStatus terminal, TimestampMs now, BorderPushRecord* out, OpError* error) {
    if (terminal == PushStatus::Active) {
        return fail(error, ErrorKind::InvalidState, "Active is not a terminal status");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!checkMutableLocked(error)) return false;
    commitLocked(now);
    finishLocked(terminal, now);
    publishLocked();
    if (out) {
        *out = m_record;
        out->supporters.assign(m_supporters.begin(), m_supporters.end());
        out->defenders.assign(m_defenders.begin(), m_defenders.end());
    }
    return true;
}

void BorderPush::markFaulted(const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_record.faulted) return;
    m_record.faulted = true;
    logging::error("BorderPush", "Push " + std::to_string(m_id) + " faulted: " + reason);
}

bool BorderPush::checkMutableLocked(OpError* error) const {
    if (m_record.faulted) {
        return fail(error, ErrorKind::InvariantViolation, "Border push " + std::to_string(m_id) + " is faulted");
    }
    if (m_record.status != PushStatus::Active) {
        return fail(error, ErrorKind::InvalidState,
                    std::string("Border push is ") + pushStatusName(m_record.status));
    }
    return true;
}

bool BorderPush::checkInvariantsLocked() {
    std::string problem;
    if (m_record.supportingSoldiers < 1) {
        problem = "supporting soldiers below one";
    } else if (m_record.defendingSoldiers < 0) {
        problem = "negative defending soldiers";
    } else if (!(m_record.pushStrength > 0.0) || !(m_record.resistanceStrength > 0.0)) {
        problem = "strength pair out of range";
    } else if (!std::isfinite(m_record.distancePushed) || m_record.distancePushed < 0.0) {
        problem = "distance out of range";
    }
    if (problem.empty()) return true;

    m_record.faulted = true;
    logging::error("BorderPush", "Push " + std::to_string(m_id) + " faulted: " + problem);
    return false;
}

void BorderPush::commitLocked(TimestampMs now) {
    if (m_record.lastUpdate != kNoTimestamp) {
        const long long elapsedMs = std::max<long long>(0, now - m_record.lastUpdate);
        m_record.distancePushed += m_record.pushSpeed * (static_cast<double>(elapsedMs) / 1000.0);
    }
    // A clock that went backwards leaves lastUpdate alone so progress never rewinds.
    if (m_record.lastUpdate == kNoTimestamp || now > m_record.lastUpdate) {
        m_record.lastUpdate = now;
    }
    m_record.territoryGained = territoryForDistance(m_record.distancePushed);
}

void BorderPush::finishLocked(PushStatus terminal, TimestampMs now) {
    m_record.status = terminal;
    m_record.endedAt = now;
    if (m_record.startedAt != kNoTimestamp) {
        m_record.durationSeconds = std::max<long long>(0, (now - m_record.startedAt) / 1000);
    }
}

void BorderPush::recomputeSpeedLocked() {
    m_record.pushSpeed = computePushSpeed(m_record.pushStrength, m_record.resistanceStrength,
                                          m_record.terrainModifier, m_physics);
}

void BorderPush::publishLocked() {
    auto k = std::make_shared<PushKinematics>();
    k->distancePushed = m_record.distancePushed;
    k->pushSpeed = m_record.pushSpeed;
    k->lastUpdate = m_record.lastUpdate;
    k->status = m_record.status;
    std::atomic_store(&m_published, std::shared_ptr<const PushKinematics>(std::move(k)));
}

std::shared_ptr<BorderPush> BorderPushEngine::create(EntityId warId,
                                                     EntityId playerId,
                                                     EntityId sourceCountryId,
                                                     EntityId targetCountryId,
                                                     const GeoPoint& position,
                                                     const GeoPoint& direction,
                                                     double terrainModifier,
                                                     long long resourcesConsumed,
                                                     TimestampMs now) {
    BorderPushRecord record;
    record.warId = warId;
    record.playerId = playerId;
    record.sourceCountryId = sourceCountryId;
    record.targetCountryId = targetCountryId;
    record.position = position;
    record.direction = direction;
    record.status = PushStatus::Active;
    record.pushStrength = m_physics.baseStrength;
    record.resistanceStrength = m_physics.baseResistance;
    record.terrainModifier = clampTerrain(terrainModifier);
    record.supportingSoldiers = 1;
    record.defendingSoldiers = 0;
    record.pushSpeed = computePushSpeed(record.pushStrength, record.resistanceStrength,
                                        record.terrainModifier, m_physics);
    record.resourcesConsumed = resourcesConsumed;
    record.startedAt = now;
    record.lastUpdate = now;
    record.supporters.push_back(playerId);

    std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
    record.id = m_nextId++;
    auto push = std::make_shared<BorderPush>(record, m_physics);
    m_pushes.emplace(record.id, push);
    return push;
}

std::shared_ptr<BorderPush> BorderPushEngine::find(EntityId pushId) const {
    std::shared_lock<std::shared_mutex> lock(m_directoryMutex);
    auto it = m_pushes.find(pushId);
    if (it == m_pushes.end()) return nullptr;
    return it->second;
}

std::vector<std::shared_ptr<BorderPush>> BorderPushEngine::all() const {
    std::shared_lock<std::shared_mutex> lock(m_directoryMutex);
    std::vector<std::shared_ptr<BorderPush>> out;
    out.reserve(m_pushes.size());
    for (const auto& kv : m_pushes) out.push_back(kv.second);
    return out;
}

std::vector<std::shared_ptr<BorderPush>> BorderPushEngine::active() const {
    std::vector<std::shared_ptr<BorderPush>> out;
    for (auto& push : all()) {
        if (push->isActive()) out.push_back(std::move(push));
    }
    return out;
}

std::vector<std::shared_ptr<BorderPush>> BorderPushEngine::forWar(EntityId warId) const {
    std::vector<std::shared_ptr<BorderPush>> out;
    for (auto& push : all()) {
        if (push->getWarId() == warId) out.push_back(std::move(push));
    }
    return out;
}

int BorderPushEngine::activeCountForWar(EntityId warId) const {
    int count = 0;
    for (const auto& push : all()) {
        if (push->getWarId() == warId && push->isActive()) ++count;
    }
    return count;
}

std::size_t BorderPushEngine::size() const {
    std::shared_lock<std::shared_mutex> lock(m_directoryMutex);
    return m_pushes.size();
}

void BorderPushEngine::clear() {
    std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
    m_pushes.clear();
    m_nextId = 1;
}

bool BorderPushEngine::validateRecord(const BorderPushRecord& record, OpError* error) {
    if (record.id == kNoEntity || record.id < 1) {
        return fail(error, ErrorKind::InvariantViolation, "Border push record without an id");
    }
    if (record.supportingSoldiers < 1 || record.defendingSoldiers < 0 ||
        !(record.pushStrength > 0.0) || !(record.resistanceStrength > 0.0) || record.distancePushed < 0.0) {
        return fail(error, ErrorKind::InvariantViolation,
                    "Border push " + std::to_string(record.id) + " has out-of-range values");
    }
    return true;
}

bool BorderPushEngine::restore(const BorderPushRecord& record, OpError* error) {
    if (!validateRecord(record, error)) return false;

    std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
    if (m_pushes.count(record.id)) {
        return fail(error, ErrorKind::Conflict, "Duplicate border push id " + std::to_string(record.id));
    }
    m_pushes.emplace(record.id, std::make_shared<BorderPush>(record, m_physics));
    m_nextId = std::max(m_nextId, record.id + 1);
    return true;
}
