#include "war.h"

#include <algorithm>

#include "log.h"

const char* warStatusName(WarStatus status) {
    switch (status) {
        case WarStatus::Active: return "active";
        case WarStatus::Ended: return "ended";
        case WarStatus::Ceasefire: return "ceasefire";
        default: return "unknown";
    }
}

bool parseWarStatus(const std::string& name, WarStatus& out) {
    if (name == "active") { out = WarStatus::Active; return true; }
    if (name == "ended") { out = WarStatus::Ended; return true; }
    if (name == "ceasefire") { out = WarStatus::Ceasefire; return true; }
    return false;
}

bool War::involves(EntityId countryId) const {
    return countryId != kNoEntity && (countryId == aggressorCountryId || countryId == defenderCountryId);
}

EntityId War::opponentOf(EntityId countryId) const {
    if (countryId == aggressorCountryId) return defenderCountryId;
    if (countryId == defenderCountryId) return aggressorCountryId;
    return kNoEntity;
}

long long War::durationMinutes(TimestampMs now) const {
    if (declaredAt == kNoTimestamp) return 0;
    const TimestampMs endTime = (endedAt != kNoTimestamp) ? endedAt : now;
    return std::max(0LL, static_cast<long long>(endTime - declaredAt) / 60000LL);
}

std::pair<EntityId, EntityId> WarRegistry::pairKey(EntityId a, EntityId b) {
    return (a < b) ? std::make_pair(a, b) : std::make_pair(b, a);
}

std::shared_ptr<WarRegistry::Entry> WarRegistry::findEntry(EntityId warId) const {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto it = m_wars.find(warId);
    if (it == m_wars.end()) return nullptr;
    return it->second;
}

bool WarRegistry::create(EntityId aggressorCountryId,
                         EntityId defenderCountryId,
                         EntityId declaredBy,
                         const std::string& reason,
                         TimestampMs now,
                         long long declarationCooldownMs,
                         const WarHook& onCreated,
                         War* out,
                         OpError* error) {
    if (aggressorCountryId == defenderCountryId) {
        return fail(error, ErrorKind::InvalidTarget, "A country cannot declare war on itself");
    }

    std::lock_guard<std::mutex> lock(m_registryMutex);

    const auto key = pairKey(aggressorCountryId, defenderCountryId);
    if (m_activePairs.count(key)) {
        return fail(error, ErrorKind::Conflict, "War already exists between these countries");
    }

    auto lastIt = m_lastDeclaration.find(declaredBy);
    if (lastIt != m_lastDeclaration.end()) {
        const long long since = now - lastIt->second;
        if (since < declarationCooldownMs) {
            return failCooldown(error, "War declaration is on cooldown", declarationCooldownMs - std::max(0LL, since));
        }
    }

    auto entry = std::make_shared<Entry>();
    War& war = entry->war;
    war.id = m_nextId++;
    war.aggressorCountryId = aggressorCountryId;
    war.defenderCountryId = defenderCountryId;
    war.declaredBy = declaredBy;
    war.reason = reason;
    war.status = WarStatus::Active;
    war.declaredAt = now;

    m_wars.emplace(war.id, entry);
    m_activePairs.emplace(key, war.id);
    m_lastDeclaration[declaredBy] = now;

    if (onCreated) {
        onCreated(war);
    }
    if (out) {
        *out = war;
    }
    return true;
}

bool WarRegistry::end(EntityId warId,
                      EntityId requestorPlayerId,
                      EntityId winnerCountryId,
                      TimestampMs now,
                      const WarHook& onEnded,
                      War* out,
                      OpError* error) {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto it = m_wars.find(warId);
    if (it == m_wars.end()) {
        return fail(error, ErrorKind::NotFound, "War not found");
    }

    Entry& entry = *it->second;
    std::lock_guard<std::mutex> warLock(entry.mutex);
    War& war = entry.war;
    if (!war.isActive()) {
        return fail(error, ErrorKind::InvalidState, "War is not active");
    }
    // Only the declarer; other owners of the belligerents cannot end it.
    if (war.declaredBy != requestorPlayerId) {
        return fail(error, ErrorKind::Forbidden, "Only the war declarer can end the war");
    }
    if (winnerCountryId != kNoEntity && !war.involves(winnerCountryId)) {
        return fail(error, ErrorKind::InvalidTarget, "Winner must be one of the belligerents");
    }

    war.status = WarStatus::Ended;
    war.endedAt = now;
    war.endedBy = requestorPlayerId;
    war.winnerCountryId = winnerCountryId;

    if (onEnded) {
        onEnded(war);
    }
    m_activePairs.erase(pairKey(war.aggressorCountryId, war.defenderCountryId));

    if (out) {
        *out = war;
    }
    return true;
}

bool WarRegistry::get(EntityId warId, War& out) const {
    std::shared_ptr<Entry> entry = findEntry(warId);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    out = entry->war;
    return true;
}

bool WarRegistry::exists(EntityId warId) const {
    return findEntry(warId) != nullptr;
}

bool WarRegistry::findActiveBetween(EntityId countryA, EntityId countryB, War* out) const {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        auto it = m_activePairs.find(pairKey(countryA, countryB));
        if (it == m_activePairs.end()) return false;
        auto warIt = m_wars.find(it->second);
        if (warIt == m_wars.end()) return false;
        entry = warIt->second;
    }
    if (out) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        *out = entry->war;
    }
    return true;
}

TimestampMs WarRegistry::lastDeclarationBy(EntityId playerId) const {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    auto it = m_lastDeclaration.find(playerId);
    return (it == m_lastDeclaration.end()) ? kNoTimestamp : it->second;
}

std::vector<War> WarRegistry::wars() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(m_registryMutex);
        entries.reserve(m_wars.size());
        for (const auto& kv : m_wars) entries.push_back(kv.second);
    }
    std::vector<War> out;
    out.reserve(entries.size());
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        out.push_back(entry->war);
    }
    return out;
}

std::vector<War> WarRegistry::activeWars() const {
    std::vector<War> out;
    for (War& w : wars()) {
        if (w.isActive()) out.push_back(std::move(w));
    }
    return out;
}

std::size_t WarRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    return m_activePairs.size();
}

void WarRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_registryMutex);
    m_wars.clear();
    m_activePairs.clear();
    m_lastDeclaration.clear();
    m_nextId = 1;
}

bool WarRegistry::validateRecord(const War& war, OpError* error) {
    if (war.id == kNoEntity || war.aggressorCountryId == war.defenderCountryId) {
        return fail(error, ErrorKind::InvariantViolation, "Malformed war record " + std::to_string(war.id));
    }
    return true;
}

bool WarRegistry::restore(const War& war, OpError* error) {
    if (!validateRecord(war, error)) return false;

    std::lock_guard<std::mutex> lock(m_registryMutex);
    if (m_wars.count(war.id)) {
        return fail(error, ErrorKind::Conflict, "Duplicate war id " + std::to_string(war.id));
    }
    const auto key = pairKey(war.aggressorCountryId, war.defenderCountryId);
    War restored = war;
    if (restored.isActive() && m_activePairs.count(key)) {
        // Two active wars for one pair: keep the first, close the newcomer.
        logging::warn("War", "Snapshot holds a second active war " + std::to_string(war.id) +
                             " for one pair; restoring it as ended.");
        restored.status = WarStatus::Ended;
        if (restored.endedAt == kNoTimestamp) restored.endedAt = restored.declaredAt;
    }

    auto entry = std::make_shared<Entry>();
    entry->war = restored;
    m_wars.emplace(restored.id, entry);
    if (restored.isActive()) {
        m_activePairs.emplace(key, restored.id);
    }
    auto& last = m_lastDeclaration[restored.declaredBy];
    last = std::max(last, restored.declaredAt);
    m_nextId = std::max(m_nextId, restored.id + 1);
    return true;
}
