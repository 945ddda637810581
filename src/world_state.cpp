#include "world_state.h"

#include <algorithm>

#include "log.h"

EntityId WorldState::addCountry(const GameConfig::CountrySeed& seed, long long startingResources) {
    EntityId id = kNoEntity;
    {
        std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
        id = m_nextCountryId++;
        auto slot = std::make_shared<Slot<Country>>();
        slot->value = Country(id, seed.name, seed.isoCode, seed.maxSoldiers,
                              seed.resourceGenerationRate, seed.terrainModifier, seed.defenseStrength);
        m_countries.emplace(id, std::move(slot));
    }

    OpError err;
    if (!m_ledger.openAccount(AccountKey::country(id), startingResources, &err)) {
        logging::warn("World", "Country " + seed.name + ": " + err.message);
    }
    return id;
}

EntityId WorldState::registerPlayer(const std::string& name, long long startingResources, OpError* error) {
    if (name.empty()) {
        fail(error, ErrorKind::InvalidTarget, "Player name must not be empty");
        return kNoEntity;
    }
    EntityId id = kNoEntity;
    {
        std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
        id = m_nextPlayerId++;
        auto slot = std::make_shared<Slot<Player>>();
        slot->value = Player(id, name);
        m_players.emplace(id, std::move(slot));
    }
    if (!m_ledger.openAccount(AccountKey::player(id), startingResources, error)) {
        return kNoEntity;
    }
    return id;
}

bool WorldState::getCountry(EntityId id, Country& out) const {
    std::shared_ptr<Slot<Country>> slot = findSlot(m_countries, id);
    if (!slot) return false;
    std::lock_guard<std::mutex> lock(slot->mutex);
    out = slot->value;
    return true;
}

bool WorldState::getPlayer(EntityId id, Player& out) const {
    std::shared_ptr<Slot<Player>> slot = findSlot(m_players, id);
    if (!slot) return false;
    std::lock_guard<std::mutex> lock(slot->mutex);
    out = slot->value;
    return true;
}

bool WorldState::hasCountry(EntityId id) const {
    return findSlot(m_countries, id) != nullptr;
}

bool WorldState::hasPlayer(EntityId id) const {
    return findSlot(m_players, id) != nullptr;
}

std::vector<Country> WorldState::countries() const {
    std::vector<std::shared_ptr<Slot<Country>>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(m_directoryMutex);
        slots.reserve(m_countries.size());
        for (const auto& kv : m_countries) slots.push_back(kv.second);
    }
    std::vector<Country> out;
    out.reserve(slots.size());
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        out.push_back(slot->value);
    }
    return out;
}

std::vector<Player> WorldState::players() const {
    std::vector<std::shared_ptr<Slot<Player>>> slots;
    {
        std::shared_lock<std::shared_mutex> lock(m_directoryMutex);
        slots.reserve(m_players.size());
        for (const auto& kv : m_players) slots.push_back(kv.second);
    }
    std::vector<Player> out;
    out.reserve(slots.size());
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        out.push_back(slot->value);
    }
    return out;
}

std::vector<EntityId> WorldState::claimedCountryIds() const {
    std::vector<EntityId> out;
    for (const Country& c : countries()) {
        if (c.isClaimed()) out.push_back(c.getId());
    }
    return out;
}

std::vector<EntityId> WorldState::countryIds() const {
    std::shared_lock<std::shared_mutex> lock(m_directoryMutex);
    std::vector<EntityId> out;
    out.reserve(m_countries.size());
    for (const auto& kv : m_countries) out.push_back(kv.first);
    return out;
}

void WorldState::clear() {
    std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
    m_countries.clear();
    m_players.clear();
    m_nextCountryId = 1;
    m_nextPlayerId = 1;
}

void WorldState::restoreCountry(const Country& country) {
    std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
    auto slot = std::make_shared<Slot<Country>>();
    slot->value = country;
    m_countries[country.getId()] = std::move(slot);
    m_nextCountryId = std::max(m_nextCountryId, country.getId() + 1);
}

void WorldState::restorePlayer(const Player& player) {
    std::unique_lock<std::shared_mutex> lock(m_directoryMutex);
    auto slot = std::make_shared<Slot<Player>>();
    slot->value = player;
    m_players[player.getId()] = std::move(slot);
    m_nextPlayerId = std::max(m_nextPlayerId, player.getId() + 1);
}
