#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "country.h"
#include "game_config.h"
#include "game_types.h"
#include "player.h"
#include "resource_ledger.h"

// Authoritative country and player records, each behind its own mutex.
//
// Lookups copy the shared slot out from under the directory lock and then lock
// only the entity, so work on unrelated countries or players never contends.
// When a player and a country are both needed, the player is locked first.
class WorldState {
public:
    explicit WorldState(ResourceLedger& ledger) : m_ledger(ledger) {}

    EntityId addCountry(const GameConfig::CountrySeed& seed, long long startingResources);
    EntityId registerPlayer(const std::string& name, long long startingResources, OpError* error = nullptr);

    bool getCountry(EntityId id, Country& out) const;
    bool getPlayer(EntityId id, Player& out) const;
    bool hasCountry(EntityId id) const;
    bool hasPlayer(EntityId id) const;

    // Runs fn(Country&) under the country's mutex. Returns false if the id is unknown.
    template <typename Fn>
    bool withCountry(EntityId id, Fn&& fn) {
        std::shared_ptr<Slot<Country>> slot = findSlot(m_countries, id);
        if (!slot) return false;
        std::lock_guard<std::mutex> lock(slot->mutex);
        fn(slot->value);
        return true;
    }

    // Runs fn(Player&) under the player's mutex. Returns false if the id is unknown.
    template <typename Fn>
    bool withPlayer(EntityId id, Fn&& fn) {
        std::shared_ptr<Slot<Player>> slot = findSlot(m_players, id);
        if (!slot) return false;
        std::lock_guard<std::mutex> lock(slot->mutex);
        fn(slot->value);
        return true;
    }

    // Locks both countries in ascending id order and runs fn(first, second)
    // with the arguments in the order they were requested.
    template <typename Fn>
    bool withCountryPair(EntityId a, EntityId b, Fn&& fn) {
        std::shared_ptr<Slot<Country>> sa = findSlot(m_countries, a);
        std::shared_ptr<Slot<Country>> sb = findSlot(m_countries, b);
        if (!sa || !sb || a == b) return false;
        std::mutex& lo = (a < b) ? sa->mutex : sb->mutex;
        std::mutex& hi = (a < b) ? sb->mutex : sa->mutex;
        std::lock_guard<std::mutex> lockLo(lo);
        std::lock_guard<std::mutex> lockHi(hi);
        fn(sa->value, sb->value);
        return true;
    }

    // Copies in ascending id order.
    std::vector<Country> countries() const;
    std::vector<Player> players() const;
    std::vector<EntityId> claimedCountryIds() const;
    std::vector<EntityId> countryIds() const;

    // Snapshot restore.
    void clear();
    void restoreCountry(const Country& country);
    void restorePlayer(const Player& player);

private:
    template <typename T>
    struct Slot {
        mutable std::mutex mutex;
        T value;
    };

    template <typename T>
    std::shared_ptr<Slot<T>> findSlot(const std::map<EntityId, std::shared_ptr<Slot<T>>>& map, EntityId id) const {
        std::shared_lock<std::shared_mutex> lock(m_directoryMutex);
        auto it = map.find(id);
        if (it == map.end()) return nullptr;
        return it->second;
    }

    ResourceLedger& m_ledger;

    mutable std::shared_mutex m_directoryMutex;
    std::map<EntityId, std::shared_ptr<Slot<Country>>> m_countries;
    std::map<EntityId, std::shared_ptr<Slot<Player>>> m_players;
    EntityId m_nextCountryId = 1;
    EntityId m_nextPlayerId = 1;
};
