#include "broadcast_hub.h"

#include <exception>
#include <string>

#include "log.h"

ConnectionId BroadcastHub::connect(EntityId playerId, std::shared_ptr<EventObserver> observer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdown || !observer) return 0;
    const ConnectionId id = m_nextConnectionId++;
    Connection conn;
    conn.playerId = playerId;
    conn.observer = std::move(observer);
    m_connections.emplace(id, std::move(conn));
    return id;
}

void BroadcastHub::disconnect(ConnectionId connection, TimestampMs now) {
    EntityId playerId = kNoEntity;
    std::map<EntityId, std::vector<std::shared_ptr<EventObserver>>> notify;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(connection);
        if (it == m_connections.end()) return;
        playerId = it->second.playerId;
        for (EntityId countryId : it->second.rooms) {
            auto roomIt = m_rooms.find(countryId);
            if (roomIt == m_rooms.end()) continue;
            roomIt->second.erase(connection);
            if (roomIt->second.empty()) {
                m_rooms.erase(roomIt);
                continue;
            }
            auto& targets = notify[countryId];
            for (ConnectionId member : roomIt->second) {
                auto memberIt = m_connections.find(member);
                if (memberIt != m_connections.end()) targets.push_back(memberIt->second.observer);
            }
        }
        m_connections.erase(it);
    }

    for (const auto& kv : notify) {
        GameEvent event(events::kPlayerDisconnected, now);
        event.countryId = kv.first;
        event.setInt("player_id", playerId);
        deliverAll(kv.second, event);
    }
}

bool BroadcastHub::joinRoom(ConnectionId connection, EntityId countryId) {
    if (countryId == kNoEntity) return false;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(connection);
    if (it == m_connections.end()) return false;
    it->second.rooms.insert(countryId);
    m_rooms[countryId].insert(connection);
    return true;
}

bool BroadcastHub::leaveRoom(ConnectionId connection, EntityId countryId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(connection);
    if (it == m_connections.end()) return false;
    if (it->second.rooms.erase(countryId) == 0) return false;
    auto roomIt = m_rooms.find(countryId);
    if (roomIt != m_rooms.end()) {
        roomIt->second.erase(connection);
        if (roomIt->second.empty()) m_rooms.erase(roomIt);
    }
    return true;
}

void BroadcastHub::movePlayerRooms(EntityId playerId, EntityId fromCountryId, EntityId toCountryId) {
    for (ConnectionId connection : connectionsForPlayer(playerId)) {
        if (fromCountryId != kNoEntity) leaveRoom(connection, fromCountryId);
        if (toCountryId != kNoEntity) joinRoom(connection, toCountryId);
    }
}

std::size_t BroadcastHub::broadcast(EntityId countryId, const GameEvent& event, ConnectionId except) {
    std::vector<std::shared_ptr<EventObserver>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto roomIt = m_rooms.find(countryId);
        if (roomIt == m_rooms.end()) return 0;
        targets.reserve(roomIt->second.size());
        for (ConnectionId member : roomIt->second) {
            if (member == except) continue;
            auto it = m_connections.find(member);
            if (it != m_connections.end()) targets.push_back(it->second.observer);
        }
    }
    GameEvent scoped = event;
    scoped.countryId = countryId;
    return deliverAll(targets, scoped);
}

std::size_t BroadcastHub::broadcastGlobal(const GameEvent& event) {
    std::vector<std::shared_ptr<EventObserver>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        targets.reserve(m_connections.size());
        for (const auto& kv : m_connections) targets.push_back(kv.second.observer);
    }
    GameEvent scoped = event;
    scoped.countryId = kNoEntity;
    return deliverAll(targets, scoped);
}

bool BroadcastHub::sendTo(ConnectionId connection, const GameEvent& event) {
    std::shared_ptr<EventObserver> target;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(connection);
        if (it == m_connections.end()) return false;
        target = it->second.observer;
    }
    return deliverAll({target}, event) == 1;
}

std::vector<ConnectionId> BroadcastHub::connectionsForPlayer(EntityId playerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ConnectionId> out;
    for (const auto& kv : m_connections) {
        if (kv.second.playerId == playerId) out.push_back(kv.first);
    }
    return out;
}

EntityId BroadcastHub::playerFor(ConnectionId connection) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(connection);
    return (it == m_connections.end()) ? kNoEntity : it->second.playerId;
}

std::size_t BroadcastHub::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections.size();
}

std::size_t BroadcastHub::activeRoomCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rooms.size();
}

std::size_t BroadcastHub::roomSize(EntityId countryId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_rooms.find(countryId);
    return (it == m_rooms.end()) ? 0 : it->second.size();
}

void BroadcastHub::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shutdown = true;
    m_connections.clear();
    m_rooms.clear();
}

std::size_t BroadcastHub::deliverAll(const std::vector<std::shared_ptr<EventObserver>>& targets, const GameEvent& event) {
    std::size_t delivered = 0;
    for (const auto& observer : targets) {
        if (!observer) continue;
        try {
            observer->deliver(event);
            ++delivered;
        } catch (const std::exception& e) {
            logging::warn("Hub", "Observer rejected " + event.type + ": " + e.what());
        }
    }
    return delivered;
}
