#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

#include "game_event.h"
#include "game_types.h"

using ConnectionId = std::uint64_t;

// Receiving end of a connection. deliver() must not block: implementations
// enqueue and return.
class EventObserver {
public:
    virtual ~EventObserver() = default;
    virtual void deliver(const GameEvent& event) = 0;
};

// Rooms of connections keyed by country id, plus the global feed.
//
// Membership is copied out under the hub mutex and delivery happens after it
// is released, so an observer can never stall a broadcaster holding the lock.
// A delivery already taken from a membership copy is not retried.
class BroadcastHub {
public:
    BroadcastHub() = default;
    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    ConnectionId connect(EntityId playerId, std::shared_ptr<EventObserver> observer);
    // Removes the connection from every room and tells the remaining members
    // of each with player:disconnected. Empty rooms are dropped.
    void disconnect(ConnectionId connection, TimestampMs now);

    bool joinRoom(ConnectionId connection, EntityId countryId);
    bool leaveRoom(ConnectionId connection, EntityId countryId);
    // Moves every connection of the player into (or out of, with kNoEntity)
    // the given country room.
    void movePlayerRooms(EntityId playerId, EntityId fromCountryId, EntityId toCountryId);

    // Returns the number of observers the event was handed to.
    std::size_t broadcast(EntityId countryId, const GameEvent& event, ConnectionId except = 0);
    std::size_t broadcastGlobal(const GameEvent& event);
    bool sendTo(ConnectionId connection, const GameEvent& event);

    std::vector<ConnectionId> connectionsForPlayer(EntityId playerId) const;
    EntityId playerFor(ConnectionId connection) const;
    std::size_t connectionCount() const;
    std::size_t activeRoomCount() const;
    std::size_t roomSize(EntityId countryId) const;

    // Drops every connection without notifications.
    void shutdown();

private:
    struct Connection {
        EntityId playerId = kNoEntity;
        std::shared_ptr<EventObserver> observer;
        std::set<EntityId> rooms;
    };

    static std::size_t deliverAll(const std::vector<std::shared_ptr<EventObserver>>& targets, const GameEvent& event);

    mutable std::mutex m_mutex;
    std::map<ConnectionId, Connection> m_connections;
    std::map<EntityId, std::set<ConnectionId>> m_rooms;
    ConnectionId m_nextConnectionId = 1;
    bool m_shutdown = false;
};
