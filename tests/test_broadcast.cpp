#include <iostream>
#include <memory>
#include <stdexcept>

#include "event_outbox.h"
#include "test_support.h"

#define FL_ASSERT(expr)                                                                             \
    do {                                                                                            \
        if (!(expr)) {                                                                              \
            std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";      \
            return 1;                                                                               \
        }                                                                                           \
    } while (0)

namespace {

class ThrowingObserver : public EventObserver {
public:
    void deliver(const GameEvent&) override { throw std::runtime_error("socket closed"); }
};

} // namespace

int test_broadcast() {
    logging::setLevel(logging::Level::Off);

    // Rooms and exclusions.
    {
        BroadcastHub hub;
        auto a = std::make_shared<RecordingObserver>();
        auto b = std::make_shared<RecordingObserver>();
        auto c = std::make_shared<RecordingObserver>();
        const ConnectionId ca = hub.connect(10, a);
        const ConnectionId cb = hub.connect(11, b);
        const ConnectionId cc = hub.connect(12, c);
        FL_ASSERT(ca != 0 && cb != 0 && cc != 0);
        FL_ASSERT(hub.connectionCount() == 3);
        FL_ASSERT(hub.playerFor(cb) == 11);

        FL_ASSERT(hub.joinRoom(ca, 1));
        FL_ASSERT(hub.joinRoom(cb, 1));
        FL_ASSERT(hub.joinRoom(cc, 2));
        FL_ASSERT(!hub.joinRoom(cc, kNoEntity));
        FL_ASSERT(hub.activeRoomCount() == 2);
        FL_ASSERT(hub.roomSize(1) == 2);

        GameEvent ping("test:ping", 5);
        FL_ASSERT(hub.broadcast(1, ping) == 2);
        FL_ASSERT(a->count("test:ping") == 1 && b->count("test:ping") == 1);
        FL_ASSERT(c->count("test:ping") == 0);
        GameEvent got;
        FL_ASSERT(a->last("test:ping", got));
        FL_ASSERT(got.countryId == 1);

        FL_ASSERT(hub.broadcast(1, ping, ca) == 1);
        FL_ASSERT(a->count("test:ping") == 1 && b->count("test:ping") == 2);
        FL_ASSERT(hub.broadcast(3, ping) == 0);

        FL_ASSERT(hub.broadcastGlobal(ping) == 3);
        FL_ASSERT(c->last("test:ping", got));
        FL_ASSERT(got.countryId == kNoEntity);

        FL_ASSERT(hub.sendTo(cc, GameEvent("test:direct", 6)));
        FL_ASSERT(c->count("test:direct") == 1 && a->count("test:direct") == 0);

        // Moving a player's connections between rooms.
        hub.movePlayerRooms(12, 2, 1);
        FL_ASSERT(hub.roomSize(1) == 3);
        FL_ASSERT(hub.roomSize(2) == 0);
        FL_ASSERT(hub.activeRoomCount() == 1);

        // Remaining room members hear about a disconnect.
        hub.disconnect(ca, 99);
        FL_ASSERT(hub.connectionCount() == 2);
        FL_ASSERT(hub.roomSize(1) == 2);
        GameEvent gone;
        FL_ASSERT(b->last(events::kPlayerDisconnected, gone));
        FL_ASSERT(gone.getInt("player_id") == 10);
        FL_ASSERT(gone.countryId == 1);
        FL_ASSERT(gone.timestamp == 99);
        FL_ASSERT(a->count(events::kPlayerDisconnected) == 0);
        FL_ASSERT(!hub.sendTo(ca, ping));

        hub.disconnect(cb, 100);
        hub.disconnect(cc, 101);
        FL_ASSERT(hub.activeRoomCount() == 0);

        hub.shutdown();
        FL_ASSERT(hub.connect(13, a) == 0);
    }

    // One failing observer does not starve the others.
    {
        BroadcastHub hub;
        auto bad = std::make_shared<ThrowingObserver>();
        auto good = std::make_shared<RecordingObserver>();
        const ConnectionId cbad = hub.connect(1, bad);
        const ConnectionId cgood = hub.connect(2, good);
        FL_ASSERT(hub.joinRoom(cbad, 4) && hub.joinRoom(cgood, 4));
        FL_ASSERT(hub.broadcast(4, GameEvent("test:tick", 1)) == 1);
        FL_ASSERT(good->count("test:tick") == 1);
        FL_ASSERT(!hub.sendTo(cbad, GameEvent("test:tick", 2)));
    }

    // Bounded outbox keeps the newest events.
    {
        EventOutbox outbox(3);
        FL_ASSERT(outbox.capacity() == 3);
        for (int i = 0; i < 5; ++i) {
            outbox.deliver(GameEvent("test:n", i));
        }
        FL_ASSERT(outbox.size() == 3);
        FL_ASSERT(outbox.droppedCount() == 2);
        const std::vector<GameEvent> first = outbox.take(2);
        FL_ASSERT(first.size() == 2);
        FL_ASSERT(first[0].timestamp == 2 && first[1].timestamp == 3);
        FL_ASSERT(outbox.take(10).size() == 1);
        FL_ASSERT(outbox.size() == 0);
        FL_ASSERT(EventOutbox(0).capacity() == 1);
    }

    // Engine events reach the right rooms.
    {
        TestHarness h;
        const EntityId alice = h.addMember("alice", 1);
        const EntityId bob = h.addMember("bob", 2);
        auto aliceFeed = h.watch(alice);
        auto bobFeed = h.watch(bob);
        FL_ASSERT(h.hub.activeRoomCount() == 2);

        const EntityId ann = h.addPlayer("ann");
        auto annFeed = h.watch(ann);
        FL_ASSERT(h.engine.joinCountry(ann, 1));
        FL_ASSERT(h.hub.roomSize(1) == 2);
        FL_ASSERT(bobFeed->count(events::kPlayerJoinedCountry) == 0);
        FL_ASSERT(aliceFeed->count(events::kPlayerJoinedCountry) == 1);

        h.engine.broadcastServerStats();
        GameEvent stats;
        FL_ASSERT(annFeed->last(events::kServerStats, stats));
        FL_ASSERT(stats.getInt("connected_players") == 3);
        FL_ASSERT(stats.getInt("active_rooms") == 2);
        FL_ASSERT(stats.getInt("active_wars") == 0);
    }

    return 0;
}
