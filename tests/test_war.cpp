#include <atomic>
#include <iostream>
#include <thread>

#include "test_support.h"

#define FL_ASSERT(expr)                                                                             \
    do {                                                                                            \
        if (!(expr)) {                                                                              \
            std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";      \
            return 1;                                                                               \
        }                                                                                           \
    } while (0)

int test_war() {
    // Declaration, conflicts, cooldown.
    {
        TestHarness h;
        const EntityId alice = h.addMember("alice", 1);
        const EntityId bob = h.addMember("bob", 2);
        const EntityId carol = h.addPlayer("carol");
        auto bobFeed = h.watch(bob);

        {
            OpError err;
            FL_ASSERT(!h.engine.declareWar(alice, 1, 3, "", nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::InvalidTarget); // unclaimed
            FL_ASSERT(!h.engine.declareWar(alice, 1, 1, "", nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::InvalidTarget);
            FL_ASSERT(!h.engine.declareWar(bob, 1, 2, "", nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::Forbidden);
            FL_ASSERT(!h.engine.declareWar(alice, 1, 42, "", nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::NotFound);
        }

        War war;
        FL_ASSERT(h.engine.declareWar(alice, 1, 2, "border dispute", &war));
        FL_ASSERT(war.isActive());
        FL_ASSERT(war.aggressorCountryId == 1 && war.defenderCountryId == 2);
        FL_ASSERT(war.declaredBy == alice);
        FL_ASSERT(war.declaredAt == h.clock.nowMs());

        Country a;
        Country b;
        FL_ASSERT(h.engine.world().getCountry(1, a) && h.engine.world().getCountry(2, b));
        FL_ASSERT(a.isAtWar() && a.getActiveWars() == 1);
        FL_ASSERT(b.isAtWar() && b.getActiveWars() == 1);

        GameEvent declared;
        FL_ASSERT(bobFeed->last(events::kWarDeclared, declared));
        FL_ASSERT(declared.getInt("war_id") == war.id);
        FL_ASSERT(declared.getString("aggressor_name") == "Aldoria");
        FL_ASSERT(declared.getString("defender_name") == "Brevik");
        FL_ASSERT(declared.getString("reason") == "border dispute");
        FL_ASSERT(declared.countryId == kNoEntity);

        // The pair is taken in either direction.
        {
            OpError err;
            FL_ASSERT(!h.engine.declareWar(bob, 2, 1, "", nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::Conflict);
            FL_ASSERT(h.engine.wars().activeCount() == 1);
        }
        FL_ASSERT(h.engine.findActiveWarBetween(2, 1));

        // A second declaration inside the window reports what is left of it.
        FL_ASSERT(h.engine.joinCountry(carol, 3));
        {
            OpError err;
            h.clock.advance(1000);
            FL_ASSERT(!h.engine.declareWar(alice, 1, 3, "", nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::Cooldown);
            FL_ASSERT(err.remainingMs == h.config.cooldowns.warDeclarationMs - 1000);
        }
        h.clock.advance(h.config.cooldowns.warDeclarationMs);
        War second;
        FL_ASSERT(h.engine.declareWar(alice, 1, 3, "", &second));
        FL_ASSERT(second.reason == "War declared by alice");
        FL_ASSERT(h.engine.world().getCountry(1, a));
        FL_ASSERT(a.getActiveWars() == 2);
    }

    // Ending: declarer only, winner bookkeeping, pushes cancelled.
    {
        TestHarness h;
        const EntityId alice = h.addMember("alice", 1);
        const EntityId bob = h.addMember("bob", 2);
        const EntityId ann = h.addMember("ann", 1);
        auto aliceFeed = h.watch(alice);

        War war;
        FL_ASSERT(h.engine.declareWar(alice, 1, 2, "", &war));

        BorderPushRecord p1;
        BorderPushRecord p2;
        FL_ASSERT(h.engine.startPush(alice, war.id, GeoPoint{1.0, 1.0}, GeoPoint{1.5, 1.5}, 1.0, &p1));
        FL_ASSERT(h.engine.startPush(ann, war.id, GeoPoint{2.0, 2.0}, GeoPoint{2.5, 2.5}, 1.0, &p2));
        h.clock.advance(60 * 1000 * 3);

        {
            OpError err;
            FL_ASSERT(!h.engine.endWar(war.id, bob, 2, nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::Forbidden);
            FL_ASSERT(!h.engine.endWar(war.id, alice, 3, nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::InvalidTarget);
            FL_ASSERT(!h.engine.endWar(999, alice, kNoEntity, nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::NotFound);
        }

        War ended;
        FL_ASSERT(h.engine.endWar(war.id, alice, 1, &ended));
        FL_ASSERT(ended.status == WarStatus::Ended);
        FL_ASSERT(ended.endedBy == alice);
        FL_ASSERT(ended.winnerCountryId == 1);
        FL_ASSERT(ended.endedAt == h.clock.nowMs());
        FL_ASSERT(ended.totalBorderPushes == 2);
        FL_ASSERT(ended.territoryExchanged == 0.0);

        Country a;
        Country b;
        FL_ASSERT(h.engine.world().getCountry(1, a) && h.engine.world().getCountry(2, b));
        FL_ASSERT(!a.isAtWar() && !b.isAtWar());
        FL_ASSERT(a.getWarsWon() == 1 && a.getWarsLost() == 0);
        FL_ASSERT(b.getWarsLost() == 1 && b.getWarsWon() == 0);

        for (const auto& push : h.engine.pushes().forWar(war.id)) {
            const BorderPushRecord r = push->record();
            FL_ASSERT(r.status == PushStatus::Cancelled);
            FL_ASSERT(r.endedAt == h.clock.nowMs());
        }
        Player alicePlayer;
        FL_ASSERT(h.engine.world().getPlayer(alice, alicePlayer));
        FL_ASSERT(alicePlayer.getActivePushId() == kNoEntity);

        GameEvent endedEvent;
        FL_ASSERT(aliceFeed->last(events::kWarEnded, endedEvent));
        FL_ASSERT(endedEvent.getInt("cancelled_pushes") == 2);
        FL_ASSERT(endedEvent.getInt("duration_minutes") == 3);
        FL_ASSERT(endedEvent.getInt("winner_country_id") == 1);
        FL_ASSERT(aliceFeed->count(events::kPushCancelled) == 2);

        {
            OpError err;
            FL_ASSERT(!h.engine.endWar(war.id, alice, kNoEntity, nullptr, &err));
            FL_ASSERT(err.kind == ErrorKind::InvalidState);
        }

        // The pair is free again once the cooldown has run out.
        h.clock.advance(h.config.cooldowns.warDeclarationMs);
        FL_ASSERT(h.engine.declareWar(bob, 2, 1, ""));

        War noWinner;
        FL_ASSERT(h.engine.wars().findActiveBetween(1, 2, &noWinner));
        FL_ASSERT(h.engine.endWar(noWinner.id, bob, kNoEntity, &noWinner));
        FL_ASSERT(noWinner.winnerCountryId == kNoEntity);
        FL_ASSERT(aliceFeed->last(events::kWarEnded, endedEvent));
        FL_ASSERT(!endedEvent.has("winner_country_id"));
        FL_ASSERT(h.engine.world().getCountry(1, a));
        FL_ASSERT(a.getWarsWon() == 1 && a.getWarsLost() == 0);
    }

    // Opposite declarations racing on the same pair: exactly one wins.
    for (int round = 0; round < 20; ++round) {
        TestHarness h;
        const EntityId alice = h.addMember("alice", 1);
        const EntityId bob = h.addMember("bob", 2);

        std::atomic<int> successes{0};
        std::atomic<int> conflicts{0};
        auto declare = [&](EntityId player, EntityId from, EntityId to) {
            OpError err;
            if (h.engine.declareWar(player, from, to, "", nullptr, &err)) {
                ++successes;
            } else if (err.kind == ErrorKind::Conflict) {
                ++conflicts;
            }
        };
        std::thread t1(declare, alice, 1, 2);
        std::thread t2(declare, bob, 2, 1);
        t1.join();
        t2.join();

        FL_ASSERT(successes.load() == 1);
        FL_ASSERT(conflicts.load() == 1);
        FL_ASSERT(h.engine.wars().activeCount() == 1);
        Country a;
        FL_ASSERT(h.engine.world().getCountry(1, a));
        FL_ASSERT(a.getActiveWars() == 1);
    }

    return 0;
}
