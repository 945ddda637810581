#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>

#include "snapshot.h"
#include "test_support.h"

#define FL_ASSERT(expr)                                                                             \
    do {                                                                                            \
        if (!(expr)) {                                                                              \
            std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";      \
            return 1;                                                                               \
        }                                                                                           \
    } while (0)

namespace {

const char* kRepairSnapshot = R"(
version = 1
saved_at = 1700000000000

[[countries]]
id = 1
name = "Aldoria"
iso_code = "ALD"
is_claimed = true
owner_id = 1
soldier_count = 1
active_wars = 5

[[countries]]
id = 2
name = "Brevik"
iso_code = "BRV"
is_claimed = true
owner_id = 2
soldier_count = 1
active_wars = 0

[[players]]
id = 1
name = "alice"
country_id = 1
active_push_id = 10

[[players]]
id = 2
name = "bob"
country_id = 2

[[players]]
id = 3
name = "drifter"
country_id = 9

[[wars]]
id = 1
aggressor_country_id = 1
defender_country_id = 2
declared_by = 1
status = "ended"
declared_at = 1699999000000
ended_at = 1699999500000

[[wars]]
id = 2
aggressor_country_id = 2
defender_country_id = 1
declared_by = 2
status = "active"
declared_at = 1699999600000

[[pushes]]
id = 10
war_id = 1
player_id = 1
source_country_id = 1
target_country_id = 2
status = "active"
distance_pushed = 120.0
push_speed = 1.0
started_at = 1699999100000
last_update = 1699999400000
supporters = [1]

[[pushes]]
id = 11
war_id = 2
player_id = 2
source_country_id = 2
target_country_id = 1
status = "active"
distance_pushed = 5.0
push_speed = 1.0
started_at = 1699999900000
last_update = 1699999900000
supporters = [2]

[[accounts]]
kind = "player"
id = 1
balance = 42

[[accounts]]
kind = "country"
id = 1
balance = 1500
)";

} // namespace

int test_snapshot() {
    // Full round trip through the TOML text.
    {
        TestHarness h;
        const EntityId alice = h.addMember("alice", 1);
        const EntityId bob = h.addMember("bob", 2);
        const EntityId ann = h.addMember("ann", 1);
        FL_ASSERT(h.engine.movePlayer(ann, GeoPoint{12.5, -7.25}));
        War war;
        FL_ASSERT(h.engine.declareWar(alice, 1, 2, "rivers", &war));
        BorderPushRecord rec;
        FL_ASSERT(h.engine.startPush(alice, war.id, GeoPoint{1, 1}, GeoPoint{2, 2}, 2.0, &rec));
        FL_ASSERT(h.engine.joinPush(rec.id, ann));
        FL_ASSERT(h.engine.defendPush(rec.id, bob));
        h.clock.advance(20 * 1000);
        FL_ASSERT(h.engine.commitProgress(rec.id));
        h.engine.runEconomyTick();

        const std::string text = renderSnapshot(h.engine);
        FL_ASSERT(!text.empty());

        TestHarness restored;
        restored.clock.set(h.clock.nowMs());
        std::string err;
        SnapshotReport report;
        FL_ASSERT(restoreSnapshot(restored.engine, text, &err, &report));
        FL_ASSERT(report.countries == 3);
        FL_ASSERT(report.players == 3);
        FL_ASSERT(report.wars == 1);
        FL_ASSERT(report.pushes == 1);
        FL_ASSERT(report.repairedPushes == 0);

        Country c;
        FL_ASSERT(restored.engine.world().getCountry(1, c));
        FL_ASSERT(c.isClaimed() && c.getOwnerId() == alice);
        FL_ASSERT(c.getSoldierCount() == 2);
        FL_ASSERT(c.getActiveWars() == 1);
        FL_ASSERT(restored.balanceOf(AccountKey::country(1)) == h.balanceOf(AccountKey::country(1)));
        FL_ASSERT(restored.balanceOf(AccountKey::player(alice)) == 100 - h.config.conflict.pushCost);

        Player p;
        FL_ASSERT(restored.engine.world().getPlayer(ann, p));
        FL_ASSERT(p.hasPosition() && p.getPosition().lng == -7.25);
        FL_ASSERT(restored.engine.world().getPlayer(alice, p));
        FL_ASSERT(p.getActivePushId() == rec.id);

        War w;
        FL_ASSERT(restored.engine.wars().get(war.id, w));
        FL_ASSERT(w.isActive() && w.reason == "rivers");
        FL_ASSERT(w.aggressorSoldiersParticipated == 2);
        FL_ASSERT(restored.engine.findActiveWarBetween(2, 1));

        auto push = restored.engine.pushes().find(rec.id);
        FL_ASSERT(push);
        const BorderPushRecord r = push->record();
        const BorderPushRecord before = h.engine.pushes().find(rec.id)->record();
        FL_ASSERT(r.isActive());
        FL_ASSERT(r.supportingSoldiers == 2 && r.defendingSoldiers == 1);
        FL_ASSERT(r.supporters.size() == 2 && r.defenders.size() == 1);
        FL_ASSERT(std::fabs(r.distancePushed - before.distancePushed) < 1e-9);
        FL_ASSERT(std::fabs(r.pushSpeed - before.pushSpeed) < 1e-9);
        FL_ASSERT(r.lastUpdate == before.lastUpdate);

        // Ids keep counting past the restored ones.
        const EntityId newcomer = restored.addPlayer("newcomer");
        FL_ASSERT(newcomer > ann);
        FL_ASSERT(restored.engine.joinPush(rec.id, newcomer) == false);

        // The restored push keeps moving.
        restored.clock.advance(10 * 1000);
        FL_ASSERT(restored.engine.runConflictTick().processed == 1);
        FL_ASSERT(push->record().distancePushed > before.distancePushed);
    }

    // Repairs: outlived pushes cancelled, stale links cleared, counts recomputed.
    {
        TestHarness h;
        std::string err;
        SnapshotReport report;
        FL_ASSERT(restoreSnapshot(h.engine, kRepairSnapshot, &err, &report));
        FL_ASSERT(report.repairedPushes == 1);
        FL_ASSERT(report.clearedPlayerLinks == 2);

        auto stale = h.engine.pushes().find(10);
        FL_ASSERT(stale && stale->record().status == PushStatus::Cancelled);
        FL_ASSERT(stale->record().endedAt == 1699999400000LL);
        auto live = h.engine.pushes().find(11);
        FL_ASSERT(live && live->isActive());

        Player p;
        FL_ASSERT(h.engine.world().getPlayer(1, p));
        FL_ASSERT(p.getActivePushId() == kNoEntity);
        FL_ASSERT(h.engine.world().getPlayer(3, p));
        FL_ASSERT(!p.hasCountry());

        Country c;
        FL_ASSERT(h.engine.world().getCountry(1, c));
        FL_ASSERT(c.getActiveWars() == 1);
        FL_ASSERT(h.engine.world().getCountry(2, c));
        FL_ASSERT(c.getActiveWars() == 1);
        FL_ASSERT(h.engine.world().countries().size() == 2);

        // Missing accounts open at zero.
        FL_ASSERT(h.balanceOf(AccountKey::player(1)) == 42);
        FL_ASSERT(h.balanceOf(AccountKey::player(2)) == 0);
        FL_ASSERT(h.balanceOf(AccountKey::country(1)) == 1500);
        FL_ASSERT(h.balanceOf(AccountKey::country(2)) == 0);
    }

    // A second active war for the same pair is restored as ended.
    {
        TestHarness h;
        std::string twice = kRepairSnapshot;
        twice.replace(twice.find("status = \"ended\""), 16, "status = \"active\"");
        std::string err;
        SnapshotReport report;
        FL_ASSERT(restoreSnapshot(h.engine, twice, &err, &report));
        FL_ASSERT(report.repairedWars == 1);
        War w;
        FL_ASSERT(h.engine.wars().get(1, w) && w.isActive());
        FL_ASSERT(h.engine.wars().get(2, w) && !w.isActive());
        FL_ASSERT(w.endedAt == 1699999600000LL);
        auto orphan = h.engine.pushes().find(11);
        FL_ASSERT(orphan && orphan->record().status == PushStatus::Cancelled);
        auto kept = h.engine.pushes().find(10);
        FL_ASSERT(kept && kept->isActive());
    }

    // Rejected snapshots leave the engine untouched.
    {
        TestHarness h;
        const EntityId alice = h.addMember("alice", 1);
        std::string err;

        std::string negative = kRepairSnapshot;
        negative.replace(negative.find("balance = 42"), 12, "balance = -5");
        FL_ASSERT(!restoreSnapshot(h.engine, negative, &err));
        FL_ASSERT(err.find("Negative balance") != std::string::npos);

        FL_ASSERT(!restoreSnapshot(h.engine, "version = 2\n", &err));
        FL_ASSERT(err.find("version") != std::string::npos);

        FL_ASSERT(!restoreSnapshot(h.engine, "version = = 1\n", &err));
        FL_ASSERT(!err.empty());

        std::string badStatus = kRepairSnapshot;
        badStatus.replace(badStatus.find("status = \"ended\""), 16, "status = \"paused\"");
        FL_ASSERT(!restoreSnapshot(h.engine, badStatus, &err));

        // Record-level problems are caught before anything is replaced.
        std::string selfWar = kRepairSnapshot;
        selfWar.replace(selfWar.find("defender_country_id = 2"), 23, "defender_country_id = 1");
        FL_ASSERT(!restoreSnapshot(h.engine, selfWar, &err));
        FL_ASSERT(err.find("Malformed war") != std::string::npos);

        std::string noSupport = kRepairSnapshot;
        noSupport.replace(noSupport.find("distance_pushed = 120.0"), 23,
                          "distance_pushed = 120.0\nsupporting_soldiers = 0");
        FL_ASSERT(!restoreSnapshot(h.engine, noSupport, &err));
        FL_ASSERT(err.find("out-of-range") != std::string::npos);

        std::string twinPush = kRepairSnapshot;
        twinPush.replace(twinPush.find("id = 11"), 7, "id = 10");
        FL_ASSERT(!restoreSnapshot(h.engine, twinPush, &err));
        FL_ASSERT(err.find("Duplicate border push") != std::string::npos);

        FL_ASSERT(h.balanceOf(AccountKey::player(alice)) == 100);
        FL_ASSERT(h.engine.wars().wars().empty());
        FL_ASSERT(h.engine.world().countries().size() == 3);
        Player p;
        FL_ASSERT(h.engine.world().getPlayer(alice, p));
        FL_ASSERT(p.getCountryId() == 1);
    }

    // File helpers.
    {
        TestHarness h;
        h.addMember("alice", 2);
        const std::string path = "frontline_snapshot_test.toml";
        std::string err;
        FL_ASSERT(saveSnapshot(h.engine, path, &err));

        TestHarness other;
        FL_ASSERT(loadSnapshot(other.engine, path, &err));
        Country c;
        FL_ASSERT(other.engine.world().getCountry(2, c));
        FL_ASSERT(c.isClaimed());
        std::remove(path.c_str());

        FL_ASSERT(!loadSnapshot(other.engine, "does/not/exist.toml", &err));
        FL_ASSERT(err.find("Cannot open") != std::string::npos);
    }

    return 0;
}
