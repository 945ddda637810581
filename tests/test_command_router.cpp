#include <iostream>

#include "command_router.h"
#include "test_support.h"

#define FL_ASSERT(expr)                                                                             \
    do {                                                                                            \
        if (!(expr)) {                                                                              \
            std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";      \
            return 1;                                                                               \
        }                                                                                           \
    } while (0)

int test_command_router() {
    TestHarness h;
    CommandRouter router(h.engine);
    const TimestampMs now = h.clock.nowMs();

    const EntityId alice = h.addPlayer("alice");
    const EntityId bob = h.addPlayer("bob");
    const EntityId ann = h.addPlayer("ann");

    {
        GameEvent ping("ping", now);
        ping.setInt("request_id", 7);
        const GameEvent reply = router.handle(alice, ping);
        FL_ASSERT(reply.type == events::kCommandOk);
        FL_ASSERT(reply.getString("command") == "ping");
        FL_ASSERT(reply.getBool("pong"));
        FL_ASSERT(reply.getInt("request_id") == 7);
    }
    {
        const GameEvent reply = router.handle(alice, GameEvent("teleport", now));
        FL_ASSERT(reply.type == events::kCommandError);
        FL_ASSERT(reply.getString("kind") == "invalid_target");
        FL_ASSERT(!reply.has("request_id"));
    }

    // Joining through the router.
    {
        GameEvent join("join_country", now);
        join.setInt("country_id", 1);
        GameEvent reply = router.handle(alice, join);
        FL_ASSERT(reply.type == events::kCommandOk);
        FL_ASSERT(reply.getBool("became_owner"));
        FL_ASSERT(router.handle(ann, join).type == events::kCommandOk);
        join.setInt("country_id", 2);
        reply = router.handle(bob, join);
        FL_ASSERT(reply.getBool("became_owner"));

        reply = router.handle(bob, join);
        FL_ASSERT(reply.type == events::kCommandError);
        FL_ASSERT(reply.getString("kind") == "conflict");
    }

    // Declaring war uses the caller's country as aggressor.
    EntityId warId = kNoEntity;
    {
        GameEvent declare("declare_war", now);
        declare.setInt("target_country_id", 2).setString("reason", "grain");
        GameEvent reply = router.handle(ann, declare);
        FL_ASSERT(reply.type == events::kCommandError);
        FL_ASSERT(reply.getString("kind") == "forbidden");

        reply = router.handle(alice, declare);
        FL_ASSERT(reply.type == events::kCommandOk);
        warId = reply.getInt("war_id", kNoEntity);
        War war;
        FL_ASSERT(h.engine.wars().get(warId, war));
        FL_ASSERT(war.aggressorCountryId == 1 && war.reason == "grain");

        // Cooldown errors carry the remaining time.
        h.clock.advance(2000);
        declare.setInt("target_country_id", 3);
        FL_ASSERT(h.engine.joinCountry(h.addPlayer("cid"), 3));
        reply = router.handle(alice, declare);
        FL_ASSERT(reply.type == events::kCommandError);
        FL_ASSERT(reply.getString("kind") == "cooldown");
        FL_ASSERT(reply.getInt("remaining_ms") == h.config.cooldowns.warDeclarationMs - 2000);
    }

    // Push lifecycle.
    EntityId pushId = kNoEntity;
    {
        GameEvent start("start_push", h.clock.nowMs());
        start.setInt("war_id", warId)
             .setDouble("lat", 45.0).setDouble("lng", 7.0)
             .setDouble("direction_lat", 45.5).setDouble("direction_lng", 7.5);
        GameEvent reply = router.handle(alice, start);
        FL_ASSERT(reply.type == events::kCommandOk);
        pushId = reply.getInt("push_id", kNoEntity);
        FL_ASSERT(pushId != kNoEntity);
        FL_ASSERT(reply.getString("status") == "active");
        FL_ASSERT(reply.getDouble("push_speed") == 1.0);

        GameEvent join("join_push", h.clock.nowMs());
        join.setInt("push_id", pushId);
        reply = router.handle(ann, join);
        FL_ASSERT(reply.getInt("supporting_soldiers") == 2);

        GameEvent defend("defend_push", h.clock.nowMs());
        defend.setInt("push_id", pushId);
        reply = router.handle(bob, defend);
        FL_ASSERT(reply.getInt("defending_soldiers") == 1);

        h.clock.advance(3000);
        GameEvent progress("push_progress", h.clock.nowMs());
        progress.setInt("push_id", pushId);
        reply = router.handle(bob, progress);
        FL_ASSERT(reply.getBool("is_active"));
        FL_ASSERT(reply.getDouble("distance_pushed") > 4.0);

        GameEvent stop("stop_push", h.clock.nowMs());
        stop.setInt("push_id", pushId).setString("reason", "regroup");
        reply = router.handle(ann, stop);
        FL_ASSERT(reply.type == events::kCommandError);
        FL_ASSERT(reply.getString("kind") == "forbidden");

        // The initiator cannot claim success for a push that has barely moved.
        GameEvent claim("stop_push", h.clock.nowMs());
        claim.setInt("push_id", pushId).setString("reason", "successful");
        reply = router.handle(alice, claim);
        FL_ASSERT(reply.type == events::kCommandError);
        FL_ASSERT(reply.getString("kind") == "forbidden");
        reply = router.handle(alice, stop);
        FL_ASSERT(reply.getString("kind") == "forbidden");
        auto still = h.engine.pushes().find(pushId);
        FL_ASSERT(still && still->isActive());

        GameEvent cancel("stop_push", h.clock.nowMs());
        cancel.setInt("push_id", pushId);
        reply = router.handle(alice, cancel);
        FL_ASSERT(reply.type == events::kCommandOk);
        FL_ASSERT(reply.getString("status") == "cancelled");

        stop.setInt("push_id", 999);
        reply = router.handle(alice, stop);
        FL_ASSERT(reply.getString("kind") == "not_found");
    }

    // Insufficient funds report both sides of the shortfall.
    {
        OpError err;
        failInsufficient(&err, "Not enough resources", 10, 3);
        const GameEvent reply = CommandRouter::makeError("start_push", err, now);
        FL_ASSERT(reply.getString("kind") == "insufficient_resources");
        FL_ASSERT(reply.getInt("required") == 10);
        FL_ASSERT(reply.getInt("available") == 3);
        FL_ASSERT(!reply.has("remaining_ms"));
    }

    // Ending and leaving.
    {
        GameEvent end("end_war", h.clock.nowMs());
        end.setInt("war_id", warId);
        GameEvent reply = router.handle(bob, end);
        FL_ASSERT(reply.getString("kind") == "forbidden");
        reply = router.handle(alice, end);
        FL_ASSERT(reply.type == events::kCommandOk);
        FL_ASSERT(!h.engine.findActiveWarBetween(1, 2));

        reply = router.handle(bob, GameEvent("leave_country", h.clock.nowMs()));
        FL_ASSERT(reply.type == events::kCommandOk);
        FL_ASSERT(reply.getBool("was_owner"));

        GameEvent move("move", h.clock.nowMs());
        move.setDouble("lat", 95.0).setDouble("lng", 0.0);
        reply = router.handle(bob, move);
        FL_ASSERT(reply.getString("kind") == "invalid_target");
        move.setDouble("lat", 40.0);
        reply = router.handle(bob, move);
        FL_ASSERT(reply.type == events::kCommandOk);
        FL_ASSERT(reply.getDouble("lat") == 40.0);
    }

    return 0;
}
