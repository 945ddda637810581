#include "command_router.h"

#include "log.h"

namespace {

void copyRequestId(const GameEvent& command, GameEvent& reply) {
    if (command.has("request_id")) {
        reply.setInt("request_id", command.getInt("request_id"));
    }
}

void writePush(GameEvent& reply, const BorderPushRecord& r) {
    reply.setInt("push_id", r.id)
         .setInt("war_id", r.warId)
         .setString("status", pushStatusName(r.status))
         .setDouble("push_strength", r.pushStrength)
         .setDouble("resistance_strength", r.resistanceStrength)
         .setDouble("push_speed", r.pushSpeed)
         .setInt("supporting_soldiers", r.supportingSoldiers)
         .setInt("defending_soldiers", r.defendingSoldiers)
         .setDouble("distance_pushed", r.distancePushed)
         .setDouble("territory_gained", r.territoryGained);
}

} // namespace

GameEvent CommandRouter::makeOk(const std::string& command) const {
    GameEvent reply(events::kCommandOk, m_engine.clock().nowMs());
    reply.setString("command", command);
    return reply;
}

GameEvent CommandRouter::makeError(const std::string& command, const OpError& error, TimestampMs now) {
    GameEvent reply(events::kCommandError, now);
    reply.setString("command", command)
         .setString("kind", errorKindName(error.kind))
         .setString("message", error.message);
    if (error.kind == ErrorKind::Cooldown) {
        reply.setInt("remaining_ms", error.remainingMs);
    } else if (error.kind == ErrorKind::InsufficientResources) {
        reply.setInt("required", error.required)
             .setInt("available", error.available);
    }
    return reply;
}

GameEvent CommandRouter::handle(EntityId playerId, const GameEvent& command) {
    const std::string& name = command.type;
    OpError error;
    bool ok = false;
    GameEvent reply = makeOk(name);

    if (name == "ping") {
        reply.setBool("pong", true);
        ok = true;
    } else if (name == "move") {
        const GeoPoint p{command.getDouble("lat"), command.getDouble("lng")};
        ok = m_engine.movePlayer(playerId, p, &error);
        if (ok) reply.setDouble("lat", p.lat).setDouble("lng", p.lng);
    } else if (name == "join_country") {
        bool becameOwner = false;
        const EntityId countryId = command.getInt("country_id", kNoEntity);
        ok = m_engine.joinCountry(playerId, countryId, &becameOwner, &error);
        if (ok) reply.setInt("country_id", countryId).setBool("became_owner", becameOwner);
    } else if (name == "leave_country") {
        bool wasOwner = false;
        ok = m_engine.leaveCountry(playerId, &wasOwner, &error);
        if (ok) reply.setBool("was_owner", wasOwner);
    } else if (name == "declare_war") {
        Player player;
        if (!m_engine.world().getPlayer(playerId, player)) {
            fail(&error, ErrorKind::NotFound, "Player not found");
        } else if (!player.hasCountry()) {
            fail(&error, ErrorKind::Forbidden, "You must be a member of a country");
        } else {
            War war;
            ok = m_engine.declareWar(playerId, player.getCountryId(), command.getInt("target_country_id", kNoEntity),
                                     command.getString("reason"), &war, &error);
            if (ok) reply.setInt("war_id", war.id);
        }
    } else if (name == "end_war") {
        War war;
        ok = m_engine.endWar(command.getInt("war_id", kNoEntity), playerId,
                             command.getInt("winner_country_id", kNoEntity), &war, &error);
        if (ok) reply.setInt("war_id", war.id).setInt("duration_minutes", war.durationMinutes(war.endedAt));
    } else if (name == "start_push") {
        BorderPushRecord record;
        const GeoPoint position{command.getDouble("lat"), command.getDouble("lng")};
        const GeoPoint direction{command.getDouble("direction_lat"), command.getDouble("direction_lng")};
        ok = m_engine.startPush(playerId, command.getInt("war_id", kNoEntity), position, direction,
                                command.getDouble("terrain_modifier", 1.0), &record, &error);
        if (ok) writePush(reply, record);
    } else if (name == "join_push") {
        BorderPushRecord record;
        ok = m_engine.joinPush(command.getInt("push_id", kNoEntity), playerId, &record, &error);
        if (ok) writePush(reply, record);
    } else if (name == "defend_push") {
        BorderPushRecord record;
        ok = m_engine.defendPush(command.getInt("push_id", kNoEntity), playerId, &record, &error);
        if (ok) writePush(reply, record);
    } else if (name == "stop_push") {
        // Players may only cancel; success is decided by the conflict tick.
        const EntityId pushId = command.getInt("push_id", kNoEntity);
        const std::string reason = command.getString("reason", "cancelled");
        std::shared_ptr<BorderPush> push = m_engine.pushes().find(pushId);
        if (!push) {
            fail(&error, ErrorKind::NotFound, "Border push not found");
        } else if (push->getPlayerId() != playerId) {
            fail(&error, ErrorKind::Forbidden, "Only the initiator can stop a border push");
        } else if (reason != "cancelled") {
            fail(&error, ErrorKind::Forbidden, "A border push can only be cancelled by its initiator");
        } else {
            BorderPushRecord record;
            ok = m_engine.stopPush(pushId, reason, &record, &error);
            if (ok) writePush(reply, record);
        }
    } else if (name == "push_progress") {
        PushProgress progress;
        const EntityId pushId = command.getInt("push_id", kNoEntity);
        ok = m_engine.peekProgress(pushId, progress, &error);
        if (ok) {
            reply.setInt("push_id", pushId)
                 .setDouble("distance_pushed", progress.distancePushed)
                 .setDouble("territory_gained", progress.territoryGained)
                 .setDouble("push_speed", progress.pushSpeed)
                 .setString("status", pushStatusName(progress.status))
                 .setBool("is_active", progress.isActive);
        }
    } else {
        fail(&error, ErrorKind::InvalidTarget, "Unknown command '" + name + "'");
    }

    if (!ok) {
        logging::debug("Router", "Player " + std::to_string(playerId) + " " + name + " -> " +
                                 errorKindName(error.kind) + ": " + error.message);
        reply = makeError(name, error, m_engine.clock().nowMs());
    }
    copyRequestId(command, reply);
    return reply;
}
