#include "conflict_engine.h"

#include <algorithm>
#include <exception>
#include <map>
#include <vector>

#include "log.h"

ConflictEngine::ConflictEngine(const GameConfig& config, const GameClock& clock, BroadcastHub& hub)
    : m_config(config),
      m_clock(clock),
      m_hub(hub),
      m_world(m_ledger),
      m_pushes(PushPhysics::fromConfig(config.conflict)) {}

int ConflictEngine::seedCountries() {
    std::vector<GameConfig::CountrySeed> seeds = m_config.countries;
    if (seeds.empty()) {
        seeds = GameConfig::defaultCountries();
    }
    int added = 0;
    for (auto seed : seeds) {
        if (seed.maxSoldiers <= 0) {
            seed.maxSoldiers = m_config.server.maxPlayersPerCountry;
        }
        if (m_world.addCountry(seed, m_config.economy.countryStartingResources) != kNoEntity) {
            ++added;
        }
    }
    logging::info("Engine", "Seeded " + std::to_string(added) + " countries.");
    return added;
}

EntityId ConflictEngine::registerPlayer(const std::string& name, OpError* error) {
    return m_world.registerPlayer(name, m_config.economy.playerStartingResources, error);
}

std::string ConflictEngine::playerName(EntityId playerId) const {
    Player p;
    return m_world.getPlayer(playerId, p) ? p.getName() : std::string();
}

std::string ConflictEngine::countryName(EntityId countryId) const {
    Country c;
    return m_world.getCountry(countryId, c) ? c.getName() : std::string();
}

// ---------------------------------------------------------------------------
// World

bool ConflictEngine::joinCountry(EntityId playerId, EntityId countryId, bool* becameOwner, OpError* error) {
    const TimestampMs now = m_clock.nowMs();
    bool ok = false;
    bool owner = false;
    std::string name;

    const bool found = m_world.withPlayer(playerId, [&](Player& player) {
        if (player.hasCountry()) {
            fail(error, ErrorKind::Conflict, "You must leave your current country before joining another");
            return;
        }
        bool countryOk = false;
        const bool countryFound = m_world.withCountry(countryId, [&](Country& country) {
            if (!country.isClaimed()) {
                countryOk = country.claim(playerId, now, error);
                owner = countryOk;
            } else {
                countryOk = country.addSoldier(error);
            }
            if (countryOk) country.touch(now);
        });
        if (!countryFound) {
            fail(error, ErrorKind::NotFound, "Country not found");
            return;
        }
        if (!countryOk) return;
        player.setCountryId(countryId);
        name = player.getName();
        ok = true;
    });
    if (!found) {
        return fail(error, ErrorKind::NotFound, "Player not found");
    }
    if (!ok) return false;

    GameEvent event(events::kPlayerJoinedCountry, now);
    event.setInt("player_id", playerId)
         .setString("player_name", name)
         .setInt("country_id", countryId)
         .setBool("became_owner", owner);
    // Existing members hear about the newcomer; the newcomer's connections join afterwards.
    m_hub.broadcast(countryId, event);
    m_hub.movePlayerRooms(playerId, kNoEntity, countryId);

    logging::info("Engine", name + " joined " + countryName(countryId) + (owner ? " as owner." : "."));
    if (becameOwner) *becameOwner = owner;
    return true;
}

bool ConflictEngine::leaveCountry(EntityId playerId, bool* wasOwner, OpError* error) {
    const TimestampMs now = m_clock.nowMs();
    bool ok = false;
    bool owner = false;
    bool unclaimed = false;
    EntityId countryId = kNoEntity;
    std::string name;

    const bool found = m_world.withPlayer(playerId, [&](Player& player) {
        if (!player.hasCountry()) {
            fail(error, ErrorKind::InvalidState, "You are not a member of any country");
            return;
        }
        countryId = player.getCountryId();
        const bool countryFound = m_world.withCountry(countryId, [&](Country& country) {
            owner = (country.getOwnerId() == playerId);
            OpError removeError;
            if (!country.removeSoldier(&unclaimed, &removeError)) {
                logging::warn("Engine", "Leaving " + country.getName() + ": " + removeError.message);
            }
            country.touch(now);
        });
        if (!countryFound) {
            logging::warn("Engine", "Player " + std::to_string(playerId) + " referenced missing country " +
                                    std::to_string(countryId));
        }
        player.setCountryId(kNoEntity);
        player.clearPosition();
        name = player.getName();
        ok = true;
    });
    if (!found) {
        return fail(error, ErrorKind::NotFound, "Player not found");
    }
    if (!ok) return false;

    m_hub.movePlayerRooms(playerId, countryId, kNoEntity);
    GameEvent event(events::kPlayerLeftCountry, now);
    event.setInt("player_id", playerId)
         .setString("player_name", name)
         .setInt("country_id", countryId)
         .setBool("was_owner", owner)
         .setBool("country_unclaimed", unclaimed);
    m_hub.broadcast(countryId, event);

    logging::info("Engine", name + " left " + countryName(countryId) + ".");
    if (wasOwner) *wasOwner = owner;
    return true;
}

bool ConflictEngine::movePlayer(EntityId playerId, const GeoPoint& position, OpError* error) {
    if (!isValidCoordinate(position)) {
        return fail(error, ErrorKind::InvalidTarget, "Invalid coordinates");
    }
    const TimestampMs now = m_clock.nowMs();
    bool ok = false;
    EntityId countryId = kNoEntity;
    std::string name;

    const bool found = m_world.withPlayer(playerId, [&](Player& player) {
        const long long remaining = player.movementCooldownRemaining(now, m_config.cooldowns.movementMs);
        if (remaining > 0) {
            failCooldown(error, "Movement is on cooldown", remaining);
            return;
        }
        player.recordMovement(position, now);
        countryId = player.getCountryId();
        name = player.getName();
        ok = true;
    });
    if (!found) {
        return fail(error, ErrorKind::NotFound, "Player not found");
    }
    if (!ok) return false;

    if (countryId != kNoEntity) {
        GameEvent event(events::kPlayerMoved, now);
        event.setInt("player_id", playerId)
             .setString("player_name", name)
             .setDouble("lat", position.lat)
             .setDouble("lng", position.lng);
        m_hub.broadcast(countryId, event);
    }
    return true;
}

// ---------------------------------------------------------------------------
// Wars

bool ConflictEngine::declareWar(EntityId declarerPlayerId,
                                EntityId aggressorCountryId,
                                EntityId targetCountryId,
                                const std::string& reason,
                                War* out,
                                OpError* error) {
    const TimestampMs now = m_clock.nowMs();

    Player declarer;
    if (!m_world.getPlayer(declarerPlayerId, declarer)) {
        return fail(error, ErrorKind::NotFound, "Player not found");
    }
    Country aggressor;
    Country target;
    if (!m_world.getCountry(aggressorCountryId, aggressor)) {
        return fail(error, ErrorKind::NotFound, "Aggressor country not found");
    }
    if (!m_world.getCountry(targetCountryId, target)) {
        return fail(error, ErrorKind::NotFound, "Target country not found");
    }
    if (aggressor.getOwnerId() != declarerPlayerId) {
        return fail(error, ErrorKind::Forbidden, "Only the country owner can declare war");
    }
    if (aggressorCountryId == targetCountryId) {
        return fail(error, ErrorKind::InvalidTarget, "Cannot declare war on your own country");
    }
    if (!target.isClaimed()) {
        return fail(error, ErrorKind::InvalidTarget, "Cannot declare war on unclaimed territory");
    }

    const std::string warReason = reason.empty() ? "War declared by " + declarer.getName() : reason;
    War war;
    const bool created = m_wars.create(
        aggressorCountryId, targetCountryId, declarerPlayerId, warReason, now,
        m_config.cooldowns.warDeclarationMs,
        [this, now](const War& w) {
            m_world.withCountryPair(w.aggressorCountryId, w.defenderCountryId, [now](Country& a, Country& d) {
                a.onWarStarted();
                d.onWarStarted();
                a.touch(now);
                d.touch(now);
            });
        },
        &war, error);
    if (!created) return false;

    m_world.withPlayer(declarerPlayerId, [now](Player& p) { p.recordWarDeclared(now); });

    GameEvent event(events::kWarDeclared, now);
    event.setInt("war_id", war.id)
         .setInt("aggressor_country_id", aggressorCountryId)
         .setString("aggressor_name", aggressor.getName())
         .setString("aggressor_owner", declarer.getName())
         .setInt("defender_country_id", targetCountryId)
         .setString("defender_name", target.getName())
         .setInt("declared_by", declarerPlayerId)
         .setInt("declared_at", war.declaredAt)
         .setString("reason", war.reason);
    m_hub.broadcastGlobal(event);

    logging::info("Engine", aggressor.getName() + " declared war on " + target.getName() +
                            " (war " + std::to_string(war.id) + ").");
    if (out) *out = war;
    return true;
}

bool ConflictEngine::endWar(EntityId warId, EntityId requestorPlayerId, EntityId winnerCountryId,
                            War* out, OpError* error) {
    const TimestampMs now = m_clock.nowMs();
    War war;
    const bool ended = m_wars.end(
        warId, requestorPlayerId, winnerCountryId, now,
        [this, now](const War& w) {
            m_world.withCountryPair(w.aggressorCountryId, w.defenderCountryId, [&w, now](Country& a, Country& d) {
                a.onWarEnded();
                d.onWarEnded();
                a.touch(now);
                d.touch(now);
                if (w.winnerCountryId == a.getId()) {
                    a.recordWarWon();
                    d.recordWarLost();
                } else if (w.winnerCountryId == d.getId()) {
                    d.recordWarWon();
                    a.recordWarLost();
                }
            });
        },
        &war, error);
    if (!ended) return false;

    // Each push is cancelled under its own lock; one failing does not stop the rest.
    int cancelled = 0;
    for (const auto& push : m_pushes.forWar(warId)) {
        if (!push->isActive()) continue;
        BorderPushRecord record;
        OpError pushError;
        if (!push->finish(PushStatus::Cancelled, now, &record, &pushError)) {
            if (pushError.kind == ErrorKind::InvalidState) continue; // finished concurrently
            logging::error("Engine", "Cancelling push " + std::to_string(push->getId()) + " of war " +
                                     std::to_string(warId) + ": " + pushError.message);
            continue;
        }
        applyTerminalEffects(record, now);
        broadcastPushCancelled(record, now, "war_ended");
        ++cancelled;
    }

    m_wars.get(warId, war);

    GameEvent event(events::kWarEnded, now);
    event.setInt("war_id", war.id)
         .setInt("ended_by", requestorPlayerId)
         .setString("ended_by_name", playerName(requestorPlayerId))
         .setInt("duration_minutes", war.durationMinutes(now))
         .setDouble("territory_exchanged", war.territoryExchanged)
         .setInt("cancelled_pushes", cancelled);
    if (war.winnerCountryId != kNoEntity) {
        event.setInt("winner_country_id", war.winnerCountryId);
    }
    m_hub.broadcastGlobal(event);

    logging::info("Engine", "War " + std::to_string(war.id) + " ended after " +
                            std::to_string(war.durationMinutes(now)) + " min, " +
                            std::to_string(cancelled) + " pushes cancelled.");
    if (out) *out = war;
    return true;
}

bool ConflictEngine::findActiveWarBetween(EntityId countryA, EntityId countryB, War* out) const {
    return m_wars.findActiveBetween(countryA, countryB, out);
}

void ConflictEngine::recountActiveWars() {
    std::map<EntityId, int> counts;
    for (const War& w : m_wars.activeWars()) {
        ++counts[w.aggressorCountryId];
        ++counts[w.defenderCountryId];
    }
    for (EntityId id : m_world.countryIds()) {
        const int count = counts.count(id) ? counts[id] : 0;
        m_world.withCountry(id, [count](Country& c) { c.setActiveWars(count); });
    }
}

// ---------------------------------------------------------------------------
// Border pushes

bool ConflictEngine::startPush(EntityId playerId,
                               EntityId warId,
                               const GeoPoint& position,
                               const GeoPoint& direction,
                               double terrainModifier,
                               BorderPushRecord* out,
                               OpError* error) {
    if (!isValidCoordinate(position) || !isValidCoordinate(direction)) {
        return fail(error, ErrorKind::InvalidTarget, "Invalid coordinates");
    }
    const TimestampMs now = m_clock.nowMs();
    const long long cost = m_config.conflict.pushCost;
    const AccountKey account = AccountKey::player(playerId);

    bool ok = false;
    std::shared_ptr<BorderPush> push;
    std::string name;

    const bool found = m_world.withPlayer(playerId, [&](Player& player) {
        if (!player.hasCountry()) {
            fail(error, ErrorKind::Forbidden, "You must be a member of a country");
            return;
        }
        const EntityId sourceCountryId = player.getCountryId();

        if (player.getActivePushId() != kNoEntity) {
            std::shared_ptr<BorderPush> current = m_pushes.find(player.getActivePushId());
            if (current && current->isActive()) {
                fail(error, ErrorKind::Conflict, "You already have an active border push");
                return;
            }
            player.clearActivePush(player.getActivePushId());
        }
        const long long remaining = player.pushCooldownRemaining(now, m_config.conflict.pushCooldownMs);
        if (remaining > 0) {
            failCooldown(error, "Border push is on cooldown", remaining);
            return;
        }

        War war;
        if (!m_wars.get(warId, war)) {
            fail(error, ErrorKind::NotFound, "War not found");
            return;
        }
        if (!war.isActive()) {
            fail(error, ErrorKind::InvalidState, "War is not active");
            return;
        }
        if (war.aggressorCountryId != sourceCountryId) {
            fail(error, ErrorKind::Forbidden, "Only the aggressor country can push");
            return;
        }

        // Ledger before conflict: the debit completes before any war or push lock.
        if (!m_ledger.debit(account, cost, error)) return;

        OpError createError;
        const bool warFound = m_wars.withWar(warId, [&](War& w) {
            if (!w.isActive()) {
                fail(&createError, ErrorKind::InvalidState, "War is not active");
                return;
            }
            push = m_pushes.create(warId, playerId, w.aggressorCountryId, w.defenderCountryId,
                                   position, direction, terrainModifier, cost, now);
            w.aggressorSoldiersParticipated += 1;
            w.maxSimultaneousPushes = std::max(w.maxSimultaneousPushes, m_pushes.activeCountForWar(warId));
        });
        if (!warFound) {
            fail(&createError, ErrorKind::NotFound, "War not found");
        }
        if (!push) {
            OpError refundError;
            if (!m_ledger.credit(account, cost, &refundError)) {
                logging::error("Engine", "Refund to player " + std::to_string(playerId) + " failed: " +
                                         refundError.message);
            }
            if (error) *error = createError;
            return;
        }

        player.recordPushStarted(push->getId(), now);
        name = player.getName();
        ok = true;
    });
    if (!found) {
        return fail(error, ErrorKind::NotFound, "Player not found");
    }
    if (!ok) return false;

    const BorderPushRecord record = push->record();

    GameEvent started(events::kPushStarted, now);
    started.setInt("push_id", record.id)
           .setInt("war_id", record.warId)
           .setInt("player_id", playerId)
           .setString("player", name)
           .setDouble("lat", record.position.lat)
           .setDouble("lng", record.position.lng)
           .setDouble("direction_lat", record.direction.lat)
           .setDouble("direction_lng", record.direction.lng)
           .setDouble("push_speed", record.pushSpeed);
    m_hub.broadcast(record.sourceCountryId, started);

    GameEvent incoming(events::kPushIncoming, now);
    incoming.setInt("push_id", record.id)
            .setInt("war_id", record.warId)
            .setInt("attacker_country", record.sourceCountryId)
            .setDouble("lat", record.position.lat)
            .setDouble("lng", record.position.lng);
    m_hub.broadcast(record.targetCountryId, incoming);

    logging::info("Engine", name + " started push " + std::to_string(record.id) + " in war " +
                            std::to_string(warId) + ".");
    if (out) *out = record;
    return true;
}

bool ConflictEngine::joinPush(EntityId pushId, EntityId playerId, BorderPushRecord* out, OpError* error) {
    const TimestampMs now = m_clock.nowMs();
    Player player;
    if (!m_world.getPlayer(playerId, player)) {
        return fail(error, ErrorKind::NotFound, "Player not found");
    }
    std::shared_ptr<BorderPush> push = m_pushes.find(pushId);
    if (!push) {
        return fail(error, ErrorKind::NotFound, "Border push not found");
    }
    if (!player.hasCountry() || player.getCountryId() != push->getSourceCountryId()) {
        return fail(error, ErrorKind::Forbidden, "You can only join border pushes from your own country");
    }

    BorderPushRecord record;
    if (!push->addSupporter(playerId, &record, error)) return false;
    m_wars.withWar(push->getWarId(), [](War& w) { w.aggressorSoldiersParticipated += 1; });

    GameEvent event(events::kPushSupportAdded, now);
    event.setInt("push_id", pushId)
         .setInt("player_id", playerId)
         .setString("supporter", player.getName())
         .setInt("total_supporters", record.supportingSoldiers)
         .setDouble("new_strength", record.pushStrength)
         .setDouble("new_speed", record.pushSpeed);
    m_hub.broadcast(push->getSourceCountryId(), event);

    if (out) *out = record;
    return true;
}

bool ConflictEngine::defendPush(EntityId pushId, EntityId playerId, BorderPushRecord* out, OpError* error) {
    const TimestampMs now = m_clock.nowMs();
    Player player;
    if (!m_world.getPlayer(playerId, player)) {
        return fail(error, ErrorKind::NotFound, "Player not found");
    }
    std::shared_ptr<BorderPush> push = m_pushes.find(pushId);
    if (!push) {
        return fail(error, ErrorKind::NotFound, "Border push not found");
    }
    if (!player.hasCountry() || player.getCountryId() != push->getTargetCountryId()) {
        return fail(error, ErrorKind::Forbidden, "You can only defend against pushes targeting your country");
    }

    BorderPushRecord record;
    if (!push->addDefender(playerId, &record, error)) return false;
    m_wars.withWar(push->getWarId(), [](War& w) { w.defenderSoldiersParticipated += 1; });

    GameEvent event(events::kPushDefenseAdded, now);
    event.setInt("push_id", pushId)
         .setInt("player_id", playerId)
         .setString("defender", player.getName())
         .setInt("total_defenders", record.defendingSoldiers)
         .setDouble("new_resistance", record.resistanceStrength)
         .setDouble("new_speed", record.pushSpeed);
    m_hub.broadcast(push->getTargetCountryId(), event);

    if (out) *out = record;
    return true;
}

bool ConflictEngine::stopPush(EntityId pushId, const std::string& reason, BorderPushRecord* out, OpError* error) {
    const TimestampMs now = m_clock.nowMs();
    std::shared_ptr<BorderPush> push = m_pushes.find(pushId);
    if (!push) {
        return fail(error, ErrorKind::NotFound, "Border push not found");
    }
    const PushStatus terminal = (reason == "successful") ? PushStatus::Successful : PushStatus::Cancelled;

    BorderPushRecord record;
    if (!push->finish(terminal, now, &record, error)) return false;
    applyTerminalEffects(record, now);

    if (terminal == PushStatus::Successful) {
        GameEvent completed(events::kPushCompleted, now);
        completed.setInt("push_id", pushId)
                 .setDouble("territory_gained", record.territoryGained)
                 .setDouble("distance_pushed", record.distancePushed);
        m_hub.broadcast(record.sourceCountryId, completed);

        GameEvent lost(events::kPushLost, now);
        lost.setInt("push_id", pushId)
            .setDouble("territory_lost", record.territoryGained);
        m_hub.broadcast(record.targetCountryId, lost);
    } else {
        broadcastPushCancelled(record, now, reason);
    }

    logging::info("Engine", "Push " + std::to_string(pushId) + " stopped as " + pushStatusName(terminal) + ".");
    if (out) *out = record;
    return true;
}

bool ConflictEngine::peekProgress(EntityId pushId, PushProgress& out, OpError* error) const {
    std::shared_ptr<BorderPush> push = m_pushes.find(pushId);
    if (!push) {
        return fail(error, ErrorKind::NotFound, "Border push not found");
    }
    out = push->peekProgress(m_clock.nowMs());
    return true;
}

bool ConflictEngine::commitProgress(EntityId pushId, BorderPushRecord* out, OpError* error) {
    std::shared_ptr<BorderPush> push = m_pushes.find(pushId);
    if (!push) {
        return fail(error, ErrorKind::NotFound, "Border push not found");
    }
    return push->commitProgress(m_clock.nowMs(), out, error);
}

void ConflictEngine::applyTerminalEffects(const BorderPushRecord& record, TimestampMs now) {
    const bool successful = (record.status == PushStatus::Successful);
    const double territory = record.territoryGained;

    m_wars.withWar(record.warId, [&](War& w) {
        w.totalBorderPushes += 1;
        if (successful) w.territoryExchanged += territory;
    });
    if (successful) {
        m_world.withCountryPair(record.sourceCountryId, record.targetCountryId, [&](Country& source, Country& target) {
            source.addTerritoryGained(territory);
            target.addTerritoryLost(territory);
            source.touch(now);
            target.touch(now);
        });
    }
    m_world.withPlayer(record.playerId, [&record](Player& p) { p.clearActivePush(record.id); });
}

void ConflictEngine::broadcastPushCancelled(const BorderPushRecord& record, TimestampMs now, const std::string& reason) {
    GameEvent event(events::kPushCancelled, now);
    event.setInt("push_id", record.id)
         .setInt("war_id", record.warId)
         .setString("reason", reason)
         .setDouble("distance_pushed", record.distancePushed);
    m_hub.broadcast(record.sourceCountryId, event);
    m_hub.broadcast(record.targetCountryId, event);
}

// ---------------------------------------------------------------------------
// Ticks

ConflictEngine::TickOutcome ConflictEngine::tickPush(const std::shared_ptr<BorderPush>& push, TimestampMs now) {
    if (push->isFaulted()) return TickOutcome::Skipped;

    War war;
    if (!m_wars.get(push->getWarId(), war)) {
        push->markFaulted("references missing war " + std::to_string(push->getWarId()));
        return TickOutcome::Skipped;
    }
    if (!war.isActive()) {
        // The war ended between the end-war sweep and this tick.
        BorderPushRecord record;
        OpError error;
        if (!push->finish(PushStatus::Cancelled, now, &record, &error)) return TickOutcome::Skipped;
        applyTerminalEffects(record, now);
        broadcastPushCancelled(record, now, "war_ended");
        return TickOutcome::Cancelled;
    }

    bool completed = false;
    BorderPushRecord record;
    OpError error;
    if (!push->advance(now, m_config.conflict.completionDistanceM, &completed, &record, &error)) {
        if (error.kind == ErrorKind::InvariantViolation) {
            logging::error("Tick", "Push " + std::to_string(push->getId()) + ": " + error.message);
        }
        return TickOutcome::Skipped;
    }

    if (completed) {
        applyTerminalEffects(record, now);

        GameEvent done(events::kPushCompleted, now);
        done.setInt("push_id", record.id)
            .setDouble("territory_gained", record.territoryGained)
            .setDouble("distance_pushed", record.distancePushed);
        m_hub.broadcast(record.sourceCountryId, done);

        GameEvent lost(events::kPushLost, now);
        lost.setInt("push_id", record.id)
            .setDouble("territory_lost", record.territoryGained);
        m_hub.broadcast(record.targetCountryId, lost);

        logging::info("Tick", "Push " + std::to_string(record.id) + " completed, " +
                              std::to_string(record.territoryGained) + " km2 taken.");
        return TickOutcome::Completed;
    }

    GameEvent progress(events::kPushProgress, now);
    progress.setInt("push_id", record.id)
            .setDouble("distance_pushed", record.distancePushed)
            .setDouble("territory_gained", record.territoryGained)
            .setDouble("push_speed", record.pushSpeed);
    m_hub.broadcast(record.sourceCountryId, progress);
    m_hub.broadcast(record.targetCountryId, progress);
    return TickOutcome::Progressed;
}

ConflictEngine::ConflictTickReport ConflictEngine::runConflictTick() {
    const TimestampMs now = m_clock.nowMs();
    const std::vector<std::shared_ptr<BorderPush>> active = m_pushes.active();
    const int count = static_cast<int>(active.size());
    std::vector<int> outcomes(active.size(), -1);
    const bool parallel = m_config.conflict.parallelTick;

    #pragma omp parallel for schedule(dynamic) if(parallel)
    for (int i = 0; i < count; ++i) {
        try {
            outcomes[i] = static_cast<int>(tickPush(active[i], now));
        } catch (const std::exception& e) {
            logging::error("Tick", "Push " + std::to_string(active[i]->getId()) + " failed: " + e.what());
        }
    }

    ConflictTickReport report;
    report.processed = count;
    for (int outcome : outcomes) {
        if (outcome < 0) {
            ++report.failed;
        } else if (outcome == static_cast<int>(TickOutcome::Completed)) {
            ++report.completed;
        } else if (outcome == static_cast<int>(TickOutcome::Cancelled)) {
            ++report.cancelled;
        }
    }
    if (count > 0) {
        logging::debug("Tick", "Conflict tick: " + std::to_string(count) + " pushes, " +
                               std::to_string(report.completed) + " completed, " +
                               std::to_string(report.failed) + " failed.");
    }
    return report;
}

ConflictEngine::EconomyTickReport ConflictEngine::runEconomyTick() {
    const TimestampMs now = m_clock.nowMs();
    EconomyTickReport report;

    for (const Country& country : m_world.countries()) {
        if (!country.isClaimed()) continue;
        ++report.countries;

        OpError error;
        const AccountKey account = AccountKey::country(country.getId());
        const long long amount = m_ledger.generate(account, country.getResourceGenerationRate(), &error);
        if (error.kind != ErrorKind::None) {
            ++report.failed;
            logging::error("Tick", "Generation for " + country.getName() + " failed: " + error.message);
            continue;
        }
        report.generated += amount;

        long long total = 0;
        m_ledger.balance(account, total);
        GameEvent event(events::kResourcesGenerated, now);
        event.setInt("country_id", country.getId())
             .setInt("amount", amount)
             .setInt("total_resources", total);
        m_hub.broadcast(country.getId(), event);
    }

    logging::debug("Tick", "Economy tick: " + std::to_string(report.countries) + " countries, " +
                           std::to_string(report.generated) + " generated.");
    return report;
}

void ConflictEngine::broadcastServerStats() {
    GameEvent event(events::kServerStats, m_clock.nowMs());
    event.setInt("connected_players", static_cast<long long>(m_hub.connectionCount()))
         .setInt("active_rooms", static_cast<long long>(m_hub.activeRoomCount()))
         .setInt("active_wars", static_cast<long long>(m_wars.activeCount()))
         .setInt("active_pushes", static_cast<long long>(m_pushes.active().size()));
    m_hub.broadcastGlobal(event);
}
