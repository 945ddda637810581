#include "snapshot.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

#include <toml++/toml.hpp>

#include "conflict_engine.h"
#include "log.h"

namespace {

constexpr std::int64_t kSnapshotVersion = 1;

std::int64_t readInt(const toml::table& t, std::string_view key, std::int64_t fallback) {
    return t[key].value_or(fallback);
}

double readDouble(const toml::table& t, std::string_view key, double fallback) {
    if (const auto v = t[key].value<double>()) return *v;
    if (const auto vi = t[key].value<std::int64_t>()) return static_cast<double>(*vi);
    return fallback;
}

std::string readString(const toml::table& t, std::string_view key) {
    return t[key].value_or(std::string{});
}

bool readBool(const toml::table& t, std::string_view key, bool fallback) {
    return t[key].value_or(fallback);
}

void insertId(toml::table& t, std::string_view key, EntityId id) {
    if (id != kNoEntity) {
        t.insert(key, static_cast<std::int64_t>(id));
    }
}

toml::array idArray(const std::vector<EntityId>& ids) {
    toml::array arr;
    for (EntityId id : ids) arr.push_back(static_cast<std::int64_t>(id));
    return arr;
}

std::vector<EntityId> readIdArray(const toml::table& t, std::string_view key) {
    std::vector<EntityId> out;
    if (const toml::array* arr = t[key].as_array()) {
        for (const toml::node& node : *arr) {
            if (const auto v = node.value<std::int64_t>()) out.push_back(*v);
        }
    }
    return out;
}

template <typename Fn>
bool forEachTable(const toml::table& root, std::string_view section, Fn&& fn) {
    const toml::array* arr = root[section].as_array();
    if (!arr) return true;
    for (const toml::node& node : *arr) {
        const toml::table* t = node.as_table();
        if (!t) continue;
        if (!fn(*t)) return false;
    }
    return true;
}

bool setError(std::string* errorMessage, const std::string& message) {
    if (errorMessage) *errorMessage = message;
    return false;
}

void openMissingAccount(ConflictEngine& engine, const AccountKey& key) {
    if (engine.ledger().hasAccount(key)) return;
    OpError err;
    if (engine.ledger().openAccount(key, 0, &err)) {
        logging::warn("Snapshot", std::string("No balance stored for ") + accountKindName(key.kind) + " " +
                                  std::to_string(key.id) + "; opened with 0.");
    } else {
        logging::error("Snapshot", err.message);
    }
}

struct AccountRow {
    AccountKey key;
    long long balance = 0;
};

} // namespace

std::string renderSnapshot(ConflictEngine& engine) {
    toml::table root;
    root.insert("version", kSnapshotVersion);
    root.insert("saved_at", static_cast<std::int64_t>(engine.clock().nowMs()));

    toml::array countries;
    for (const Country& c : engine.world().countries()) {
        toml::table t;
        t.insert("id", static_cast<std::int64_t>(c.getId()));
        t.insert("name", c.getName());
        t.insert("iso_code", c.getIsoCode());
        t.insert("is_claimed", c.isClaimed());
        insertId(t, "owner_id", c.getOwnerId());
        t.insert("claimed_at", static_cast<std::int64_t>(c.getClaimedAt()));
        t.insert("soldier_count", c.getSoldierCount());
        t.insert("max_soldiers", c.getMaxSoldiers());
        t.insert("resource_generation_rate", c.getResourceGenerationRate());
        t.insert("terrain_modifier", c.getTerrainModifier());
        t.insert("defense_strength", c.getDefenseStrength());
        t.insert("active_wars", c.getActiveWars());
        t.insert("wars_won", c.getWarsWon());
        t.insert("wars_lost", c.getWarsLost());
        t.insert("territory_gained", c.getTerritoryGained());
        t.insert("territory_lost", c.getTerritoryLost());
        countries.push_back(std::move(t));
    }
    root.insert("countries", std::move(countries));

    toml::array players;
    for (const Player& p : engine.world().players()) {
        toml::table t;
        t.insert("id", static_cast<std::int64_t>(p.getId()));
        t.insert("name", p.getName());
        insertId(t, "country_id", p.getCountryId());
        if (p.hasPosition()) {
            t.insert("lat", p.getPosition().lat);
            t.insert("lng", p.getPosition().lng);
        }
        t.insert("last_movement", static_cast<std::int64_t>(p.getLastMovement()));
        t.insert("last_war_declared_at", static_cast<std::int64_t>(p.getLastWarDeclaredAt()));
        t.insert("last_push_started_at", static_cast<std::int64_t>(p.getLastPushStartedAt()));
        insertId(t, "active_push_id", p.getActivePushId());
        t.insert("wars_declared", p.getWarsDeclared());
        players.push_back(std::move(t));
    }
    root.insert("players", std::move(players));

    toml::array wars;
    for (const War& w : engine.wars().wars()) {
        toml::table t;
        t.insert("id", static_cast<std::int64_t>(w.id));
        t.insert("aggressor_country_id", static_cast<std::int64_t>(w.aggressorCountryId));
        t.insert("defender_country_id", static_cast<std::int64_t>(w.defenderCountryId));
        insertId(t, "declared_by", w.declaredBy);
        insertId(t, "ended_by", w.endedBy);
        insertId(t, "winner_country_id", w.winnerCountryId);
        t.insert("reason", w.reason);
        t.insert("status", std::string(warStatusName(w.status)));
        t.insert("declared_at", static_cast<std::int64_t>(w.declaredAt));
        t.insert("ended_at", static_cast<std::int64_t>(w.endedAt));
        t.insert("territory_exchanged", w.territoryExchanged);
        t.insert("total_border_pushes", w.totalBorderPushes);
        t.insert("aggressor_soldiers_participated", w.aggressorSoldiersParticipated);
        t.insert("defender_soldiers_participated", w.defenderSoldiersParticipated);
        t.insert("max_simultaneous_pushes", w.maxSimultaneousPushes);
        wars.push_back(std::move(t));
    }
    root.insert("wars", std::move(wars));

    toml::array pushes;
    for (const auto& push : engine.pushes().all()) {
        const BorderPushRecord r = push->record();
        toml::table t;
        t.insert("id", static_cast<std::int64_t>(r.id));
        t.insert("war_id", static_cast<std::int64_t>(r.warId));
        t.insert("player_id", static_cast<std::int64_t>(r.playerId));
        t.insert("source_country_id", static_cast<std::int64_t>(r.sourceCountryId));
        t.insert("target_country_id", static_cast<std::int64_t>(r.targetCountryId));
        t.insert("lat", r.position.lat);
        t.insert("lng", r.position.lng);
        t.insert("direction_lat", r.direction.lat);
        t.insert("direction_lng", r.direction.lng);
        t.insert("status", std::string(pushStatusName(r.status)));
        t.insert("push_strength", r.pushStrength);
        t.insert("resistance_strength", r.resistanceStrength);
        t.insert("terrain_modifier", r.terrainModifier);
        t.insert("supporting_soldiers", r.supportingSoldiers);
        t.insert("defending_soldiers", r.defendingSoldiers);
        t.insert("distance_pushed", r.distancePushed);
        t.insert("territory_gained", r.territoryGained);
        t.insert("push_speed", r.pushSpeed);
        t.insert("resources_consumed", static_cast<std::int64_t>(r.resourcesConsumed));
        t.insert("started_at", static_cast<std::int64_t>(r.startedAt));
        t.insert("last_update", static_cast<std::int64_t>(r.lastUpdate));
        t.insert("ended_at", static_cast<std::int64_t>(r.endedAt));
        t.insert("duration_seconds", static_cast<std::int64_t>(r.durationSeconds));
        t.insert("faulted", r.faulted);
        t.insert("supporters", idArray(r.supporters));
        t.insert("defenders", idArray(r.defenders));
        pushes.push_back(std::move(t));
    }
    root.insert("pushes", std::move(pushes));

    toml::array accounts;
    for (const ResourceLedger::Entry& e : engine.ledger().entries()) {
        toml::table t;
        t.insert("kind", std::string(accountKindName(e.key.kind)));
        t.insert("id", static_cast<std::int64_t>(e.key.id));
        t.insert("balance", static_cast<std::int64_t>(e.balance));
        accounts.push_back(std::move(t));
    }
    root.insert("accounts", std::move(accounts));

    std::ostringstream out;
    out << root << "\n";
    return out.str();
}

bool restoreSnapshot(ConflictEngine& engine, const std::string& tomlText, std::string* errorMessage,
                     SnapshotReport* report) {
    toml::table root;
    try {
        root = toml::parse(tomlText);
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse snapshot: " << err.description();
        return setError(errorMessage, oss.str());
    } catch (const std::exception& err) {
        return setError(errorMessage, std::string("Failed to read snapshot: ") + err.what());
    }

    const std::int64_t version = root["version"].value_or(std::int64_t{0});
    if (version != kSnapshotVersion) {
        return setError(errorMessage, "Unsupported snapshot version " + std::to_string(version));
    }

    const GameConfig& config = engine.config();
    SnapshotReport local;
    std::string problem;

    // Parse everything before touching the engine so a bad file leaves it intact.
    std::vector<Country> countries;
    std::set<EntityId> countryIds;
    forEachTable(root, "countries", [&](const toml::table& t) {
        const EntityId id = readInt(t, "id", kNoEntity);
        if (id < 1 || !countryIds.insert(id).second) {
            problem = "Country entry with a missing or duplicate id";
            return false;
        }
        Country c(id, readString(t, "name"), readString(t, "iso_code"),
                  static_cast<int>(readInt(t, "max_soldiers", config.server.maxPlayersPerCountry)),
                  readDouble(t, "resource_generation_rate", 1.0),
                  readDouble(t, "terrain_modifier", 1.0),
                  readDouble(t, "defense_strength", 1.0));
        c.restoreState(readBool(t, "is_claimed", false),
                       readInt(t, "owner_id", kNoEntity),
                       readInt(t, "claimed_at", kNoTimestamp),
                       static_cast<int>(readInt(t, "soldier_count", 0)),
                       static_cast<int>(readInt(t, "active_wars", 0)),
                       static_cast<int>(readInt(t, "wars_won", 0)),
                       static_cast<int>(readInt(t, "wars_lost", 0)),
                       readDouble(t, "territory_gained", 0.0),
                       readDouble(t, "territory_lost", 0.0));
        countries.push_back(std::move(c));
        return true;
    });
    if (!problem.empty()) return setError(errorMessage, problem);

    std::vector<Player> players;
    std::set<EntityId> playerIds;
    forEachTable(root, "players", [&](const toml::table& t) {
        const EntityId id = readInt(t, "id", kNoEntity);
        if (id < 1 || !playerIds.insert(id).second) {
            problem = "Player entry with a missing or duplicate id";
            return false;
        }
        Player p(id, readString(t, "name"));
        p.setCountryId(readInt(t, "country_id", kNoEntity));
        if (t.contains("lat") && t.contains("lng")) {
            p.setPosition(GeoPoint{readDouble(t, "lat", 0.0), readDouble(t, "lng", 0.0)});
        }
        p.restoreTimers(readInt(t, "last_movement", kNoTimestamp),
                        readInt(t, "last_war_declared_at", kNoTimestamp),
                        readInt(t, "last_push_started_at", kNoTimestamp),
                        readInt(t, "active_push_id", kNoEntity),
                        static_cast<int>(readInt(t, "wars_declared", 0)));
        players.push_back(std::move(p));
        return true;
    });
    if (!problem.empty()) return setError(errorMessage, problem);

    std::vector<War> wars;
    std::map<EntityId, WarStatus> warStatus;
    std::set<std::pair<EntityId, EntityId>> activePairs;
    forEachTable(root, "wars", [&](const toml::table& t) {
        War w;
        w.id = readInt(t, "id", kNoEntity);
        w.aggressorCountryId = readInt(t, "aggressor_country_id", kNoEntity);
        w.defenderCountryId = readInt(t, "defender_country_id", kNoEntity);
        w.declaredBy = readInt(t, "declared_by", kNoEntity);
        w.endedBy = readInt(t, "ended_by", kNoEntity);
        w.winnerCountryId = readInt(t, "winner_country_id", kNoEntity);
        w.reason = readString(t, "reason");
        if (!parseWarStatus(readString(t, "status"), w.status)) {
            problem = "War " + std::to_string(w.id) + " has an unknown status";
            return false;
        }
        w.declaredAt = readInt(t, "declared_at", kNoTimestamp);
        w.endedAt = readInt(t, "ended_at", kNoTimestamp);
        w.territoryExchanged = readDouble(t, "territory_exchanged", 0.0);
        w.totalBorderPushes = static_cast<int>(readInt(t, "total_border_pushes", 0));
        w.aggressorSoldiersParticipated = static_cast<int>(readInt(t, "aggressor_soldiers_participated", 0));
        w.defenderSoldiersParticipated = static_cast<int>(readInt(t, "defender_soldiers_participated", 0));
        w.maxSimultaneousPushes = static_cast<int>(readInt(t, "max_simultaneous_pushes", 0));
        if (!countryIds.count(w.aggressorCountryId) || !countryIds.count(w.defenderCountryId)) {
            problem = "War " + std::to_string(w.id) + " references a missing country";
            return false;
        }
        if (w.status == WarStatus::Active) {
            const auto pair = std::minmax(w.aggressorCountryId, w.defenderCountryId);
            if (!activePairs.insert(pair).second) {
                logging::warn("Snapshot", "War " + std::to_string(w.id) + " duplicates an active war between " +
                                          std::to_string(pair.first) + " and " + std::to_string(pair.second) +
                                          "; restoring it as ended.");
                w.status = WarStatus::Ended;
                if (w.endedAt == kNoTimestamp) w.endedAt = w.declaredAt;
                ++local.repairedWars;
            }
        }
        warStatus[w.id] = w.status;
        wars.push_back(std::move(w));
        return true;
    });
    if (!problem.empty()) return setError(errorMessage, problem);

    std::vector<BorderPushRecord> pushes;
    forEachTable(root, "pushes", [&](const toml::table& t) {
        BorderPushRecord r;
        r.id = readInt(t, "id", kNoEntity);
        r.warId = readInt(t, "war_id", kNoEntity);
        r.playerId = readInt(t, "player_id", kNoEntity);
        r.sourceCountryId = readInt(t, "source_country_id", kNoEntity);
        r.targetCountryId = readInt(t, "target_country_id", kNoEntity);
        r.position = GeoPoint{readDouble(t, "lat", 0.0), readDouble(t, "lng", 0.0)};
        r.direction = GeoPoint{readDouble(t, "direction_lat", 0.0), readDouble(t, "direction_lng", 0.0)};
        if (!parsePushStatus(readString(t, "status"), r.status)) {
            problem = "Border push " + std::to_string(r.id) + " has an unknown status";
            return false;
        }
        r.pushStrength = readDouble(t, "push_strength", 1.0);
        r.resistanceStrength = readDouble(t, "resistance_strength", 1.0);
        r.terrainModifier = readDouble(t, "terrain_modifier", 1.0);
        r.supportingSoldiers = static_cast<int>(readInt(t, "supporting_soldiers", 1));
        r.defendingSoldiers = static_cast<int>(readInt(t, "defending_soldiers", 0));
        r.distancePushed = readDouble(t, "distance_pushed", 0.0);
        r.territoryGained = readDouble(t, "territory_gained", 0.0);
        r.pushSpeed = readDouble(t, "push_speed", 1.0);
        r.resourcesConsumed = readInt(t, "resources_consumed", 0);
        r.startedAt = readInt(t, "started_at", kNoTimestamp);
        r.lastUpdate = readInt(t, "last_update", kNoTimestamp);
        r.endedAt = readInt(t, "ended_at", kNoTimestamp);
        r.durationSeconds = readInt(t, "duration_seconds", 0);
        r.faulted = readBool(t, "faulted", false);
        r.supporters = readIdArray(t, "supporters");
        r.defenders = readIdArray(t, "defenders");

        // Orphaned or outlived pushes come back cancelled.
        if (r.isActive()) {
            auto it = warStatus.find(r.warId);
            if (it == warStatus.end() || it->second != WarStatus::Active) {
                logging::warn("Snapshot", "Push " + std::to_string(r.id) + " references " +
                                          (it == warStatus.end() ? "a missing" : "an ended") +
                                          " war; restoring it as cancelled.");
                r.status = PushStatus::Cancelled;
                if (r.endedAt == kNoTimestamp) r.endedAt = r.lastUpdate;
                ++local.repairedPushes;
            }
        }
        pushes.push_back(std::move(r));
        return true;
    });
    if (!problem.empty()) return setError(errorMessage, problem);

    std::vector<AccountRow> accounts;
    forEachTable(root, "accounts", [&](const toml::table& t) {
        AccountRow row;
        const std::string kind = readString(t, "kind");
        if (kind == "player") {
            row.key = AccountKey::player(readInt(t, "id", kNoEntity));
        } else if (kind == "country") {
            row.key = AccountKey::country(readInt(t, "id", kNoEntity));
        } else {
            problem = "Account with unknown kind '" + kind + "'";
            return false;
        }
        row.balance = readInt(t, "balance", 0);
        if (row.balance < 0) {
            problem = "Negative balance " + std::to_string(row.balance) + " on " + kind + " account " +
                      std::to_string(row.key.id);
            return false;
        }
        accounts.push_back(row);
        return true;
    });
    if (!problem.empty()) return setError(errorMessage, problem);

    // Player links to pushes that are no longer active, or to missing countries.
    std::set<EntityId> activePushIds;
    for (const BorderPushRecord& r : pushes) {
        if (r.isActive()) activePushIds.insert(r.id);
    }
    for (Player& p : players) {
        if (p.getActivePushId() != kNoEntity && !activePushIds.count(p.getActivePushId())) {
            p.clearActivePush(p.getActivePushId());
            ++local.clearedPlayerLinks;
        }
        if (p.hasCountry() && !countryIds.count(p.getCountryId())) {
            logging::warn("Snapshot", "Player " + std::to_string(p.getId()) + " referenced missing country " +
                                      std::to_string(p.getCountryId()) + ".");
            p.setCountryId(kNoEntity);
            ++local.clearedPlayerLinks;
        }
    }

    // Record checks the registries repeat on restore; nothing may fail after the clear.
    std::set<EntityId> seenIds;
    for (const War& w : wars) {
        OpError err;
        if (!WarRegistry::validateRecord(w, &err)) return setError(errorMessage, err.message);
        if (!seenIds.insert(w.id).second) return setError(errorMessage, "Duplicate war id " + std::to_string(w.id));
    }
    seenIds.clear();
    for (const BorderPushRecord& r : pushes) {
        OpError err;
        if (!BorderPushEngine::validateRecord(r, &err)) return setError(errorMessage, err.message);
        if (!seenIds.insert(r.id).second) {
            return setError(errorMessage, "Duplicate border push id " + std::to_string(r.id));
        }
    }

    // Apply.
    engine.ledger().clear();
    engine.world().clear();
    engine.wars().clear();
    engine.pushes().clear();

    for (const AccountRow& row : accounts) {
        OpError err;
        if (!engine.ledger().restoreAccount(row.key, row.balance, &err)) {
            return setError(errorMessage, err.message);
        }
    }
    for (const Country& c : countries) {
        engine.world().restoreCountry(c);
        openMissingAccount(engine, AccountKey::country(c.getId()));
    }
    for (const Player& p : players) {
        engine.world().restorePlayer(p);
        openMissingAccount(engine, AccountKey::player(p.getId()));
    }
    for (const War& w : wars) {
        OpError err;
        if (!engine.wars().restore(w, &err)) {
            return setError(errorMessage, err.message);
        }
    }
    for (const BorderPushRecord& r : pushes) {
        OpError err;
        if (!engine.pushes().restore(r, &err)) {
            return setError(errorMessage, err.message);
        }
    }
    engine.recountActiveWars();

    local.countries = static_cast<int>(countries.size());
    local.players = static_cast<int>(players.size());
    local.wars = static_cast<int>(wars.size());
    local.pushes = static_cast<int>(pushes.size());
    if (report) *report = local;

    logging::info("Snapshot", "Restored " + std::to_string(local.countries) + " countries, " +
                              std::to_string(local.players) + " players, " + std::to_string(local.wars) +
                              " wars, " + std::to_string(local.pushes) + " pushes (" +
                              std::to_string(local.repairedPushes) + " repaired).");
    return true;
}

bool saveSnapshot(ConflictEngine& engine, const std::string& path, std::string* errorMessage) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return setError(errorMessage, "Cannot open snapshot file '" + path + "' for writing");
    }
    out << renderSnapshot(engine);
    if (!out) {
        return setError(errorMessage, "Failed writing snapshot file '" + path + "'");
    }
    logging::info("Snapshot", "Saved to " + path + ".");
    return true;
}

bool loadSnapshot(ConflictEngine& engine, const std::string& path, std::string* errorMessage,
                  SnapshotReport* report) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return setError(errorMessage, "Cannot open snapshot file '" + path + "'");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return restoreSnapshot(engine, buffer.str(), errorMessage, report);
}
