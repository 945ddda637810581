#pragma once

#include <map>
#include <string>
#include <variant>

#include "game_types.h"

namespace events {

constexpr const char* kWarDeclared = "war:declared";
constexpr const char* kWarEnded = "war:ended";
constexpr const char* kPushStarted = "border_push:started";
constexpr const char* kPushIncoming = "border_push:incoming";
constexpr const char* kPushProgress = "border_push:progress";
constexpr const char* kPushSupportAdded = "border_push:support_added";
constexpr const char* kPushDefenseAdded = "border_push:defense_added";
constexpr const char* kPushCompleted = "border_push:completed";
constexpr const char* kPushLost = "border_push:lost";
constexpr const char* kPushCancelled = "border_push:cancelled";
constexpr const char* kResourcesGenerated = "country:resources_generated";
constexpr const char* kPlayerJoinedCountry = "player:joined_country";
constexpr const char* kPlayerLeftCountry = "player:left_country";
constexpr const char* kPlayerMoved = "player:moved";
constexpr const char* kPlayerDisconnected = "player:disconnected";
constexpr const char* kServerStats = "server:stats";
constexpr const char* kConnectionEstablished = "connection:established";
constexpr const char* kCommandOk = "command:ok";
constexpr const char* kCommandError = "command:error";

} // namespace events

using EventValue = std::variant<long long, double, bool, std::string>;

// A state delta delivered to observers. countryId is the room it was sent to,
// kNoEntity for global events and direct replies.
struct GameEvent {
    std::string type;
    EntityId countryId = kNoEntity;
    TimestampMs timestamp = kNoTimestamp;
    std::map<std::string, EventValue> fields;

    GameEvent() = default;
    GameEvent(const std::string& eventType, TimestampMs ts) : type(eventType), timestamp(ts) {}

    GameEvent& setInt(const std::string& key, long long value);
    GameEvent& setDouble(const std::string& key, double value);
    GameEvent& setBool(const std::string& key, bool value);
    GameEvent& setString(const std::string& key, const std::string& value);

    bool has(const std::string& key) const { return fields.count(key) != 0; }
    // Getters return the fallback when the key is absent or holds another type;
    // getDouble also accepts an integer field.
    long long getInt(const std::string& key, long long fallback = 0) const;
    double getDouble(const std::string& key, double fallback = 0.0) const;
    bool getBool(const std::string& key, bool fallback = false) const;
    std::string getString(const std::string& key, const std::string& fallback = std::string()) const;
};

// One-line rendering for logs: "type {key=value, ...}".
std::string describeEvent(const GameEvent& event);
