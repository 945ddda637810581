#include "game_event.h"

#include <sstream>
#include <type_traits>
#include <utility>

GameEvent& GameEvent::setInt(const std::string& key, long long value) {
    fields[key] = EventValue(std::in_place_type<long long>, value);
    return *this;
}

GameEvent& GameEvent::setDouble(const std::string& key, double value) {
    fields[key] = EventValue(std::in_place_type<double>, value);
    return *this;
}

GameEvent& GameEvent::setBool(const std::string& key, bool value) {
    fields[key] = EventValue(std::in_place_type<bool>, value);
    return *this;
}

GameEvent& GameEvent::setString(const std::string& key, const std::string& value) {
    fields[key] = EventValue(std::in_place_type<std::string>, value);
    return *this;
}

long long GameEvent::getInt(const std::string& key, long long fallback) const {
    auto it = fields.find(key);
    if (it == fields.end()) return fallback;
    if (const long long* v = std::get_if<long long>(&it->second)) return *v;
    return fallback;
}

double GameEvent::getDouble(const std::string& key, double fallback) const {
    auto it = fields.find(key);
    if (it == fields.end()) return fallback;
    if (const double* v = std::get_if<double>(&it->second)) return *v;
    if (const long long* v = std::get_if<long long>(&it->second)) return static_cast<double>(*v);
    return fallback;
}

bool GameEvent::getBool(const std::string& key, bool fallback) const {
    auto it = fields.find(key);
    if (it == fields.end()) return fallback;
    if (const bool* v = std::get_if<bool>(&it->second)) return *v;
    return fallback;
}

std::string GameEvent::getString(const std::string& key, const std::string& fallback) const {
    auto it = fields.find(key);
    if (it == fields.end()) return fallback;
    if (const std::string* v = std::get_if<std::string>(&it->second)) return *v;
    return fallback;
}

std::string describeEvent(const GameEvent& event) {
    std::ostringstream out;
    out << event.type;
    if (event.countryId != kNoEntity) {
        out << " @" << event.countryId;
    }
    out << " {";
    bool first = true;
    for (const auto& kv : event.fields) {
        if (!first) out << ", ";
        first = false;
        out << kv.first << "=";
        std::visit([&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                out << (v ? "true" : "false");
            } else {
                out << v;
            }
        }, kv.second);
    }
    out << "}";
    return out.str();
}
