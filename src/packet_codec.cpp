#include "packet_codec.h"

#include <type_traits>

namespace {

constexpr sf::Uint8 kTagInt = 0;
constexpr sf::Uint8 kTagDouble = 1;
constexpr sf::Uint8 kTagBool = 2;
constexpr sf::Uint8 kTagString = 3;

constexpr sf::Uint32 kMaxFields = 256;

} // namespace

void encodeEvent(const GameEvent& event, sf::Packet& packet) {
    packet << event.type
           << static_cast<sf::Int64>(event.countryId)
           << static_cast<sf::Int64>(event.timestamp)
           << static_cast<sf::Uint32>(event.fields.size());
    for (const auto& kv : event.fields) {
        packet << kv.first;
        std::visit([&packet](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, long long>) {
                packet << kTagInt << static_cast<sf::Int64>(v);
            } else if constexpr (std::is_same_v<T, double>) {
                packet << kTagDouble << v;
            } else if constexpr (std::is_same_v<T, bool>) {
                packet << kTagBool << static_cast<sf::Uint8>(v ? 1 : 0);
            } else {
                packet << kTagString << v;
            }
        }, kv.second);
    }
}

bool decodeEvent(sf::Packet& packet, GameEvent& out) {
    sf::Int64 countryId = 0;
    sf::Int64 timestamp = 0;
    sf::Uint32 count = 0;
    out = GameEvent{};
    if (!(packet >> out.type >> countryId >> timestamp >> count)) return false;
    if (out.type.empty() || count > kMaxFields) return false;
    out.countryId = countryId;
    out.timestamp = timestamp;

    for (sf::Uint32 i = 0; i < count; ++i) {
        std::string key;
        sf::Uint8 tag = 0;
        if (!(packet >> key >> tag)) return false;
        switch (tag) {
            case kTagInt: {
                sf::Int64 v = 0;
                if (!(packet >> v)) return false;
                out.setInt(key, v);
                break;
            }
            case kTagDouble: {
                double v = 0.0;
                if (!(packet >> v)) return false;
                out.setDouble(key, v);
                break;
            }
            case kTagBool: {
                sf::Uint8 v = 0;
                if (!(packet >> v)) return false;
                out.setBool(key, v != 0);
                break;
            }
            case kTagString: {
                std::string v;
                if (!(packet >> v)) return false;
                out.setString(key, v);
                break;
            }
            default:
                return false;
        }
    }
    return true;
}
