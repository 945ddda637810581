#include <SFML/Network/Packet.hpp>

#include <iostream>

#include "game_event.h"
#include "packet_codec.h"

#define FL_ASSERT(expr)                                                                             \
    do {                                                                                            \
        if (!(expr)) {                                                                              \
            std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";      \
            return 1;                                                                               \
        }                                                                                           \
    } while (0)

int test_packet_codec() {
    GameEvent event(events::kPushProgress, 1700000000123LL);
    event.countryId = 4;
    event.setInt("push_id", 12)
         .setInt("big", 9000000000LL)
         .setDouble("distance_pushed", 3.25)
         .setBool("is_active", true)
         .setString("reason", "war_ended");

    sf::Packet packet;
    encodeEvent(event, packet);

    GameEvent decoded;
    FL_ASSERT(decodeEvent(packet, decoded));
    FL_ASSERT(decoded.type == events::kPushProgress);
    FL_ASSERT(decoded.countryId == 4);
    FL_ASSERT(decoded.timestamp == 1700000000123LL);
    FL_ASSERT(decoded.fields.size() == 5);
    FL_ASSERT(decoded.getInt("push_id") == 12);
    FL_ASSERT(decoded.getInt("big") == 9000000000LL);
    FL_ASSERT(decoded.getDouble("distance_pushed") == 3.25);
    FL_ASSERT(decoded.getBool("is_active"));
    FL_ASSERT(decoded.getString("reason") == "war_ended");
    // Typed getters do not coerce across kinds, apart from int to double.
    FL_ASSERT(decoded.getString("push_id", "none") == "none");
    FL_ASSERT(decoded.getDouble("push_id") == 12.0);

    // A packet cut short fails cleanly.
    {
        sf::Packet full;
        encodeEvent(event, full);
        sf::Packet truncated;
        truncated.append(full.getData(), full.getDataSize() - 3);
        GameEvent partial;
        FL_ASSERT(!decodeEvent(truncated, partial));
    }

    // Unknown value tags and empty types are rejected.
    {
        sf::Packet bad;
        bad << std::string("ping") << sf::Int64(-1) << sf::Int64(0) << sf::Uint32(1)
            << std::string("x") << sf::Uint8(9);
        GameEvent out;
        FL_ASSERT(!decodeEvent(bad, out));

        sf::Packet anonymous;
        anonymous << std::string() << sf::Int64(-1) << sf::Int64(0) << sf::Uint32(0);
        FL_ASSERT(!decodeEvent(anonymous, out));

        sf::Packet flood;
        flood << std::string("ping") << sf::Int64(-1) << sf::Int64(0) << sf::Uint32(100000);
        FL_ASSERT(!decodeEvent(flood, out));
    }

    return 0;
}
