#pragma once

#include <SFML/Network/Packet.hpp>

#include "game_event.h"

// Wire layout of one event:
//   string type, Int64 countryId, Int64 timestamp, Uint32 fieldCount,
//   then per field: string key, Uint8 tag, value.
// Tags: 0 Int64, 1 double, 2 bool (Uint8), 3 string.
void encodeEvent(const GameEvent& event, sf::Packet& packet);
// Returns false on a truncated packet or an unknown tag; `out` is then unspecified.
bool decodeEvent(sf::Packet& packet, GameEvent& out);
