#pragma once

#include <string>

#include "conflict_engine.h"
#include "game_event.h"

// Turns an observer command (a GameEvent whose type is the command name) into
// an engine call and builds the command:ok / command:error reply. The player
// is the one bound to the connection by its hello.
class CommandRouter {
public:
    explicit CommandRouter(ConflictEngine& engine) : m_engine(engine) {}

    GameEvent handle(EntityId playerId, const GameEvent& command);

    static GameEvent makeError(const std::string& command, const OpError& error, TimestampMs now);

private:
    GameEvent makeOk(const std::string& command) const;

    ConflictEngine& m_engine;
};
