#pragma once

#include <atomic>

#include "game_types.h"

// Millisecond time source shared by the engine, the scheduler and cooldown checks.
class GameClock {
public:
    virtual ~GameClock() = default;
    virtual TimestampMs nowMs() const = 0;
};

class SystemGameClock : public GameClock {
public:
    TimestampMs nowMs() const override;
};

// Hand-driven clock for tests and replay tools.
class ManualGameClock : public GameClock {
public:
    explicit ManualGameClock(TimestampMs start = 1'700'000'000'000LL) : m_now(start) {}

    TimestampMs nowMs() const override { return m_now.load(); }
    void set(TimestampMs t) { m_now.store(t); }
    void advance(TimestampMs deltaMs) { m_now.fetch_add(deltaMs); }

private:
    std::atomic<TimestampMs> m_now;
};
