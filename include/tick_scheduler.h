#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "conflict_engine.h"
#include "game_config.h"

// Drives the conflict, economy and stats ticks, each on its own thread.
// stop() wakes every loop through the condition variable and joins.
class TickScheduler {
public:
    TickScheduler(ConflictEngine& engine, const GameConfig& config);
    ~TickScheduler();

    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    // Single ticks, callable without start().
    ConflictEngine::ConflictTickReport runConflictTick();
    ConflictEngine::EconomyTickReport runEconomyTick();
    void runStatsTick();

    long long conflictTicks() const { return m_conflictTicks.load(); }
    long long economyTicks() const { return m_economyTicks.load(); }
    long long statsTicks() const { return m_statsTicks.load(); }

private:
    void loop(const char* name, int intervalMs, const std::function<void()>& tick);

    ConflictEngine& m_engine;
    const GameConfig& m_config;

    std::mutex m_mutex;
    std::condition_variable m_wake;
    bool m_stopping = false;
    std::atomic<bool> m_running{false};
    std::vector<std::thread> m_threads;

    std::atomic<long long> m_conflictTicks{0};
    std::atomic<long long> m_economyTicks{0};
    std::atomic<long long> m_statsTicks{0};
};
