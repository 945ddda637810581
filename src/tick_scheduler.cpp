#include "tick_scheduler.h"

#include <SFML/System/Clock.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>

#include "log.h"

TickScheduler::TickScheduler(ConflictEngine& engine, const GameConfig& config)
    : m_engine(engine), m_config(config) {}

TickScheduler::~TickScheduler() {
    stop();
}

void TickScheduler::start() {
    if (m_running.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = false;
    }

    m_threads.emplace_back([this]() {
        loop("conflict", m_config.conflict.tickIntervalMs, [this]() { runConflictTick(); });
    });
    m_threads.emplace_back([this]() {
        loop("economy", m_config.economy.tickIntervalMs, [this]() { runEconomyTick(); });
    });
    m_threads.emplace_back([this]() {
        loop("stats", m_config.server.statsIntervalMs, [this]() { runStatsTick(); });
    });

    logging::info("Scheduler", "Started: conflict every " + std::to_string(m_config.conflict.tickIntervalMs) +
                               " ms, economy every " + std::to_string(m_config.economy.tickIntervalMs) +
                               " ms, stats every " + std::to_string(m_config.server.statsIntervalMs) + " ms.");
}

void TickScheduler::stop() {
    if (!m_running.load()) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_wake.notify_all();
    for (std::thread& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_running.store(false);
    logging::info("Scheduler", "Stopped.");
}

ConflictEngine::ConflictTickReport TickScheduler::runConflictTick() {
    ++m_conflictTicks;
    return m_engine.runConflictTick();
}

ConflictEngine::EconomyTickReport TickScheduler::runEconomyTick() {
    ++m_economyTicks;
    return m_engine.runEconomyTick();
}

void TickScheduler::runStatsTick() {
    ++m_statsTicks;
    m_engine.broadcastServerStats();
}

void TickScheduler::loop(const char* name, int intervalMs, const std::function<void()>& tick) {
    const auto interval = std::chrono::milliseconds(std::max(1, intervalMs));
    sf::Clock tickClock;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_wake.wait_for(lock, interval, [this]() { return m_stopping; })) {
                break;
            }
        }

        tickClock.restart();
        try {
            tick();
        } catch (const std::exception& e) {
            logging::error("Scheduler", std::string(name) + " tick failed: " + e.what());
        }
        const sf::Int32 elapsedMs = tickClock.getElapsedTime().asMilliseconds();
        if (elapsedMs > intervalMs) {
            logging::warn("Scheduler", std::string(name) + " tick took " + std::to_string(elapsedMs) +
                                       " ms, longer than its " + std::to_string(intervalMs) + " ms interval.");
        }
    }
}
