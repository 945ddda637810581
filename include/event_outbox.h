#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "broadcast_hub.h"
#include "game_event.h"

// Bounded per-connection queue. deliver() only enqueues; once the queue holds
// maxEvents entries the oldest one is dropped to make room.
class EventOutbox : public EventObserver {
public:
    explicit EventOutbox(std::size_t maxEvents);

    void deliver(const GameEvent& event) override;

    // Removes and returns up to maxCount queued events, oldest first.
    std::vector<GameEvent> take(std::size_t maxCount);
    void clear();

    std::size_t size() const;
    std::size_t capacity() const { return m_maxEvents; }
    std::size_t droppedCount() const;

private:
    mutable std::mutex m_mutex;
    std::deque<GameEvent> m_events;
    std::size_t m_maxEvents;
    std::size_t m_dropped = 0;
};
