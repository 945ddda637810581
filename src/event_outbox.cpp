#include "event_outbox.h"

#include <algorithm>

EventOutbox::EventOutbox(std::size_t maxEvents) : m_maxEvents(std::max<std::size_t>(1, maxEvents)) {}

void EventOutbox::deliver(const GameEvent& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(event);
    if (m_events.size() > m_maxEvents) {
        m_events.pop_front();
        ++m_dropped;
    }
}

std::vector<GameEvent> EventOutbox::take(std::size_t maxCount) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::size_t n = std::min(maxCount, m_events.size());
    std::vector<GameEvent> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(std::move(m_events.front()));
        m_events.pop_front();
    }
    return out;
}

void EventOutbox::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
}

std::size_t EventOutbox::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

std::size_t EventOutbox::droppedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}
