#include "game_clock.h"

#include <chrono>

TimestampMs SystemGameClock::nowMs() const {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<TimestampMs>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}
