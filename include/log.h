#pragma once

#include <string>

namespace logging {

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

void setLevel(Level level);
Level level();

// Accepts debug|info|warn|error|off (case-insensitive). Returns false on an unknown name.
bool parseLevel(const std::string& name, Level& out);

// Lines are written to std::cerr as "[LEVEL] [component] message".
void debug(const std::string& component, const std::string& msg);
void info(const std::string& component, const std::string& msg);
void warn(const std::string& component, const std::string& msg);
void error(const std::string& component, const std::string& msg);

} // namespace logging
