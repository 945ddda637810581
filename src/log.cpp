#include "log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace logging {
namespace {

std::mutex g_logMutex;
std::atomic<Level> g_level{Level::Info};

const char* label(Level l) {
    switch (l) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        default: return "";
    }
}

void emit(Level l, const std::string& component, const std::string& msg) {
    const Level current = g_level.load();
    if (current == Level::Off || l < current) return;
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << "[" << label(l) << "] [" << component << "] " << msg << "\n";
}

} // namespace

void setLevel(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

bool parseLevel(const std::string& name, Level& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (v == "debug") { out = Level::Debug; return true; }
    if (v == "info") { out = Level::Info; return true; }
    if (v == "warn" || v == "warning") { out = Level::Warn; return true; }
    if (v == "error") { out = Level::Error; return true; }
    if (v == "off" || v == "none") { out = Level::Off; return true; }
    return false;
}

void debug(const std::string& component, const std::string& msg) { emit(Level::Debug, component, msg); }
void info(const std::string& component, const std::string& msg) { emit(Level::Info, component, msg); }
void warn(const std::string& component, const std::string& msg) { emit(Level::Warn, component, msg); }
void error(const std::string& component, const std::string& msg) { emit(Level::Error, component, msg); }

} // namespace logging
