// game_types.h
#pragma once

#include <cstdint>
#include <string>

using EntityId = std::int64_t;
using TimestampMs = std::int64_t;

constexpr EntityId kNoEntity = -1;
constexpr TimestampMs kNoTimestamp = -1;

struct GeoPoint {
    double lat = 0.0;
    double lng = 0.0;
};

inline bool isValidCoordinate(const GeoPoint& p) {
    return p.lat >= -90.0 && p.lat <= 90.0 && p.lng >= -180.0 && p.lng <= 180.0;
}

enum class ErrorKind {
    None,
    NotFound,
    InvalidState,
    InvalidTarget,
    Forbidden,
    Conflict,
    Cooldown,
    InsufficientResources,
    InvariantViolation
};

const char* errorKindName(ErrorKind kind);

// Recoverable failure reported by core operations. Operations return false
// and fill this when the caller passed one in.
struct OpError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    long long remainingMs = 0;  // Cooldown
    long long required = 0;     // InsufficientResources
    long long available = 0;    // InsufficientResources
};

// Writes an error into `error` (if provided) and returns false so call sites
// can `return fail(error, ...)`.
bool fail(OpError* error, ErrorKind kind, const std::string& message);
bool failCooldown(OpError* error, const std::string& message, long long remainingMs);
bool failInsufficient(OpError* error, const std::string& message, long long required, long long available);
