#include "game_types.h"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidState: return "invalid_state";
        case ErrorKind::InvalidTarget: return "invalid_target";
        case ErrorKind::Forbidden: return "forbidden";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Cooldown: return "cooldown";
        case ErrorKind::InsufficientResources: return "insufficient_resources";
        case ErrorKind::InvariantViolation: return "invariant_violation";
        default: return "unknown";
    }
}

bool fail(OpError* error, ErrorKind kind, const std::string& message) {
    if (error) {
        error->kind = kind;
        error->message = message;
        error->remainingMs = 0;
        error->required = 0;
        error->available = 0;
    }
    return false;
}

bool failCooldown(OpError* error, const std::string& message, long long remainingMs) {
    fail(error, ErrorKind::Cooldown, message);
    if (error) {
        error->remainingMs = remainingMs;
    }
    return false;
}

bool failInsufficient(OpError* error, const std::string& message, long long required, long long available) {
    fail(error, ErrorKind::InsufficientResources, message);
    if (error) {
        error->required = required;
        error->available = available;
    }
    return false;
}
