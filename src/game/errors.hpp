/**
 * Game error taxonomy.
 *
 * Every rule violation the core detects is one of these. The action gateway
 * and the economy engine catch them at their boundary and turn them into
 * Diagnostic records, so none of them ever aborts a tick.
 */

#ifndef SPIRITS_GAME_ERRORS_HPP
#define SPIRITS_GAME_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace spirits::game {

enum class ErrorKind {
    CAPABILITY,          // action illegal for the entity's shape
    UNKNOWN_TARGET,      // id absent from the current snapshot (or unusable)
    DOUBLE_ACTION,       // entity already acted this tick
    STALE_SNAPSHOT,      // world view is from another tick
    ECONOMY_INVARIANT,   // energy outside [0, capacity]
    INVALID_INTENT       // malformed intent parameters
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CAPABILITY:        return "capability";
        case ErrorKind::UNKNOWN_TARGET:    return "unknown_target";
        case ErrorKind::DOUBLE_ACTION:     return "double_action";
        case ErrorKind::STALE_SNAPSHOT:    return "stale_snapshot";
        case ErrorKind::ECONOMY_INVARIANT: return "economy_invariant";
        case ErrorKind::INVALID_INTENT:    return "invalid_intent";
        default:                           return "";
    }
}

class GameError : public std::runtime_error {
public:
    GameError(ErrorKind kind, const std::string& subject_id, const std::string& msg)
        : std::runtime_error(msg), kind_(kind), subject_id_(subject_id) {}

    ErrorKind kind() const { return kind_; }
    const std::string& subject_id() const { return subject_id_; }

private:
    ErrorKind kind_;
    std::string subject_id_;
};

class CapabilityError : public GameError {
public:
    CapabilityError(const std::string& subject_id, const std::string& msg)
        : GameError(ErrorKind::CAPABILITY, subject_id, msg) {}
};

class UnknownTargetError : public GameError {
public:
    UnknownTargetError(const std::string& subject_id, const std::string& msg)
        : GameError(ErrorKind::UNKNOWN_TARGET, subject_id, msg) {}
};

class DoubleActionError : public GameError {
public:
    DoubleActionError(const std::string& subject_id, const std::string& msg)
        : GameError(ErrorKind::DOUBLE_ACTION, subject_id, msg) {}
};

class StaleSnapshotError : public GameError {
public:
    StaleSnapshotError(long snapshot_tick, long current_tick)
        : GameError(ErrorKind::STALE_SNAPSHOT, "",
                    "snapshot is from tick " + std::to_string(snapshot_tick) +
                    ", current tick is " + std::to_string(current_tick)),
          snapshot_tick_(snapshot_tick), current_tick_(current_tick) {}

    long snapshot_tick() const { return snapshot_tick_; }
    long current_tick() const { return current_tick_; }

private:
    long snapshot_tick_;
    long current_tick_;
};

class EconomyInvariantError : public GameError {
public:
    EconomyInvariantError(const std::string& subject_id, const std::string& msg)
        : GameError(ErrorKind::ECONOMY_INVARIANT, subject_id, msg) {}
};

class InvalidIntentError : public GameError {
public:
    InvalidIntentError(const std::string& subject_id, const std::string& msg)
        : GameError(ErrorKind::INVALID_INTENT, subject_id, msg) {}
};

} // namespace spirits::game

#endif // SPIRITS_GAME_ERRORS_HPP
