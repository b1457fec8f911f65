/**
 * Intent — one requested spirit command, before validation.
 *
 * Decision logic produces intents either through the capability views or
 * directly (scripted intents from a file). The action gateway validates an
 * intent against the current WorldState and forwards it to the host binding.
 */

#ifndef SPIRITS_GAME_INTENT_HPP
#define SPIRITS_GAME_INTENT_HPP

#include "core/vec2.hpp"
#include "game/errors.hpp"
#include "io/json_reader.hpp"
#include <string>
#include <vector>

namespace spirits::game {

enum class ActionType {
    ENERGIZE,
    MOVE,
    JUMP,
    MERGE,
    DIVIDE,
    LOCK,
    UNLOCK,
    EXPLODE,
    SHOUT,
    SET_MARK
};

constexpr int ACTION_COUNT = 10;

inline const char* action_to_string(ActionType action) {
    switch (action) {
        case ActionType::ENERGIZE: return "energize";
        case ActionType::MOVE:     return "move";
        case ActionType::JUMP:     return "jump";
        case ActionType::MERGE:    return "merge";
        case ActionType::DIVIDE:   return "divide";
        case ActionType::LOCK:     return "lock";
        case ActionType::UNLOCK:   return "unlock";
        case ActionType::EXPLODE:  return "explode";
        case ActionType::SHOUT:    return "shout";
        case ActionType::SET_MARK: return "set_mark";
        default:                   return "";
    }
}

inline bool string_to_action(const std::string& s, ActionType& out) {
    for (int i = 0; i < ACTION_COUNT; ++i) {
        auto action = static_cast<ActionType>(i);
        if (s == action_to_string(action)) {
            out = action;
            return true;
        }
    }
    return false;
}

/** Whether the command takes a target id (energize, merge). */
inline bool action_takes_target(ActionType action) {
    return action == ActionType::ENERGIZE || action == ActionType::MERGE;
}

/** Whether the command takes coordinates (move, jump). */
inline bool action_takes_position(ActionType action) {
    return action == ActionType::MOVE || action == ActionType::JUMP;
}

/** Whether the command takes a text payload (shout, set_mark). */
inline bool action_takes_text(ActionType action) {
    return action == ActionType::SHOUT || action == ActionType::SET_MARK;
}

struct Intent {
    ActionType action = ActionType::MOVE;
    std::string actor;      // acting spirit id
    std::string target;     // energize / merge
    Vec2 position;          // move / jump
    std::string text;       // shout message / mark label

    static Intent energize(const std::string& actor, const std::string& target);
    static Intent move(const std::string& actor, const Vec2& position);
    static Intent jump(const std::string& actor, const Vec2& position);
    static Intent merge(const std::string& actor, const std::string& target);
    static Intent divide(const std::string& actor);
    static Intent lock(const std::string& actor);
    static Intent unlock(const std::string& actor);
    static Intent explode(const std::string& actor);
    static Intent shout(const std::string& actor, const std::string& message);
    static Intent set_mark(const std::string& actor, const std::string& label);

    /** "energize me_1 -> star_zxq" style, for logs and diagnostics. */
    std::string describe() const;

    bool operator==(const Intent& o) const {
        return action == o.action && actor == o.actor && target == o.target &&
               position == o.position && text == o.text;
    }
};

/** Outcome of one gateway submission. */
struct DispatchResult {
    bool accepted = false;
    ErrorKind error = ErrorKind::INVALID_INTENT;     // meaningful only when rejected
    std::string message;

    explicit operator bool() const { return accepted; }
};

/** An intent scheduled for a given tick; tick < 0 means every tick. */
struct ScheduledIntent {
    long tick = -1;
    Intent intent;

    bool applies_to(long t) const { return tick < 0 || tick == t; }
};

class IntentParser {
public:
    /**
     * Parse one intent object:
     *   {"actor": "me_1", "action": "move", "position": [x, y]}
     * @throws std::runtime_error on an unknown action or missing parameter
     */
    static Intent parse(const JsonValue& def);

    /**
     * Parse an intents file: an array of intent objects, each with an
     * optional "tick".
     */
    static std::vector<ScheduledIntent> parse_schedule(const JsonValue& root);
};

} // namespace spirits::game

#endif // SPIRITS_GAME_INTENT_HPP
