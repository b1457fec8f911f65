#include "game/intent.hpp"
#include "game/host_state.hpp"
#include <sstream>
#include <stdexcept>

namespace spirits::game {

static Intent make(ActionType action, const std::string& actor) {
    Intent in;
    in.action = action;
    in.actor = actor;
    return in;
}

Intent Intent::energize(const std::string& actor, const std::string& target) {
    Intent in = make(ActionType::ENERGIZE, actor);
    in.target = target;
    return in;
}

Intent Intent::move(const std::string& actor, const Vec2& position) {
    Intent in = make(ActionType::MOVE, actor);
    in.position = position;
    return in;
}

Intent Intent::jump(const std::string& actor, const Vec2& position) {
    Intent in = make(ActionType::JUMP, actor);
    in.position = position;
    return in;
}

Intent Intent::merge(const std::string& actor, const std::string& target) {
    Intent in = make(ActionType::MERGE, actor);
    in.target = target;
    return in;
}

Intent Intent::divide(const std::string& actor)  { return make(ActionType::DIVIDE, actor); }
Intent Intent::lock(const std::string& actor)    { return make(ActionType::LOCK, actor); }
Intent Intent::unlock(const std::string& actor)  { return make(ActionType::UNLOCK, actor); }
Intent Intent::explode(const std::string& actor) { return make(ActionType::EXPLODE, actor); }

Intent Intent::shout(const std::string& actor, const std::string& message) {
    Intent in = make(ActionType::SHOUT, actor);
    in.text = message;
    return in;
}

Intent Intent::set_mark(const std::string& actor, const std::string& label) {
    Intent in = make(ActionType::SET_MARK, actor);
    in.text = label;
    return in;
}

std::string Intent::describe() const {
    std::ostringstream ss;
    ss << action_to_string(action) << " " << actor;
    if (action_takes_target(action)) {
        ss << " -> " << target;
    } else if (action_takes_position(action)) {
        ss << " -> (" << position.x << ", " << position.y << ")";
    } else if (action_takes_text(action)) {
        ss << " \"" << text << "\"";
    }
    return ss.str();
}

Intent IntentParser::parse(const JsonValue& def) {
    if (!def.is_object()) {
        throw std::runtime_error("intent: entry is not an object");
    }

    std::string name = def["action"].get_string("");
    ActionType action;
    if (!string_to_action(name, action)) {
        throw std::runtime_error("intent: unknown action '" + name + "'");
    }

    Intent in;
    in.action = action;
    in.actor = def["actor"].get_string("");
    if (in.actor.empty()) {
        throw std::runtime_error("intent: " + name + " without an actor");
    }

    if (action_takes_target(action)) {
        if (!def["target"].is_string()) {
            throw std::runtime_error("intent: " + name + " by " + in.actor + " needs a target");
        }
        in.target = def["target"].as_string();
    }
    if (action_takes_position(action)) {
        in.position = HostStateParser::parse_position(def["position"], in.actor);
    }
    if (action_takes_text(action)) {
        in.text = def["text"].get_string("");
    }
    return in;
}

std::vector<ScheduledIntent> IntentParser::parse_schedule(const JsonValue& root) {
    if (!root.is_array()) {
        throw std::runtime_error("intents: expected an array of intents");
    }

    std::vector<ScheduledIntent> out;
    out.reserve(root.size());
    for (const auto& def : root.elements()) {
        ScheduledIntent s;
        if (def["tick"].is_number()) {
            s.tick = static_cast<long>(def["tick"].as_int64());
        }
        s.intent = parse(def);
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace spirits::game
