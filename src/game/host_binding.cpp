#include "game/host_binding.hpp"

namespace spirits::game {

void HostBinding::forward(const Intent& intent) {
    switch (intent.action) {
        case ActionType::ENERGIZE: energize(intent.actor, intent.target);  break;
        case ActionType::MOVE:     move(intent.actor, intent.position);    break;
        case ActionType::JUMP:     jump(intent.actor, intent.position);    break;
        case ActionType::MERGE:    merge(intent.actor, intent.target);     break;
        case ActionType::DIVIDE:   divide(intent.actor);                   break;
        case ActionType::LOCK:     lock(intent.actor);                     break;
        case ActionType::UNLOCK:   unlock(intent.actor);                   break;
        case ActionType::EXPLODE:  explode(intent.actor);                  break;
        case ActionType::SHOUT:    shout(intent.actor, intent.text);       break;
        case ActionType::SET_MARK: set_mark(intent.actor, intent.text);    break;
    }
}

void CommandQueue::energize(const std::string& actor, const std::string& target) {
    commands_.push_back(Intent::energize(actor, target));
}

void CommandQueue::move(const std::string& actor, const Vec2& to) {
    commands_.push_back(Intent::move(actor, to));
}

void CommandQueue::jump(const std::string& actor, const Vec2& to) {
    commands_.push_back(Intent::jump(actor, to));
}

void CommandQueue::merge(const std::string& actor, const std::string& target) {
    commands_.push_back(Intent::merge(actor, target));
}

void CommandQueue::divide(const std::string& actor)  { commands_.push_back(Intent::divide(actor)); }
void CommandQueue::lock(const std::string& actor)    { commands_.push_back(Intent::lock(actor)); }
void CommandQueue::unlock(const std::string& actor)  { commands_.push_back(Intent::unlock(actor)); }
void CommandQueue::explode(const std::string& actor) { commands_.push_back(Intent::explode(actor)); }

void CommandQueue::shout(const std::string& actor, const std::string& message) {
    commands_.push_back(Intent::shout(actor, message));
}

void CommandQueue::set_mark(const std::string& actor, const std::string& label) {
    commands_.push_back(Intent::set_mark(actor, label));
}

void write_command(JsonWriter& w, const HostCommand& cmd) {
    w.begin_object();
    w.kv("action", action_to_string(cmd.action));
    w.kv("actor", cmd.actor);
    if (action_takes_target(cmd.action)) {
        w.kv("target", cmd.target);
    } else if (action_takes_position(cmd.action)) {
        w.key("position").begin_array()
         .value(cmd.position.x).value(cmd.position.y)
         .end_array();
    } else if (action_takes_text(cmd.action)) {
        w.kv("text", cmd.text);
    }
    w.end_object();
}

void CommandQueue::write_json(std::ostream& os) const {
    JsonWriter w(os, JsonWriter::COMPACT);
    w.begin_array();
    for (const auto& cmd : commands_) write_command(w, cmd);
    w.end_array();
}

} // namespace spirits::game
