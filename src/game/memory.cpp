#include "game/memory.hpp"
#include "io/json_writer.hpp"

namespace spirits::game {

static const JsonValue& absent() {
    static const JsonValue null_value;
    return null_value;
}

void CrossTickMemory::set(const std::string& key, JsonValue value) {
    values_[key] = std::move(value);
}

const JsonValue& CrossTickMemory::get(const std::string& key) const {
    auto it = values_.find(key);
    return it == values_.end() ? absent() : it->second;
}

std::vector<std::string> CrossTickMemory::keys() const {
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& kv : values_) out.push_back(kv.first);
    return out;
}

void CrossTickMemory::remember_mark(const std::string& spirit_id, const std::string& label) {
    set(mark_key(spirit_id), JsonValue(label));
}

std::string CrossTickMemory::mark_of(const std::string& spirit_id) const {
    return get_string(mark_key(spirit_id));
}

void CrossTickMemory::remember_energized(const std::string& spirit_id,
                                         const std::string& target_id) {
    set(energized_key(spirit_id), JsonValue(target_id));
}

std::string CrossTickMemory::last_energized(const std::string& spirit_id) const {
    return get_string(energized_key(spirit_id));
}

void CrossTickMemory::write_json(std::ostream& os) const {
    JsonWriter w(os);
    w.begin_object();
    for (const auto& [key, value] : values_) {
        w.kv(key, value);
    }
    w.end_object();
}

} // namespace spirits::game
