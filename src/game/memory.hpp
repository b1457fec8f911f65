/**
 * CrossTickMemory — process-lifetime key/value store for decision logic.
 *
 * Values are arbitrary JSON values. Nothing expires; the store lives as long
 * as the process and is never written to disk. Owned by the tick driver and
 * passed by reference to whoever needs it. Single-threaded: only the tick
 * thread touches it.
 */

#ifndef SPIRITS_GAME_MEMORY_HPP
#define SPIRITS_GAME_MEMORY_HPP

#include "io/json_reader.hpp"
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace spirits::game {

class CrossTickMemory {
public:
    void set(const std::string& key, JsonValue value);

    /** Stored value, or a null value when absent. */
    const JsonValue& get(const std::string& key) const;

    bool has(const std::string& key) const { return values_.count(key) > 0; }
    bool erase(const std::string& key) { return values_.erase(key) > 0; }
    void clear() { values_.clear(); }
    size_t size() const { return values_.size(); }

    /** All keys, ascending. */
    std::vector<std::string> keys() const;

    double get_number(const std::string& key, double def = 0.0) const {
        return get(key).get_number(def);
    }
    std::string get_string(const std::string& key, const std::string& def = "") const {
        return get(key).get_string(def);
    }

    // ── Spirit bookkeeping ──
    void remember_mark(const std::string& spirit_id, const std::string& label);
    std::string mark_of(const std::string& spirit_id) const;
    void remember_energized(const std::string& spirit_id, const std::string& target_id);
    std::string last_energized(const std::string& spirit_id) const;

    static std::string mark_key(const std::string& spirit_id) { return "mark:" + spirit_id; }
    static std::string energized_key(const std::string& spirit_id) {
        return "last_energized:" + spirit_id;
    }

    /** Pretty JSON object of every entry, keys ascending. */
    void write_json(std::ostream& os) const;

private:
    std::map<std::string, JsonValue> values_;
};

} // namespace spirits::game

#endif // SPIRITS_GAME_MEMORY_HPP
