/**
 * JSON document model and reader
 *
 * Recursive-descent parser producing a tree of JsonValue nodes. Objects keep
 * their members in document order so that re-serialising a host payload or a
 * memory dump is deterministic, and two trees compare structurally with ==.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("tick.json");
 *   int tick = root["tick"].as_int();
 *   const auto& spirits = root["spirits"];
 *   for (const auto& [id, rec] : spirits.members()) { ... }
 */

#ifndef SPIRITS_JSON_READER_HPP
#define SPIRITS_JSON_READER_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <utility>
#include <stdexcept>

namespace spirits {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

const char* json_type_name(JsonType type);

/**
 * Parse failure with the 1-based line/column where the reader stopped.
 */
class JsonError : public std::runtime_error {
public:
    JsonError(const std::string& msg, size_t line, size_t column);

    size_t line() const { return line_; }
    size_t column() const { return column_; }

private:
    size_t line_;
    size_t column_;
};

class JsonValue {
public:
    using Member = std::pair<std::string, JsonValue>;

    JsonValue() = default;
    explicit JsonValue(bool v) : type_(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type_(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(int v) : type_(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(long long v)
        : type_(JsonType::NUMBER), num_val_(static_cast<double>(v)) {}
    explicit JsonValue(const char* v) : type_(JsonType::STRING), str_val_(v) {}
    explicit JsonValue(const std::string& v) : type_(JsonType::STRING), str_val_(v) {}
    explicit JsonValue(std::string&& v) : type_(JsonType::STRING), str_val_(std::move(v)) {}

    static JsonValue object();
    static JsonValue array();

    JsonType type() const { return type_; }

    bool is_null()   const { return type_ == JsonType::NIL; }
    bool is_bool()   const { return type_ == JsonType::BOOL; }
    bool is_number() const { return type_ == JsonType::NUMBER; }
    bool is_string() const { return type_ == JsonType::STRING; }
    bool is_object() const { return type_ == JsonType::OBJECT; }
    bool is_array()  const { return type_ == JsonType::ARRAY; }

    // Strict accessors (throw std::runtime_error on type mismatch)
    bool as_bool() const;
    double as_number() const;
    int as_int() const;
    long long as_int64() const;
    const std::string& as_string() const;

    // Lenient accessors (return the default on type mismatch)
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const;

    /** Finite number that rounds into int range; as_int / get_int saturate otherwise. */
    bool fits_int() const;
    std::string get_string(const std::string& def = "") const {
        return is_string() ? str_val_ : def;
    }

    // ── Object ──

    /** Member lookup; a shared null value when absent or not an object. */
    const JsonValue& operator[](const std::string& key) const;
    bool has(const std::string& key) const;
    const std::vector<Member>& members() const { return members_; }

    /** Insert or replace a member. Converts a null value into an object. */
    void set(const std::string& key, JsonValue val);
    bool erase(const std::string& key);

    // ── Array ──

    const JsonValue& operator[](size_t index) const;
    const std::vector<JsonValue>& elements() const { return elements_; }

    /** Append an element. Converts a null value into an array. */
    void push_back(JsonValue val);

    /** Element count for arrays, member count for objects, 0 otherwise. */
    size_t size() const;

    bool operator==(const JsonValue& other) const;
    bool operator!=(const JsonValue& other) const { return !(*this == other); }

private:
    JsonType type_ = JsonType::NIL;
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::vector<Member> members_;
    std::unordered_map<std::string, size_t> member_index_;
    std::vector<JsonValue> elements_;

    void reindex();
    static const JsonValue& null_value();
};

class JsonReader {
public:
    /** Nesting limit; host payloads are a few levels deep. */
    static constexpr int MAX_DEPTH = 64;

    /**
     * Parse a complete JSON document. Trailing non-whitespace is an error.
     * @throws JsonError on malformed input
     */
    static JsonValue parse(const std::string& json);

    /**
     * Parse a JSON file.
     * @throws std::runtime_error when the file cannot be read, JsonError on parse errors
     */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace spirits

#endif  // SPIRITS_JSON_READER_HPP
