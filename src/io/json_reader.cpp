/**
 * JSON reader implementation: document model helpers + recursive descent parser
 */

#include "json_reader.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstddef>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace spirits {

const char* json_type_name(JsonType type) {
    switch (type) {
        case JsonType::NIL:    return "null";
        case JsonType::BOOL:   return "bool";
        case JsonType::NUMBER: return "number";
        case JsonType::STRING: return "string";
        case JsonType::OBJECT: return "object";
        case JsonType::ARRAY:  return "array";
        default:               return "unknown";
    }
}

JsonError::JsonError(const std::string& msg, size_t line, size_t column)
    : std::runtime_error("JSON parse error at line " + std::to_string(line) +
                         ", column " + std::to_string(column) + ": " + msg),
      line_(line), column_(column) {}

// ═══════════════════════════════════════════════════════════════
// JsonValue
// ═══════════════════════════════════════════════════════════════

static std::runtime_error type_mismatch(const char* wanted, JsonType got) {
    return std::runtime_error(std::string("JsonValue: expected ") + wanted +
                              ", got " + json_type_name(got));
}

JsonValue JsonValue::object() {
    JsonValue v;
    v.type_ = JsonType::OBJECT;
    return v;
}

JsonValue JsonValue::array() {
    JsonValue v;
    v.type_ = JsonType::ARRAY;
    return v;
}

bool JsonValue::as_bool() const {
    if (type_ != JsonType::BOOL) throw type_mismatch("bool", type_);
    return bool_val_;
}

double JsonValue::as_number() const {
    if (type_ != JsonType::NUMBER) throw type_mismatch("number", type_);
    return num_val_;
}

// Saturate before rounding; llround of an out-of-range double is unspecified
static int saturate_int(double v) {
    if (std::isnan(v)) return 0;
    if (v >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
    if (v <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
    return static_cast<int>(std::llround(v));
}

int JsonValue::as_int() const {
    return saturate_int(as_number());
}

long long JsonValue::as_int64() const {
    double v = as_number();
    if (std::isnan(v)) return 0;
    if (v >= 9.2e18) return std::numeric_limits<long long>::max();
    if (v <= -9.2e18) return std::numeric_limits<long long>::min();
    return std::llround(v);
}

bool JsonValue::fits_int() const {
    if (!is_number() || !std::isfinite(num_val_)) return false;
    double r = std::round(num_val_);
    return r >= static_cast<double>(std::numeric_limits<int>::min()) &&
           r <= static_cast<double>(std::numeric_limits<int>::max());
}

const std::string& JsonValue::as_string() const {
    if (type_ != JsonType::STRING) throw type_mismatch("string", type_);
    return str_val_;
}

int JsonValue::get_int(int def) const {
    if (!is_number() || !std::isfinite(num_val_)) return def;
    return saturate_int(num_val_);
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (type_ != JsonType::OBJECT) return null_value();
    auto it = member_index_.find(key);
    if (it == member_index_.end()) return null_value();
    return members_[it->second].second;
}

bool JsonValue::has(const std::string& key) const {
    return type_ == JsonType::OBJECT && member_index_.count(key) > 0;
}

void JsonValue::set(const std::string& key, JsonValue val) {
    if (type_ == JsonType::NIL) type_ = JsonType::OBJECT;
    if (type_ != JsonType::OBJECT) throw type_mismatch("object", type_);

    auto it = member_index_.find(key);
    if (it != member_index_.end()) {
        members_[it->second].second = std::move(val);
        return;
    }
    member_index_[key] = members_.size();
    members_.emplace_back(key, std::move(val));
}

bool JsonValue::erase(const std::string& key) {
    if (type_ != JsonType::OBJECT) return false;
    auto it = member_index_.find(key);
    if (it == member_index_.end()) return false;
    members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(it->second));
    reindex();
    return true;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (type_ != JsonType::ARRAY || index >= elements_.size()) return null_value();
    return elements_[index];
}

void JsonValue::push_back(JsonValue val) {
    if (type_ == JsonType::NIL) type_ = JsonType::ARRAY;
    if (type_ != JsonType::ARRAY) throw type_mismatch("array", type_);
    elements_.push_back(std::move(val));
}

size_t JsonValue::size() const {
    if (type_ == JsonType::ARRAY) return elements_.size();
    if (type_ == JsonType::OBJECT) return members_.size();
    return 0;
}

bool JsonValue::operator==(const JsonValue& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case JsonType::NIL:    return true;
        case JsonType::BOOL:   return bool_val_ == other.bool_val_;
        case JsonType::NUMBER: return num_val_ == other.num_val_;
        case JsonType::STRING: return str_val_ == other.str_val_;
        case JsonType::ARRAY:  return elements_ == other.elements_;
        case JsonType::OBJECT: {
            // Member order is not significant for equality
            if (members_.size() != other.members_.size()) return false;
            for (const auto& [key, val] : members_) {
                auto it = other.member_index_.find(key);
                if (it == other.member_index_.end()) return false;
                if (other.members_[it->second].second != val) return false;
            }
            return true;
        }
    }
    return false;
}

void JsonValue::reindex() {
    member_index_.clear();
    for (size_t i = 0; i < members_.size(); ++i) {
        member_index_[members_[i].first] = i;
    }
}

const JsonValue& JsonValue::null_value() {
    static const JsonValue nil;
    return nil;
}

// ═══════════════════════════════════════════════════════════════
// Parser
// ═══════════════════════════════════════════════════════════════

namespace {

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input) {}

    JsonValue parse_document() {
        skip_whitespace();
        JsonValue root = parse_value(0);
        skip_whitespace();
        if (pos_ < src_.size()) {
            throw error("Trailing characters after document");
        }
        return root;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t line_start_ = 0;

    JsonError error(const std::string& msg) const {
        return JsonError(msg, line_, pos_ - line_start_ + 1);
    }

    bool at_end() const { return pos_ >= src_.size(); }

    char peek() const { return at_end() ? '\0' : src_[pos_]; }

    char next() {
        if (at_end()) throw error("Unexpected end of input");
        char c = src_[pos_++];
        if (c == '\n') {
            ++line_;
            line_start_ = pos_;
        }
        return c;
    }

    void consume(char c) {
        char got = next();
        if (got != c) {
            throw error(std::string("Expected '") + c + "' but found '" + got + "'");
        }
    }

    void skip_whitespace() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            next();
        }
    }

    bool match_literal(const char* word) {
        std::string w(word);
        if (src_.compare(pos_, w.size(), w) != 0) return false;
        pos_ += w.size();
        return true;
    }

    JsonValue parse_value(int depth) {
        if (depth > JsonReader::MAX_DEPTH) throw error("Nesting too deep");
        skip_whitespace();

        char c = peek();
        switch (c) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': return JsonValue(parse_string());
            case 't':
                if (match_literal("true")) return JsonValue(true);
                break;
            case 'f':
                if (match_literal("false")) return JsonValue(false);
                break;
            case 'n':
                if (match_literal("null")) return JsonValue();
                break;
            default:
                if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
                    return parse_number();
                }
                break;
        }
        if (at_end()) throw error("Unexpected end of input");
        throw error(std::string("Unexpected character '") + c + "'");
    }

    static void append_utf8(std::string& out, unsigned long cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    unsigned long parse_hex4() {
        unsigned long code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = next();
            code <<= 4;
            if (h >= '0' && h <= '9')      code |= static_cast<unsigned long>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned long>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned long>(h - 'A' + 10);
            else throw error("Invalid hex digit in \\u escape");
        }
        return code;
    }

    std::string parse_string() {
        consume('"');
        std::string out;
        while (true) {
            if (at_end()) throw error("Unterminated string");
            char c = next();
            if (c == '"') break;
            if (c == '\n') throw error("Newline inside string");
            if (c != '\\') {
                out += c;
                continue;
            }

            char esc = next();
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    unsigned long cp = parse_hex4();
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        consume('\\');
                        consume('u');
                        unsigned long lo = parse_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) {
                            throw error("Invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    throw error(std::string("Unknown escape '\\") + esc + "'");
            }
        }
        return out;
    }

    void require_digit(const char* what) {
        if (!std::isdigit(static_cast<unsigned char>(peek()))) throw error(what);
    }

    void skip_digits() {
        while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') ++pos_;

        require_digit("Expected digit");
        if (peek() == '0') {
            ++pos_;
        } else {
            skip_digits();
        }

        if (peek() == '.') {
            ++pos_;
            require_digit("Expected digit after '.'");
            skip_digits();
        }

        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            require_digit("Expected digit in exponent");
            skip_digits();
        }

        std::string text = src_.substr(start, pos_ - start);
        return JsonValue(std::strtod(text.c_str(), nullptr));
    }

    JsonValue parse_object(int depth) {
        consume('{');
        JsonValue obj = JsonValue::object();

        skip_whitespace();
        if (peek() == '}') {
            next();
            return obj;
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') throw error("Expected member name");
            std::string key = parse_string();
            skip_whitespace();
            consume(':');
            obj.set(key, parse_value(depth + 1));

            skip_whitespace();
            char sep = next();
            if (sep == '}') break;
            if (sep != ',') throw error("Expected ',' or '}' in object");
        }
        return obj;
    }

    JsonValue parse_array(int depth) {
        consume('[');
        JsonValue arr = JsonValue::array();

        skip_whitespace();
        if (peek() == ']') {
            next();
            return arr;
        }

        while (true) {
            arr.push_back(parse_value(depth + 1));

            skip_whitespace();
            char sep = next();
            if (sep == ']') break;
            if (sep != ',') throw error("Expected ',' or ']' in array");
        }
        return arr;
    }
};

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

JsonValue JsonReader::parse(const std::string& json) {
    Parser parser(json);
    return parser.parse_document();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + filename);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

}  // namespace spirits
