/**
 * Streaming JSON writer (header-only)
 *
 * Writes straight to an ostream with either indented output (reports, memory
 * dumps) or compact single-line output (command batches consumed by the host).
 *
 *   JsonWriter w(std::cout, JsonWriter::COMPACT);
 *   w.begin_array();
 *     w.begin_object().kv("action", "move").kv("actor", "me_1").end_object();
 *   w.end_array();
 */

#ifndef SPIRITS_JSON_WRITER_HPP
#define SPIRITS_JSON_WRITER_HPP

#include "json_reader.hpp"
#include <cmath>
#include <cstdio>
#include <ostream>
#include <string>
#include <vector>

namespace spirits {

class JsonWriter {
public:
    static constexpr int COMPACT = 0;

    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_(indent_size) {}

    JsonWriter& begin_object() { return open('{'); }
    JsonWriter& end_object()   { return close('}'); }
    JsonWriter& begin_array()  { return open('['); }
    JsonWriter& end_array()    { return close(']'); }

    JsonWriter& key(const std::string& k) {
        separate();
        write_string(k);
        os_ << (indent_ > 0 ? ": " : ":");
        after_key_ = true;
        return *this;
    }

    JsonWriter& value(const std::string& v) {
        separate();
        write_string(v);
        return *this;
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v) {
        separate();
        os_ << v;
        return *this;
    }

    JsonWriter& value(long v) {
        separate();
        os_ << v;
        return *this;
    }

    JsonWriter& value(long long v) {
        separate();
        os_ << v;
        return *this;
    }

    JsonWriter& value(size_t v) {
        separate();
        os_ << v;
        return *this;
    }

    JsonWriter& value(double v) {
        separate();
        if (!std::isfinite(v)) {
            os_ << "null";
        } else if (v == std::floor(v) && std::fabs(v) < 1e15) {
            // Whole numbers print without a fraction; energies are integral
            os_ << static_cast<long long>(v);
        } else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.12g", v);
            os_ << buf;
        }
        return *this;
    }

    JsonWriter& value(bool v) {
        separate();
        os_ << (v ? "true" : "false");
        return *this;
    }

    JsonWriter& null_value() {
        separate();
        os_ << "null";
        return *this;
    }

    /** Re-serialise a parsed document (objects keep their member order). */
    JsonWriter& value(const JsonValue& v) {
        switch (v.type()) {
            case JsonType::NIL:    return null_value();
            case JsonType::BOOL:   return value(v.as_bool());
            case JsonType::NUMBER: return value(v.as_number());
            case JsonType::STRING: return value(v.as_string());
            case JsonType::ARRAY:
                begin_array();
                for (const auto& el : v.elements()) value(el);
                return end_array();
            case JsonType::OBJECT:
                begin_object();
                for (const auto& [k, member] : v.members()) {
                    key(k);
                    value(member);
                }
                return end_object();
        }
        return *this;
    }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        return value(v);
    }

private:
    struct Level {
        char closer;
        size_t items = 0;
    };

    std::ostream& os_;
    int indent_;
    std::vector<Level> levels_;
    bool after_key_ = false;

    JsonWriter& open(char opener) {
        separate();
        os_ << opener;
        levels_.push_back(Level{opener == '{' ? '}' : ']'});
        return *this;
    }

    JsonWriter& close(char closer) {
        if (levels_.empty() || levels_.back().closer != closer) return *this;
        bool had_items = levels_.back().items > 0;
        levels_.pop_back();
        if (had_items) break_line();
        os_ << closer;
        return *this;
    }

    // Emits the comma / line break owed before the next item at this level.
    void separate() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (levels_.empty()) return;
        Level& level = levels_.back();
        if (level.items > 0) os_ << ',';
        break_line();
        level.items++;
    }

    void break_line() {
        if (indent_ <= 0) return;
        os_ << '\n';
        os_ << std::string(levels_.size() * static_cast<size_t>(indent_), ' ');
    }

    void write_string(const std::string& s) {
        os_ << '"';
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\b': os_ << "\\b";  break;
                case '\f': os_ << "\\f";  break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x",
                                      static_cast<unsigned>(static_cast<unsigned char>(c)));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
        os_ << '"';
    }
};

}  // namespace spirits

#endif  // SPIRITS_JSON_WRITER_HPP
