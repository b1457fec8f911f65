#include "game/diagnostics.hpp"
#include "io/json_writer.hpp"
#include <algorithm>
#include <cstddef>
#include <iostream>

namespace spirits::game {

static const char* source_tag(ErrorKind kind) {
    return kind == ErrorKind::ECONOMY_INVARIANT ? "[ECONOMY]" : "[GATEWAY]";
}

void DiagnosticLog::record(const Diagnostic& d) {
    entries_.push_back(d);
    if (verbose_) {
        std::cerr << source_tag(d.kind) << " tick " << d.tick << " "
                  << error_kind_to_string(d.kind) << " " << d.action;
        if (!d.subject_id.empty()) std::cerr << " " << d.subject_id;
        std::cerr << ": " << d.message << "\n";
    }
}

void DiagnosticLog::record(long tick, const GameError& err, const std::string& action) {
    Diagnostic d;
    d.tick = tick;
    d.kind = err.kind();
    d.subject_id = err.subject_id();
    d.action = action;
    d.message = err.what();
    record(d);
}

size_t DiagnosticLog::count(ErrorKind kind) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [kind](const Diagnostic& d) { return d.kind == kind; }));
}

std::vector<Diagnostic> DiagnosticLog::since(size_t mark) const {
    if (mark >= entries_.size()) return {};
    return std::vector<Diagnostic>(entries_.begin() + static_cast<std::ptrdiff_t>(mark),
                                   entries_.end());
}

void DiagnosticLog::write_json(std::ostream& os) const {
    JsonWriter w(os);
    w.begin_array();
    for (const auto& d : entries_) {
        w.begin_object()
         .kv("tick", d.tick)
         .kv("kind", error_kind_to_string(d.kind))
         .kv("subject", d.subject_id)
         .kv("action", d.action)
         .kv("message", d.message)
         .end_object();
    }
    w.end_array();
}

} // namespace spirits::game
