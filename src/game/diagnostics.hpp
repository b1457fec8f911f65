/**
 * DiagnosticLog — structured record of every recovered game error.
 *
 * The gateway and the economy engine never let a GameError escape a tick;
 * they append a Diagnostic here instead. With verbose on, each entry is also
 * echoed to stderr under its source tag.
 */

#ifndef SPIRITS_GAME_DIAGNOSTICS_HPP
#define SPIRITS_GAME_DIAGNOSTICS_HPP

#include "game/errors.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace spirits::game {

struct Diagnostic {
    long tick = 0;
    ErrorKind kind = ErrorKind::INVALID_INTENT;
    std::string subject_id;     // acting spirit or offending entity
    std::string action;         // command name, or the economy step
    std::string message;
};

class DiagnosticLog {
public:
    explicit DiagnosticLog(bool verbose = false) : verbose_(verbose) {}

    void record(const Diagnostic& d);
    void record(long tick, const GameError& err, const std::string& action);

    const std::vector<Diagnostic>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t count(ErrorKind kind) const;

    /** Entries recorded since `mark` (an earlier size()). */
    std::vector<Diagnostic> since(size_t mark) const;

    void write_json(std::ostream& os) const;

private:
    bool verbose_;
    std::vector<Diagnostic> entries_;
};

} // namespace spirits::game

#endif // SPIRITS_GAME_DIAGNOSTICS_HPP
