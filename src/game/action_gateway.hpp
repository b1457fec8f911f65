/**
 * ActionGateway — the single path from decision logic to the host.
 *
 * Every intent is checked, in order:
 *   1. the bound WorldState is from the current tick      (StaleSnapshotError)
 *   2. the actor is a live spirit on the caller's roster  (UnknownTargetError)
 *   3. the actor's shape has the capability               (CapabilityError)
 *   4. action preconditions: energize/merge targets exist (UnknownTargetError),
 *      parameters are well formed                          (InvalidIntentError)
 *   5. the actor has not acted yet this tick              (DoubleActionError)
 * and, if it passes, forwarded to the HostBinding exactly once. The host's
 * response is not checked and nothing is retried.
 *
 * submit() turns a failure into a Diagnostic and a rejected DispatchResult;
 * dispatch() throws it.
 */

#ifndef SPIRITS_GAME_ACTION_GATEWAY_HPP
#define SPIRITS_GAME_ACTION_GATEWAY_HPP

#include "game/diagnostics.hpp"
#include "game/host_binding.hpp"
#include "game/intent.hpp"
#include "game/memory.hpp"
#include "game/world_state.hpp"
#include <string>
#include <unordered_set>

namespace spirits::game {

class ActionGateway {
public:
    ActionGateway(HostBinding& host, const TickClock& clock, DiagnosticLog& diagnostics,
                  CrossTickMemory* memory = nullptr, bool verbose = false);

    /**
     * Bind this tick's world. The one-action tracker resets when the tick
     * changes; rebinding within a tick keeps it.
     */
    void begin_tick(const WorldState& world);

    /**
     * Validate and forward. Validation failures come back as a rejected
     * result, never as a GameError. Anything else the binding throws
     * propagates, and the actor is left free to act again.
     */
    DispatchResult submit(const Intent& intent);

    /**
     * Validate and forward.
     * @throws GameError subclass describing the first failed check
     */
    void dispatch(const Intent& intent);

    bool has_acted(const std::string& spirit_id) const { return acted_.count(spirit_id) > 0; }
    size_t dispatched_count() const { return dispatched_; }
    size_t rejected_count() const { return rejected_; }
    const WorldState* world() const { return world_; }

private:
    HostBinding& host_;
    const TickClock& clock_;
    DiagnosticLog& diagnostics_;
    CrossTickMemory* memory_;
    bool verbose_;

    const WorldState* world_ = nullptr;
    long acted_tick_ = -1;
    std::unordered_set<std::string> acted_;
    size_t dispatched_ = 0;
    size_t rejected_ = 0;

    void validate(const Intent& intent) const;
    const Spirit& resolve_actor(const Intent& intent) const;
    void check_preconditions(const Intent& intent, const Spirit& actor) const;
    void remember(const Intent& intent);
};

} // namespace spirits::game

#endif // SPIRITS_GAME_ACTION_GATEWAY_HPP
