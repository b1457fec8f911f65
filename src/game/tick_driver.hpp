/**
 * TickDriver — runs the core once per host tick.
 *
 * Per tick: advance the clock, rebuild the WorldState, derive the economy,
 * hand a TickContext to the decision logic, collect the commands the gateway
 * forwarded. Owns the clock, the cross-tick memory and the diagnostic log for
 * the lifetime of the process.
 */

#ifndef SPIRITS_GAME_TICK_DRIVER_HPP
#define SPIRITS_GAME_TICK_DRIVER_HPP

#include "game/action_gateway.hpp"
#include "game/capability.hpp"
#include "game/diagnostics.hpp"
#include "game/economy.hpp"
#include "game/host_binding.hpp"
#include "game/host_state.hpp"
#include "game/intent.hpp"
#include "game/memory.hpp"
#include "game/snapshot.hpp"
#include "game/world_state.hpp"
#include <string>
#include <utility>
#include <vector>

namespace spirits::game {

/** CLI / embedding options. */
struct CoreConfig {
    std::string state_path;         // host state JSON (one tick object or an array of them)
    std::string intents_path;       // scripted intents JSON, optional
    std::string config_path;        // rules override JSON, optional
    std::string output_path;        // "" = stdout
    bool forecast = false;
    bool verbose = false;
};

/** Everything decision logic may read or act through during one tick. */
struct TickContext {
    const WorldState& world;
    const EconomyEngine& economy;
    const EconomyReport& report;
    ActionGateway& gateway;
    CrossTickMemory& memory;

    /** Capability views of the caller's live spirits. */
    std::vector<ShapedSpirit> roster() const { return narrow_roster(world, gateway); }
};

class DecisionLogic {
public:
    virtual ~DecisionLogic() = default;
    virtual void on_tick(TickContext& ctx) = 0;
};

/** Replays intents read from a file, in file order. */
class ScriptedIntents : public DecisionLogic {
public:
    explicit ScriptedIntents(std::vector<ScheduledIntent> schedule)
        : schedule_(std::move(schedule)) {}

    void on_tick(TickContext& ctx) override;

private:
    std::vector<ScheduledIntent> schedule_;
};

struct TickResult {
    long tick = 0;
    EconomyReport economy;
    std::vector<CostTrend> cost_trends;
    std::vector<HostCommand> commands;
    std::vector<Diagnostic> diagnostics;
    bool has_forecast = false;
    Forecast forecast;
    std::string error;              // empty = tick completed
};

class TickDriver {
public:
    TickDriver(const RuleSet& rules, DecisionLogic& logic,
               bool forecast = false, bool verbose = false);

    /** Run one tick. Errors end up in the result, never thrown. */
    TickResult run_tick(const HostGlobals& host);

    std::vector<TickResult> run(const std::vector<HostGlobals>& ticks);

    const TickClock& clock() const { return clock_; }
    CrossTickMemory& memory() { return memory_; }
    const DiagnosticLog& diagnostics() const { return diagnostics_; }
    const EconomyEngine& economy() const { return economy_; }

private:
    EconomyEngine economy_;
    DecisionLogic& logic_;
    bool forecast_;
    bool verbose_;

    SnapshotBuilder builder_;
    TickClock clock_;
    DiagnosticLog diagnostics_;
    CrossTickMemory memory_;
    CommandQueue queue_;
    ActionGateway gateway_;
    WorldState world_;
};

} // namespace spirits::game

#endif // SPIRITS_GAME_TICK_DRIVER_HPP
