#include "game/tick_driver.hpp"
#include "game/errors.hpp"
#include <iostream>

namespace spirits::game {

void ScriptedIntents::on_tick(TickContext& ctx) {
    for (const auto& s : schedule_) {
        if (s.applies_to(ctx.world.tick())) {
            ctx.gateway.submit(s.intent);
        }
    }
}

TickDriver::TickDriver(const RuleSet& rules, DecisionLogic& logic,
                       bool forecast, bool verbose)
    : economy_(rules), logic_(logic), forecast_(forecast), verbose_(verbose),
      builder_(verbose), diagnostics_(verbose),
      gateway_(queue_, clock_, diagnostics_, &memory_, verbose) {}

TickResult TickDriver::run_tick(const HostGlobals& host) {
    TickResult result;
    result.tick = host.tick;
    size_t mark = diagnostics_.size();

    try {
        clock_.advance_to(host.tick);
        world_ = builder_.snapshot(host, clock_);

        // Economy first, then decisions against the derived quantities
        result.economy = economy_.derive(world_, diagnostics_);
        result.cost_trends = economy_.record_cost_trends(world_, memory_);

        queue_.clear();
        gateway_.begin_tick(world_);
        TickContext ctx{world_, economy_, result.economy, gateway_, memory_};
        logic_.on_tick(ctx);
        result.commands = queue_.commands();

        if (forecast_) {
            result.forecast = economy_.forecast(world_, result.economy);
            result.has_forecast = true;
        }
    } catch (const StaleSnapshotError& e) {
        diagnostics_.record(host.tick, e, "tick");
        result.error = std::string("Tick error: ") + e.what();
    } catch (const std::exception& e) {
        result.error = std::string("Tick error: ") + e.what();
    }

    result.diagnostics = diagnostics_.since(mark);

    if (verbose_) {
        std::cerr << "[TICK] tick " << result.tick << ": "
                  << result.commands.size() << " commands, "
                  << result.diagnostics.size() << " diagnostics";
        if (!result.error.empty()) std::cerr << " (" << result.error << ")";
        std::cerr << "\n";
    }
    return result;
}

std::vector<TickResult> TickDriver::run(const std::vector<HostGlobals>& ticks) {
    std::vector<TickResult> results;
    results.reserve(ticks.size());
    for (const auto& host : ticks) {
        results.push_back(run_tick(host));
    }
    return results;
}

} // namespace spirits::game
