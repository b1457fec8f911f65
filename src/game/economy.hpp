/**
 * EconomyEngine — per-tick economic and combat rules of the structures.
 *
 * Pure functions of a WorldState and a RuleSet: star income, base production
 * gating, outpost damage tier and target choice, pylon heal zones. Nothing is
 * remembered between calls.
 *
 * The forecast functions apply the same rules to copies of the records, so
 * the caller can see what the host should report next tick. The host stays
 * authoritative; the forecast is a local mirror only.
 */

#ifndef SPIRITS_GAME_ECONOMY_HPP
#define SPIRITS_GAME_ECONOMY_HPP

#include "game/diagnostics.hpp"
#include "game/entity.hpp"
#include "game/memory.hpp"
#include "game/rules.hpp"
#include "game/world_state.hpp"
#include <string>
#include <utility>
#include <vector>

namespace spirits::game {

struct HealTarget {
    std::string spirit_id;
    int amount = 0;
};

struct HealPlan {
    std::string pylon_id;
    int energy_before = 0;
    std::vector<HealTarget> targets;    // ascending spirit id

    int energy_spent() const {
        int total = 0;
        for (const auto& t : targets) total += t.amount;
        return total;
    }
};

/** One outpost shot; target_id empty when the outpost holds fire. */
struct Shot {
    std::string outpost_id;
    std::string target_id;
    int damage = 0;
    int cost = 0;

    bool fired() const { return !target_id.empty(); }
};

struct StarIncome {
    std::string star_id;
    int energy = 0;
    int income = 0;
};

struct ProductionGate {
    std::string base_id;
    bool can_produce = false;
    bool enemies_sighted = false;
    int energy = 0;
    int cost = 0;
};

struct OutpostStatus {
    std::string outpost_id;
    OutpostTier tier;
    Shot shot;
};

struct EconomyReport {
    long tick = 0;
    std::vector<StarIncome> stars;
    std::vector<ProductionGate> bases;
    std::vector<OutpostStatus> outposts;
    std::vector<HealPlan> pylons;
    std::vector<std::string> skipped;   // entities excluded by an invariant failure
};

enum class Trend {
    FLAT,
    RISING,
    FALLING
};

inline const char* trend_to_string(Trend t) {
    switch (t) {
        case Trend::FLAT:    return "flat";
        case Trend::RISING:  return "rising";
        case Trend::FALLING: return "falling";
        default:             return "";
    }
}

struct CostTrend {
    std::string base_id;
    int previous = 0;       // equals current on the first observation
    int current = 0;
    Trend trend = Trend::FLAT;
};

/** Mirror of the structures and spirits after this tick's structure effects. */
struct Forecast {
    long tick = 0;
    std::vector<Star> stars;
    std::vector<Base> bases;
    std::vector<Outpost> outposts;
    std::vector<Pylon> pylons;
    std::vector<Spirit> spirits;
    std::vector<std::string> produced;  // bases whose production went ahead
    std::vector<Shot> shots;
    std::vector<HealPlan> heals;
};

class EconomyEngine {
public:
    explicit EconomyEngine(RuleSet rules = RuleSet()) : rules_(std::move(rules)) {}

    const RuleSet& rules() const { return rules_; }

    // ── Rules ──

    /** Energy the star gains this tick, rounded half-up and clamped at capacity. */
    int star_income(const Star& star) const;

    /** No enemy in the base's sight and enough energy for the next spirit. */
    bool base_can_produce(const Base& base, const Sight& sight) const;

    /** Tier for the outpost's energy; the high tier starts at the threshold. */
    OutpostTier outpost_damage_tier(const Outpost& outpost) const;
    OutpostTier outpost_damage_tier(int energy) const;

    /** Friendly spirits in the heal annulus, one heal each while energy lasts. */
    HealPlan pylon_heal_targets(const Pylon& pylon,
                                const std::vector<const Spirit*>& friendly_spirits) const;

    /**
     * Nearest live enemy within tier range (ties by id), if the outpost can
     * afford a shot. Neutral outposts hold fire.
     */
    Shot plan_outpost_shot(const Outpost& outpost, const WorldState& world) const;

    /** @throws EconomyInvariantError when energy is outside [0, capacity] */
    static void check_energy(const std::string& id, int energy, int capacity);

    // ── Mirror updates ──

    void regenerate(Star& star) const;
    bool resolve_production(Base& base, const Sight& sight) const;
    Shot resolve_outpost_fire(Outpost& outpost, const WorldState& world) const;
    void apply_heal(Pylon& pylon, const HealPlan& plan, std::vector<Spirit>& spirits) const;

    // ── Whole-world ──

    /**
     * Derive every structure's quantities for this tick. Entities failing the
     * energy invariant are skipped and reported to `diagnostics`. A world
     * whose bound clock has moved on yields an empty report and one
     * stale-snapshot diagnostic.
     */
    EconomyReport derive(const WorldState& world, DiagnosticLog& diagnostics) const;

    /**
     * Apply regeneration, production, outpost fire and healing to copies,
     * leaving out the entities `report` skipped.
     * @throws StaleSnapshotError when the world's bound clock has moved on
     */
    Forecast forecast(const WorldState& world, const EconomyReport& report) const;

    /**
     * Store each base's spirit cost in memory and compare with the value
     * stored on the previous call.
     */
    std::vector<CostTrend> record_cost_trends(const WorldState& world,
                                              CrossTickMemory& memory) const;

    static std::string cost_key(const std::string& base_id) { return "base_cost:" + base_id; }

private:
    RuleSet rules_;

    bool energy_ok(long tick, const std::string& id, int energy, int capacity,
                   const char* step, DiagnosticLog& diagnostics) const;
};

} // namespace spirits::game

#endif // SPIRITS_GAME_ECONOMY_HPP
