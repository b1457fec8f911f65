/**
 * RuleSet — every numeric rule constant the core enforces.
 *
 * Defaults are the live game values. A rules JSON file can override any
 * subset of them (RulesParser::parse), which is how tests and replays of
 * modified game variants pin the constants they run against.
 */

#ifndef SPIRITS_GAME_RULES_HPP
#define SPIRITS_GAME_RULES_HPP

#include "io/json_reader.hpp"
#include <string>

namespace spirits::game {

struct OutpostTier {
    double range = 400.0;
    int cost = 1;       // energy per shot
    int damage = 2;     // damage per shot

    bool operator==(const OutpostTier& o) const {
        return range == o.range && cost == o.cost && damage == o.damage;
    }
    bool operator!=(const OutpostTier& o) const { return !(*this == o); }
};

struct RuleSet {
    // ── Stars: income = base + pct * energy, rounded half-up ──
    double star_base_income = 2.0;
    double star_income_pct = 0.02;
    std::string high_yield_star_id = "star_nua";
    double high_yield_base_income = 3.0;
    double high_yield_income_pct = 0.03;

    // ── Outposts ──
    int outpost_high_tier_energy = 500;          // inclusive
    OutpostTier outpost_low_tier{400.0, 1, 2};
    OutpostTier outpost_high_tier{600.0, 4, 8};

    // ── Pylons ──
    double pylon_inner_radius = 200.0;
    double pylon_outer_radius = 400.0;
    int pylon_heal_per_spirit = 1;

    // ── Spirits ──
    int energy_per_size = 10;     // capacity when the host omits it
};

class RulesParser {
public:
    /**
     * Build a RuleSet from a rules JSON object. Missing keys keep defaults.
     *
     * {
     *   "stars":   {"baseIncome": 2, "incomePct": 0.02, "highYieldStar": "star_nua",
     *               "highYieldBaseIncome": 3, "highYieldIncomePct": 0.03},
     *   "outposts": {"highTierEnergy": 500,
     *                "low":  {"range": 400, "cost": 1, "damage": 2},
     *                "high": {"range": 600, "cost": 4, "damage": 8}},
     *   "pylons":  {"innerRadius": 200, "outerRadius": 400, "healPerSpirit": 1},
     *   "spirits": {"energyPerSize": 10}
     * }
     *
     * @throws std::runtime_error when a value is out of its valid domain
     */
    static RuleSet parse(const JsonValue& rules);

private:
    static OutpostTier parse_tier(const JsonValue& def, const OutpostTier& fallback);
    static void validate(const RuleSet& rules);
};

} // namespace spirits::game

#endif // SPIRITS_GAME_RULES_HPP
