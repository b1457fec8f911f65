#include "game/rules.hpp"
#include <stdexcept>

namespace spirits::game {

RuleSet RulesParser::parse(const JsonValue& rules) {
    RuleSet rs;
    if (!rules.is_object()) return rs;

    // ── Stars ──
    const auto& stars = rules["stars"];
    rs.star_base_income       = stars["baseIncome"].get_number(rs.star_base_income);
    rs.star_income_pct        = stars["incomePct"].get_number(rs.star_income_pct);
    rs.high_yield_star_id     = stars["highYieldStar"].get_string(rs.high_yield_star_id);
    rs.high_yield_base_income = stars["highYieldBaseIncome"].get_number(rs.high_yield_base_income);
    rs.high_yield_income_pct  = stars["highYieldIncomePct"].get_number(rs.high_yield_income_pct);

    // ── Outposts ──
    const auto& outposts = rules["outposts"];
    rs.outpost_high_tier_energy = outposts["highTierEnergy"].get_int(rs.outpost_high_tier_energy);
    rs.outpost_low_tier  = parse_tier(outposts["low"], rs.outpost_low_tier);
    rs.outpost_high_tier = parse_tier(outposts["high"], rs.outpost_high_tier);

    // ── Pylons ──
    const auto& pylons = rules["pylons"];
    rs.pylon_inner_radius    = pylons["innerRadius"].get_number(rs.pylon_inner_radius);
    rs.pylon_outer_radius    = pylons["outerRadius"].get_number(rs.pylon_outer_radius);
    rs.pylon_heal_per_spirit = pylons["healPerSpirit"].get_int(rs.pylon_heal_per_spirit);

    // ── Spirits ──
    rs.energy_per_size = rules["spirits"]["energyPerSize"].get_int(rs.energy_per_size);

    validate(rs);
    return rs;
}

OutpostTier RulesParser::parse_tier(const JsonValue& def, const OutpostTier& fallback) {
    OutpostTier tier = fallback;
    if (!def.is_object()) return tier;
    tier.range  = def["range"].get_number(tier.range);
    tier.cost   = def["cost"].get_int(tier.cost);
    tier.damage = def["damage"].get_int(tier.damage);
    return tier;
}

void RulesParser::validate(const RuleSet& rs) {
    if (rs.star_base_income < 0.0 || rs.star_income_pct < 0.0 ||
        rs.high_yield_base_income < 0.0 || rs.high_yield_income_pct < 0.0) {
        throw std::runtime_error("rules: star income constants must be non-negative");
    }
    if (rs.outpost_low_tier.cost <= 0 || rs.outpost_high_tier.cost <= 0) {
        throw std::runtime_error("rules: outpost shot cost must be positive");
    }
    if (rs.pylon_inner_radius < 0.0 || rs.pylon_outer_radius < rs.pylon_inner_radius) {
        throw std::runtime_error("rules: pylon annulus needs 0 <= innerRadius <= outerRadius");
    }
    if (rs.pylon_heal_per_spirit < 0) {
        throw std::runtime_error("rules: pylon healPerSpirit must be non-negative");
    }
    if (rs.energy_per_size <= 0) {
        throw std::runtime_error("rules: spirits energyPerSize must be positive");
    }
}

} // namespace spirits::game
