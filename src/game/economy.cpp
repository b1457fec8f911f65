#include "game/economy.hpp"
#include "game/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace spirits::game {

// ═══════════════════════════════════════════════════════════════
// Rules
// ═══════════════════════════════════════════════════════════════

int EconomyEngine::star_income(const Star& star) const {
    bool high_yield = star.id == rules_.high_yield_star_id;
    double base = high_yield ? rules_.high_yield_base_income : rules_.star_base_income;
    double pct  = high_yield ? rules_.high_yield_income_pct : rules_.star_income_pct;

    // Half-up; the epsilon absorbs representation error in pct * energy
    int income = static_cast<int>(std::floor(base + pct * star.energy + 0.5 + 1e-9));

    long long headroom = static_cast<long long>(star.energy_capacity) - star.energy;
    return static_cast<int>(std::clamp<long long>(income, 0, std::max(0LL, headroom)));
}

bool EconomyEngine::base_can_produce(const Base& base, const Sight& sight) const {
    return sight.enemies.empty() && base.energy >= base.current_spirit_cost;
}

OutpostTier EconomyEngine::outpost_damage_tier(int energy) const {
    return energy >= rules_.outpost_high_tier_energy ? rules_.outpost_high_tier
                                                     : rules_.outpost_low_tier;
}

OutpostTier EconomyEngine::outpost_damage_tier(const Outpost& outpost) const {
    return outpost_damage_tier(outpost.energy);
}

HealPlan EconomyEngine::pylon_heal_targets(const Pylon& pylon,
                                           const std::vector<const Spirit*>& friendly_spirits) const {
    HealPlan plan;
    plan.pylon_id = pylon.id;
    plan.energy_before = pylon.energy;

    std::vector<const Spirit*> in_zone;
    for (const Spirit* sp : friendly_spirits) {
        if (!sp || !sp->alive()) continue;
        if (sp->energy >= sp->energy_capacity) continue;     // nothing to heal
        double d = pylon.position.distance_to(sp->position);
        if (d >= rules_.pylon_inner_radius && d <= rules_.pylon_outer_radius) {
            in_zone.push_back(sp);
        }
    }
    std::sort(in_zone.begin(), in_zone.end(),
              [](const Spirit* a, const Spirit* b) { return a->id < b->id; });

    int remaining = std::max(0, pylon.energy);
    for (const Spirit* sp : in_zone) {
        if (remaining <= 0) break;
        int amount = std::min(rules_.pylon_heal_per_spirit, remaining);
        plan.targets.push_back(HealTarget{sp->id, amount});
        remaining -= amount;
    }
    return plan;
}

Shot EconomyEngine::plan_outpost_shot(const Outpost& outpost, const WorldState& world) const {
    Shot shot;
    shot.outpost_id = outpost.id;
    if (!outpost.controlled()) return shot;

    OutpostTier tier = outpost_damage_tier(outpost);
    if (outpost.energy < tier.cost) return shot;

    const Spirit* best = nullptr;
    double best_range = std::numeric_limits<double>::infinity();
    for (const Spirit* enemy : world.enemy_spirits_of(outpost.control)) {
        double d = outpost.position.distance_to(enemy->position);
        if (d > tier.range) continue;
        // enemy_spirits_of is id-sorted, so strict < keeps the lowest id on ties
        if (d < best_range) {
            best_range = d;
            best = enemy;
        }
    }
    if (!best) return shot;

    shot.target_id = best->id;
    shot.damage = tier.damage;
    shot.cost = tier.cost;
    return shot;
}

void EconomyEngine::check_energy(const std::string& id, int energy, int capacity) {
    if (energy == ENERGY_UNREADABLE || capacity == ENERGY_UNREADABLE) {
        throw EconomyInvariantError(id, id + " energy or capacity outside the representable range");
    }
    if (energy < 0 || energy > capacity) {
        throw EconomyInvariantError(id, id + " energy " + std::to_string(energy) +
                                    " outside [0, " + std::to_string(capacity) + "]");
    }
}

// ═══════════════════════════════════════════════════════════════
// Mirror updates
// ═══════════════════════════════════════════════════════════════

void EconomyEngine::regenerate(Star& star) const {
    star.energy += star_income(star);
}

bool EconomyEngine::resolve_production(Base& base, const Sight& sight) const {
    if (!base_can_produce(base, sight)) return false;
    base.energy -= base.current_spirit_cost;
    return true;
}

Shot EconomyEngine::resolve_outpost_fire(Outpost& outpost, const WorldState& world) const {
    Shot shot = plan_outpost_shot(outpost, world);
    if (shot.fired()) {
        outpost.energy -= shot.cost;
    }
    return shot;
}

void EconomyEngine::apply_heal(Pylon& pylon, const HealPlan& plan,
                               std::vector<Spirit>& spirits) const {
    for (const auto& target : plan.targets) {
        if (pylon.energy < target.amount) break;
        auto it = std::find_if(spirits.begin(), spirits.end(),
                               [&](const Spirit& s) { return s.id == target.spirit_id; });
        if (it == spirits.end() || !it->alive()) continue;

        pylon.energy -= target.amount;
        it->energy = std::min(it->energy + target.amount, it->energy_capacity);
    }
}

// ═══════════════════════════════════════════════════════════════
// Whole-world
// ═══════════════════════════════════════════════════════════════

bool EconomyEngine::energy_ok(long tick, const std::string& id, int energy, int capacity,
                              const char* step, DiagnosticLog& diagnostics) const {
    try {
        check_energy(id, energy, capacity);
        return true;
    } catch (const EconomyInvariantError& e) {
        diagnostics.record(tick, e, step);
        return false;
    }
}

EconomyReport EconomyEngine::derive(const WorldState& world, DiagnosticLog& diagnostics) const {
    EconomyReport report;
    report.tick = world.tick();
    const long tick = world.tick();

    try {
        world.ensure_current();
    } catch (const StaleSnapshotError& e) {
        diagnostics.record(tick, e, "derive");
        return report;
    }

    for (const auto& star : world.stars()) {
        if (!energy_ok(tick, star.id, star.energy, star.energy_capacity, "star_income", diagnostics)) {
            report.skipped.push_back(star.id);
            continue;
        }
        report.stars.push_back(StarIncome{star.id, star.energy, star_income(star)});
    }

    for (const auto& base : world.bases()) {
        if (!energy_ok(tick, base.id, base.energy, base.energy_capacity, "base_production", diagnostics)) {
            report.skipped.push_back(base.id);
            continue;
        }
        ProductionGate gate;
        gate.base_id = base.id;
        gate.enemies_sighted = !base.sight.enemies.empty();
        gate.can_produce = base_can_produce(base, base.sight);
        gate.energy = base.energy;
        gate.cost = base.current_spirit_cost;
        report.bases.push_back(gate);
    }

    for (const auto& outpost : world.outposts()) {
        if (!energy_ok(tick, outpost.id, outpost.energy, outpost.energy_capacity, "outpost_tier", diagnostics)) {
            report.skipped.push_back(outpost.id);
            continue;
        }
        OutpostStatus status;
        status.outpost_id = outpost.id;
        status.tier = outpost_damage_tier(outpost);
        status.shot = plan_outpost_shot(outpost, world);
        report.outposts.push_back(status);
    }

    // Spirits with a bad energy reading take no part in healing
    std::unordered_set<std::string> bad_spirits;
    for (const auto& sp : world.spirits()) {
        if (!energy_ok(tick, sp.id, sp.energy, sp.energy_capacity, "spirit_energy", diagnostics)) {
            bad_spirits.insert(sp.id);
            report.skipped.push_back(sp.id);
        }
    }

    for (const auto& pylon : world.pylons()) {
        if (!energy_ok(tick, pylon.id, pylon.energy, pylon.energy_capacity, "pylon_heal", diagnostics)) {
            report.skipped.push_back(pylon.id);
            continue;
        }
        std::vector<const Spirit*> friendly;
        if (pylon.controlled()) {
            for (const Spirit* sp : world.friendly_spirits_of(pylon.control)) {
                if (!bad_spirits.count(sp->id)) friendly.push_back(sp);
            }
        }
        report.pylons.push_back(pylon_heal_targets(pylon, friendly));
    }

    return report;
}

Forecast EconomyEngine::forecast(const WorldState& world, const EconomyReport& report) const {
    Forecast fc;
    fc.tick = world.tick();
    fc.stars = world.stars();
    fc.bases = world.bases();
    fc.outposts = world.outposts();
    fc.pylons = world.pylons();
    fc.spirits = world.spirits();

    std::unordered_set<std::string> skipped(report.skipped.begin(), report.skipped.end());

    for (auto& star : fc.stars) {
        if (!skipped.count(star.id)) regenerate(star);
    }

    for (auto& base : fc.bases) {
        if (skipped.count(base.id)) continue;
        if (resolve_production(base, base.sight)) fc.produced.push_back(base.id);
    }

    for (auto& outpost : fc.outposts) {
        if (skipped.count(outpost.id)) continue;
        Shot shot = resolve_outpost_fire(outpost, world);
        if (!shot.fired()) continue;
        for (auto& sp : fc.spirits) {
            if (sp.id == shot.target_id) {
                sp.hp -= shot.damage;
                break;
            }
        }
        fc.shots.push_back(shot);
    }

    for (auto& pylon : fc.pylons) {
        for (const auto& plan : report.pylons) {
            if (plan.pylon_id != pylon.id) continue;
            apply_heal(pylon, plan, fc.spirits);
            fc.heals.push_back(plan);
            break;
        }
    }

    return fc;
}

std::vector<CostTrend> EconomyEngine::record_cost_trends(const WorldState& world,
                                                         CrossTickMemory& memory) const {
    std::vector<CostTrend> out;
    for (const auto& base : world.bases()) {
        CostTrend t;
        t.base_id = base.id;
        t.current = base.current_spirit_cost;

        std::string key = cost_key(base.id);
        const JsonValue& prev = memory.get(key);
        t.previous = prev.is_number() ? prev.as_int() : t.current;

        if (t.current > t.previous)      t.trend = Trend::RISING;
        else if (t.current < t.previous) t.trend = Trend::FALLING;
        else                             t.trend = Trend::FLAT;

        memory.set(key, JsonValue(t.current));
        out.push_back(t);
    }
    return out;
}

} // namespace spirits::game
