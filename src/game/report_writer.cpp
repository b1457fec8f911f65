#include "game/report_writer.hpp"

namespace spirits::game {

static void write_tier(JsonWriter& w, const OutpostTier& tier) {
    w.begin_object();
    w.kv("range", tier.range);
    w.kv("cost", tier.cost);
    w.kv("damage", tier.damage);
    w.end_object();
}

static void write_shot(JsonWriter& w, const Shot& shot) {
    if (!shot.fired()) {
        w.null_value();
        return;
    }
    w.begin_object();
    w.kv("outpostId", shot.outpost_id);
    w.kv("targetId", shot.target_id);
    w.kv("damage", shot.damage);
    w.kv("cost", shot.cost);
    w.end_object();
}

static void write_heal_plan(JsonWriter& w, const HealPlan& plan) {
    w.begin_object();
    w.kv("pylonId", plan.pylon_id);
    w.kv("energyBefore", plan.energy_before);
    w.kv("energySpent", plan.energy_spent());
    w.key("targets").begin_array();
    for (const auto& t : plan.targets) {
        w.begin_object();
        w.kv("spiritId", t.spirit_id);
        w.kv("amount", t.amount);
        w.end_object();
    }
    w.end_array();
    w.end_object();
}

static void write_economy(JsonWriter& w, const TickResult& r) {
    const EconomyReport& eco = r.economy;
    w.begin_object();

    // ── stars ──
    w.key("stars").begin_array();
    for (const auto& s : eco.stars) {
        w.begin_object();
        w.kv("starId", s.star_id);
        w.kv("energy", s.energy);
        w.kv("income", s.income);
        w.end_object();
    }
    w.end_array();

    // ── bases ──
    w.key("bases").begin_array();
    for (const auto& b : eco.bases) {
        w.begin_object();
        w.kv("baseId", b.base_id);
        w.kv("canProduce", b.can_produce);
        w.kv("enemiesSighted", b.enemies_sighted);
        w.kv("energy", b.energy);
        w.kv("spiritCost", b.cost);
        for (const auto& t : r.cost_trends) {
            if (t.base_id == b.base_id) w.kv("costTrend", trend_to_string(t.trend));
        }
        w.end_object();
    }
    w.end_array();

    // ── outposts ──
    w.key("outposts").begin_array();
    for (const auto& o : eco.outposts) {
        w.begin_object();
        w.kv("outpostId", o.outpost_id);
        w.key("tier");
        write_tier(w, o.tier);
        w.key("shot");
        write_shot(w, o.shot);
        w.end_object();
    }
    w.end_array();

    // ── pylons ──
    w.key("pylons").begin_array();
    for (const auto& p : eco.pylons) write_heal_plan(w, p);
    w.end_array();

    w.key("skipped").begin_array();
    for (const auto& id : eco.skipped) w.value(id);
    w.end_array();

    w.end_object();
}

static void write_forecast(JsonWriter& w, const Forecast& fc) {
    w.begin_object();

    auto write_energies = [&](const char* name, const auto& list) {
        w.key(name).begin_object();
        for (const auto& e : list) w.kv(e.id, e.energy);
        w.end_object();
    };
    write_energies("stars", fc.stars);
    write_energies("bases", fc.bases);
    write_energies("outposts", fc.outposts);
    write_energies("pylons", fc.pylons);

    w.key("spirits").begin_object();
    for (const auto& sp : fc.spirits) {
        w.key(sp.id).begin_object();
        w.kv("energy", sp.energy);
        w.kv("hp", sp.hp);
        w.end_object();
    }
    w.end_object();

    w.key("produced").begin_array();
    for (const auto& id : fc.produced) w.value(id);
    w.end_array();

    w.key("shots").begin_array();
    for (const auto& s : fc.shots) write_shot(w, s);
    w.end_array();

    w.end_object();
}

void write_tick_report(JsonWriter& w, const TickResult& r) {
    w.begin_object();
    w.kv("tick", r.tick);

    if (r.error.empty()) {
        w.key("error").null_value();
    } else {
        w.kv("error", r.error);
    }

    w.key("economy");
    write_economy(w, r);

    // ── commands ──
    w.key("commands").begin_array();
    for (const auto& cmd : r.commands) write_command(w, cmd);
    w.end_array();

    // ── diagnostics ──
    w.key("diagnostics").begin_array();
    for (const auto& d : r.diagnostics) {
        w.begin_object();
        w.kv("kind", error_kind_to_string(d.kind));
        w.kv("subject", d.subject_id);
        w.kv("action", d.action);
        w.kv("message", d.message);
        w.end_object();
    }
    w.end_array();

    if (r.has_forecast) {
        w.key("forecast");
        write_forecast(w, r.forecast);
    }

    w.end_object();
}

void write_report_json(const std::vector<TickResult>& results, std::ostream& out) {
    JsonWriter w(out);
    w.begin_object();
    w.key("ticks").begin_array();
    for (const auto& r : results) write_tick_report(w, r);
    w.end_array();
    w.end_object();
    out << '\n';
}

} // namespace spirits::game
