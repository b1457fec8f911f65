// tests/test_economy.cpp
//
// EconomyEngine rules and the local forecast:
//  - star income formula, rounding and capacity clamp
//  - base production gating
//  - outpost tier boundary at 499/500 and target choice
//  - pylon heal annulus and energy limit
//  - invariant failures recovered as diagnostics
//  - the three documented end-to-end ticks

#include <doctest/doctest.h>

#include "game/economy.hpp"
#include "game/errors.hpp"
#include "game/snapshot.hpp"
#include "test_support/fixtures.hpp"

#include <cmath>

using namespace spirits;
using namespace spirits::game;
using namespace spirits::test;

namespace {

int rounded(double x) { return static_cast<int>(std::floor(x + 0.5)); }

HostGlobals empty_globals(long tick) {
    HostGlobals g;
    g.tick = tick;
    g.player_id = "me";
    return g;
}

} // namespace

// ── Stars ──

TEST_CASE("star_income follows 2 + 2% for ordinary stars") {
    EconomyEngine eco;
    for (int energy : {0, 10, 24, 99, 100, 250, 600}) {
        Star s = make_star("star_zxq", energy);
        CAPTURE(energy);
        CHECK(eco.star_income(s) == rounded(2.0 + 0.02 * energy));
    }
}

TEST_CASE("star_income follows 3 + 3% for the high-yield star") {
    EconomyEngine eco;
    for (int energy : {0, 20, 100, 517, 900}) {
        Star s = make_star("star_nua", energy);
        CAPTURE(energy);
        CHECK(eco.star_income(s) == rounded(3.0 + 0.03 * energy));
    }
}

TEST_CASE("star_income rounds halves up") {
    EconomyEngine eco;
    CHECK(eco.star_income(make_star("star_zxq", 25)) == 3);     // 2.5
    CHECK(eco.star_income(make_star("star_zxq", 75)) == 4);     // 3.5
    CHECK(eco.star_income(make_star("star_nua", 50)) == 5);     // 4.5
}

TEST_CASE("star_income never pushes energy above capacity") {
    EconomyEngine eco;
    CHECK(eco.star_income(make_star("star_zxq", 995, 1000)) == 5);
    CHECK(eco.star_income(make_star("star_zxq", 998, 1000)) == 2);
    CHECK(eco.star_income(make_star("star_zxq", 1000, 1000)) == 0);

    Star s = make_star("star_nua", 990, 1000);
    eco.regenerate(s);
    CHECK(s.energy == 1000);
}

TEST_CASE("the high-yield star id comes from the rules") {
    RuleSet rules;
    rules.high_yield_star_id = "star_p89";
    EconomyEngine eco(rules);
    CHECK(eco.star_income(make_star("star_p89", 100)) == 6);
    CHECK(eco.star_income(make_star("star_nua", 100)) == 4);
}

// ── Bases ──

TEST_CASE("base_can_produce is false whenever an enemy is sighted") {
    EconomyEngine eco;
    Base base = make_base("base_me", "me", 1000, 100);
    Sight sight;
    CHECK(eco.base_can_produce(base, sight));

    sight.enemies = {"en_1"};
    CHECK_FALSE(eco.base_can_produce(base, sight));
}

TEST_CASE("base_can_produce needs energy for the current spirit cost") {
    EconomyEngine eco;
    Sight clear;
    CHECK(eco.base_can_produce(make_base("b", "me", 100, 100), clear));
    CHECK_FALSE(eco.base_can_produce(make_base("b", "me", 99, 100), clear));
}

// ── Outposts ──

TEST_CASE("outpost_damage_tier switches at 500 energy") {
    EconomyEngine eco;
    CHECK(eco.outpost_damage_tier(499) == OutpostTier{400.0, 1, 2});
    CHECK(eco.outpost_damage_tier(500) == OutpostTier{600.0, 4, 8});
    CHECK(eco.outpost_damage_tier(0) == OutpostTier{400.0, 1, 2});
    CHECK(eco.outpost_damage_tier(make_outpost("o", "me", Vec2(), 750)) == OutpostTier{600.0, 4, 8});
}

TEST_CASE("outpost shoots the nearest enemy in range, lowest id on ties") {
    HostGlobals g = empty_globals(1);
    g.outposts.push_back(make_outpost("outpost_mdo", "me", Vec2(0, 0), 100));
    g.spirits.push_back(make_spirit("en_b", "them", Shape::CIRCLE, Vec2(300, 0)));
    g.spirits.push_back(make_spirit("en_a", "them", Shape::CIRCLE, Vec2(0, 300)));
    g.spirits.push_back(make_spirit("en_far", "them", Shape::CIRCLE, Vec2(450, 0)));
    g.spirits.push_back(make_spirit("me_1", "me", Shape::CIRCLE, Vec2(10, 0)));
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    EconomyEngine eco;
    Shot shot = eco.plan_outpost_shot(*w.outpost("outpost_mdo"), w);
    REQUIRE(shot.fired());
    CHECK(shot.target_id == "en_a");
    CHECK(shot.damage == 2);
    CHECK(shot.cost == 1);
}

TEST_CASE("outpost holds fire when neutral, broke or nothing is in range") {
    EconomyEngine eco;

    HostGlobals g = empty_globals(1);
    g.outposts.push_back(make_outpost("neutral", "", Vec2(0, 0), 100));
    g.outposts.push_back(make_outpost("broke", "me", Vec2(0, 0), 0));
    g.outposts.push_back(make_outpost("lonely", "me", Vec2(5000, 5000), 100));
    g.spirits.push_back(make_spirit("en_1", "them", Shape::CIRCLE, Vec2(100, 0)));
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    CHECK_FALSE(eco.plan_outpost_shot(*w.outpost("neutral"), w).fired());
    CHECK_FALSE(eco.plan_outpost_shot(*w.outpost("broke"), w).fired());
    CHECK_FALSE(eco.plan_outpost_shot(*w.outpost("lonely"), w).fired());
}

TEST_CASE("high-tier outpost reaches 600") {
    HostGlobals g = empty_globals(1);
    g.outposts.push_back(make_outpost("o", "me", Vec2(0, 0), 500));
    g.spirits.push_back(make_spirit("en_1", "them", Shape::SQUARE, Vec2(550, 0)));
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    EconomyEngine eco;
    Shot shot = eco.plan_outpost_shot(*w.outpost("o"), w);
    REQUIRE(shot.fired());
    CHECK(shot.damage == 8);

    Outpost low = *w.outpost("o");
    low.energy = 499;
    CHECK_FALSE(eco.plan_outpost_shot(low, w).fired());
}

// ── Pylons ──

TEST_CASE("pylon heals only spirits inside the 200..400 annulus") {
    EconomyEngine eco;
    Pylon pylon = make_pylon("pylon_u3p", "me", Vec2(0, 0), 100);

    Spirit at150 = make_spirit("s150", "me", Shape::CIRCLE, Vec2(150, 0));
    Spirit at200 = make_spirit("s200", "me", Shape::CIRCLE, Vec2(0, 200));
    Spirit at400 = make_spirit("s400", "me", Shape::CIRCLE, Vec2(-400, 0));
    Spirit at401 = make_spirit("s401", "me", Shape::CIRCLE, Vec2(0, -401));

    HealPlan plan = eco.pylon_heal_targets(pylon, {&at401, &at400, &at200, &at150});
    REQUIRE(plan.targets.size() == 2);
    CHECK(plan.targets[0].spirit_id == "s200");
    CHECK(plan.targets[1].spirit_id == "s400");
    CHECK(plan.energy_spent() == 2);
}

TEST_CASE("pylon heal spending is capped by its energy") {
    EconomyEngine eco;
    Pylon pylon = make_pylon("p", "me", Vec2(0, 0), 2);

    Spirit a = make_spirit("a", "me", Shape::CIRCLE, Vec2(300, 0));
    Spirit b = make_spirit("b", "me", Shape::CIRCLE, Vec2(0, 300));
    Spirit c = make_spirit("c", "me", Shape::CIRCLE, Vec2(-300, 0));

    HealPlan plan = eco.pylon_heal_targets(pylon, {&c, &b, &a});
    REQUIRE(plan.targets.size() == 2);
    CHECK(plan.targets[0].spirit_id == "a");
    CHECK(plan.targets[1].spirit_id == "b");
    CHECK(plan.energy_spent() <= plan.energy_before);

    pylon.energy = 0;
    CHECK(eco.pylon_heal_targets(pylon, {&a}).targets.empty());
}

TEST_CASE("pylon skips spirits already at capacity") {
    EconomyEngine eco;
    Pylon pylon = make_pylon("p", "me", Vec2(0, 0), 10);
    std::vector<Spirit> spirits{
        make_spirit("full", "me", Shape::CIRCLE, Vec2(300, 0), 10, 10),
        make_spirit("low", "me", Shape::CIRCLE, Vec2(0, 300), 9, 10),
    };

    HealPlan plan = eco.pylon_heal_targets(pylon, {&spirits[0], &spirits[1]});
    REQUIRE(plan.targets.size() == 1);
    CHECK(plan.targets[0].spirit_id == "low");

    eco.apply_heal(pylon, plan, spirits);
    CHECK(spirits[0].energy == 10);
    CHECK(spirits[1].energy == 10);
    CHECK(pylon.energy == 9);
}

TEST_CASE("forecast does not heal a spirit the outposts killed") {
    HostGlobals g = empty_globals(1);
    g.pylons.push_back(make_pylon("pylon_u3p", "me", Vec2(0, 0), 50));
    g.outposts.push_back(make_outpost("outpost_mdo", "them", Vec2(300, 100), 100));
    g.spirits.push_back(make_spirit("me_1", "me", Shape::CIRCLE, Vec2(300, 0), 3, 10, 2));
    g.my_spirits = {"me_1"};
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    EconomyEngine eco;
    DiagnosticLog log;
    EconomyReport report = eco.derive(w, log);
    REQUIRE(report.pylons[0].targets.size() == 1);

    Forecast fc = eco.forecast(w, report);
    REQUIRE(fc.shots.size() == 1);
    CHECK(fc.spirits[0].hp == 0);
    CHECK(fc.spirits[0].energy == 3);
    CHECK(fc.pylons[0].energy == 50);
}

// ── Invariant ──

TEST_CASE("check_energy rejects values outside [0, capacity]") {
    CHECK_NOTHROW(EconomyEngine::check_energy("x", 0, 10));
    CHECK_NOTHROW(EconomyEngine::check_energy("x", 10, 10));
    CHECK_THROWS_AS(EconomyEngine::check_energy("x", 11, 10), EconomyInvariantError);
    CHECK_THROWS_AS(EconomyEngine::check_energy("x", -1, 10), EconomyInvariantError);
}

TEST_CASE("derive skips an entity that breaks the energy invariant") {
    HostGlobals g = two_player_globals(6);
    g.stars[0].energy = 1500;                    // star_zxq over capacity
    g.spirits[1].energy = -3;                    // me_square below zero
    g.pylons.push_back(make_pylon("pylon_u3p", "me", Vec2(100, 400), 50));
    WorldState w = SnapshotBuilder().snapshot(g, 6);

    EconomyEngine eco;
    DiagnosticLog log;
    EconomyReport report = eco.derive(w, log);

    CHECK(log.count(ErrorKind::ECONOMY_INVARIANT) == 2);
    REQUIRE(report.stars.size() == 1);
    CHECK(report.stars[0].star_id == "star_nua");
    CHECK(report.skipped.size() == 2);

    // me_square sits 300 from the pylon but is excluded by the failed check
    REQUIRE(report.pylons.size() == 1);
    for (const auto& t : report.pylons[0].targets) {
        CHECK(t.spirit_id != "me_square");
    }
}

// ── End-to-end ticks ──

TEST_CASE("pylon with 50 energy and spirits at 150, 250, 450 heals one") {
    HostGlobals g = empty_globals(1);
    g.pylons.push_back(make_pylon("pylon_u3p", "me", Vec2(0, 0), 50));
    g.spirits.push_back(make_spirit("me_1", "me", Shape::CIRCLE, Vec2(150, 0), 3));
    g.spirits.push_back(make_spirit("me_2", "me", Shape::CIRCLE, Vec2(250, 0), 3));
    g.spirits.push_back(make_spirit("me_3", "me", Shape::CIRCLE, Vec2(450, 0), 3));
    g.my_spirits = {"me_1", "me_2", "me_3"};
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    EconomyEngine eco;
    DiagnosticLog log;
    EconomyReport report = eco.derive(w, log);
    REQUIRE(report.pylons.size() == 1);
    REQUIRE(report.pylons[0].targets.size() == 1);
    CHECK(report.pylons[0].targets[0].spirit_id == "me_2");

    Forecast fc = eco.forecast(w, report);
    CHECK(fc.pylons[0].energy == 49);
    CHECK(fc.spirits[0].energy == 3);
    CHECK(fc.spirits[1].energy == 4);
    CHECK(fc.spirits[2].energy == 3);
    CHECK(log.empty());
}

TEST_CASE("base with cost 100, energy 150 and no enemies produces") {
    HostGlobals g = empty_globals(1);
    g.bases.push_back(make_base("base_zxq", "me", 150, 100));
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    EconomyEngine eco;
    DiagnosticLog log;
    EconomyReport report = eco.derive(w, log);
    REQUIRE(report.bases.size() == 1);
    CHECK(report.bases[0].can_produce);
    CHECK_FALSE(report.bases[0].enemies_sighted);

    Forecast fc = eco.forecast(w, report);
    REQUIRE(fc.produced.size() == 1);
    CHECK(fc.produced[0] == "base_zxq");
    CHECK(fc.bases[0].energy == 50);
}

TEST_CASE("base with an enemy in sight does not produce") {
    HostGlobals g = empty_globals(1);
    g.bases.push_back(make_base("base_zxq", "me", 150, 100));
    g.bases[0].sight.enemies = {"en_1"};
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    EconomyEngine eco;
    DiagnosticLog log;
    EconomyReport report = eco.derive(w, log);
    CHECK_FALSE(report.bases[0].can_produce);
    CHECK(report.bases[0].enemies_sighted);

    Forecast fc = eco.forecast(w, report);
    CHECK(fc.produced.empty());
    CHECK(fc.bases[0].energy == 150);
}

TEST_CASE("outpost at 500 energy with one enemy in range fires once for 8") {
    HostGlobals g = empty_globals(1);
    g.outposts.push_back(make_outpost("outpost_mdo", "me", Vec2(0, 0), 500));
    g.spirits.push_back(make_spirit("en_1", "them", Shape::TRIANGLE, Vec2(350, 0), 5, 10, 20));
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    EconomyEngine eco;
    DiagnosticLog log;
    EconomyReport report = eco.derive(w, log);
    REQUIRE(report.outposts.size() == 1);
    CHECK(report.outposts[0].tier == OutpostTier{600.0, 4, 8});

    Forecast fc = eco.forecast(w, report);
    REQUIRE(fc.shots.size() == 1);
    CHECK(fc.shots[0].target_id == "en_1");
    CHECK(fc.shots[0].damage == 8);
    CHECK(fc.outposts[0].energy == 496);
    CHECK(fc.spirits[0].hp == 12);
}

TEST_CASE("forecast regenerates stars") {
    HostGlobals g = two_player_globals(1);
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    EconomyEngine eco;
    DiagnosticLog log;
    Forecast fc = eco.forecast(w, eco.derive(w, log));
    CHECK(fc.stars[0].energy == 104);        // star_zxq: 2 + 2
    CHECK(fc.stars[1].energy == 106);        // star_nua: 3 + 3
}

// ── Cost trend ──

TEST_CASE("record_cost_trends compares against the previous tick") {
    EconomyEngine eco;
    CrossTickMemory memory;

    HostGlobals g = empty_globals(1);
    g.bases.push_back(make_base("base_me", "me", 0, 100));
    {
        WorldState w = SnapshotBuilder().snapshot(g, 1);
        auto trends = eco.record_cost_trends(w, memory);
        REQUIRE(trends.size() == 1);
        CHECK(trends[0].trend == Trend::FLAT);
        CHECK(trends[0].previous == 100);
    }

    g.tick = 2;
    g.bases[0].current_spirit_cost = 120;
    {
        WorldState w = SnapshotBuilder().snapshot(g, 2);
        auto trends = eco.record_cost_trends(w, memory);
        CHECK(trends[0].trend == Trend::RISING);
        CHECK(trends[0].previous == 100);
        CHECK(trends[0].current == 120);
    }

    g.tick = 3;
    g.bases[0].current_spirit_cost = 90;
    {
        WorldState w = SnapshotBuilder().snapshot(g, 3);
        CHECK(eco.record_cost_trends(w, memory)[0].trend == Trend::FALLING);
    }
    CHECK(memory.get_number(EconomyEngine::cost_key("base_me")) == doctest::Approx(90));
}
