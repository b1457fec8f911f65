// tests/test_snapshot.cpp
//
// SnapshotBuilder / WorldState:
//  - lookups by id, typed structure lookups, roster membership
//  - sight resolved to entities while raw ids are kept
//  - rebuilding from unchanged globals gives an equal world
//  - stale views are refused, including reads through a clock-bound world

#include <doctest/doctest.h>

#include "game/diagnostics.hpp"
#include "game/economy.hpp"
#include "game/errors.hpp"
#include "game/snapshot.hpp"
#include "test_support/fixtures.hpp"

#include <stdexcept>
#include <utility>

using namespace spirits;
using namespace spirits::game;
using namespace spirits::test;

TEST_CASE("Snapshot indexes spirits and structures by id") {
    HostGlobals g = two_player_globals(10);
    WorldState w = SnapshotBuilder().snapshot(g, 10);

    CHECK(w.tick() == 10);
    CHECK(w.player_id() == "me");

    REQUIRE(w.spirit("me_square") != nullptr);
    CHECK(w.spirit("me_square")->shape == Shape::SQUARE);
    CHECK(w.spirit("nope") == nullptr);

    REQUIRE(w.structure("star_nua") != nullptr);
    CHECK(w.structure("star_nua")->structure_type == StructureType::STAR);
    CHECK(w.star("star_nua") != nullptr);
    CHECK(w.base("star_nua") == nullptr);
    CHECK(w.base("base_me")->current_spirit_cost == 100);

    CHECK(w.contains("en_1"));
    CHECK(w.contains("base_them"));
    CHECK_FALSE(w.contains("outpost_x"));
}

TEST_CASE("Snapshot roster membership and friend/enemy lists") {
    HostGlobals g = two_player_globals(1);
    g.spirits.push_back(make_spirit("me_dead", "me", Shape::CIRCLE, Vec2(), 0, 10, 0));
    g.my_spirits.push_back("me_dead");
    g.my_spirits.push_back("ghost");     // not in the registry
    WorldState w = SnapshotBuilder().snapshot(g, 1);

    CHECK(w.is_mine("me_circle"));
    CHECK_FALSE(w.is_mine("en_1"));
    CHECK_FALSE(w.is_mine("ghost"));
    CHECK(w.my_spirits().size() == 4);

    auto mine = w.friendly_spirits_of("me");
    REQUIRE(mine.size() == 3);         // dead spirit excluded
    CHECK(mine[0]->id == "me_circle");
    CHECK(mine[1]->id == "me_square");
    CHECK(mine[2]->id == "me_triangle");

    auto enemies = w.enemy_spirits_of("me");
    REQUIRE(enemies.size() == 1);
    CHECK(enemies[0]->id == "en_1");
}

TEST_CASE("Snapshot resolves sight and keeps the raw ids") {
    HostGlobals g = two_player_globals(3);
    g.spirits[0].sight.friends = {"me_square", "me_gone"};
    g.spirits[0].sight.enemies = {"en_1"};
    g.spirits[0].sight.structures = {"star_zxq", "base_me"};
    g.bases[0].sight.enemies = {"en_1"};
    WorldState w = SnapshotBuilder().snapshot(g, 3);

    const ResolvedSight* s = w.sight_of("me_circle");
    REQUIRE(s != nullptr);
    REQUIRE(s->friends.size() == 1);            // unknown id not resolved
    CHECK(s->friends[0] == w.spirit("me_square"));
    REQUIRE(s->enemies.size() == 1);
    CHECK(s->enemies[0]->player_id == "them");
    REQUIRE(s->structures.size() == 2);
    CHECK(s->structures[1]->id == "base_me");

    const Sight* raw = w.raw_sight_of("me_circle");
    REQUIRE(raw != nullptr);
    CHECK(raw->friends.size() == 2);
    CHECK(raw->friends[1] == "me_gone");

    REQUIRE(w.sight_of("base_me") != nullptr);
    CHECK(w.sight_of("base_me")->enemies.size() == 1);

    CHECK(w.sight_of("star_zxq") == nullptr);
    CHECK(w.raw_sight_of("star_zxq") == nullptr);
}

TEST_CASE("Snapshot rebuilt from unchanged globals is equal") {
    HostGlobals g = two_player_globals(5);
    SnapshotBuilder builder;
    WorldState a = builder.snapshot(g, 5);
    WorldState b = builder.snapshot(g, 5);
    CHECK(a == b);

    g.spirits[0].energy += 1;
    WorldState c = builder.snapshot(g, 5);
    CHECK(a != c);
}

TEST_CASE("Snapshot resolved pointers survive a move") {
    HostGlobals g = two_player_globals(2);
    g.spirits[0].sight.friends = {"me_square"};
    WorldState a = SnapshotBuilder().snapshot(g, 2);
    WorldState moved = std::move(a);

    const ResolvedSight* s = moved.sight_of("me_circle");
    REQUIRE(s != nullptr);
    REQUIRE(s->friends.size() == 1);
    CHECK(s->friends[0] == moved.spirit("me_square"));
}

TEST_CASE("Snapshot refuses globals from another tick") {
    HostGlobals g = two_player_globals(8);
    CHECK_THROWS_AS(SnapshotBuilder().snapshot(g, 9), StaleSnapshotError);
}

TEST_CASE("Snapshot refuses duplicate ids") {
    HostGlobals g = two_player_globals(1);
    g.pylons.push_back(make_pylon("star_zxq", "me", Vec2(), 10));
    CHECK_THROWS_AS(SnapshotBuilder().snapshot(g, 1), std::runtime_error);

    HostGlobals h = two_player_globals(1);
    h.spirits.push_back(make_spirit("base_me", "me", Shape::CIRCLE));
    CHECK_THROWS_AS(SnapshotBuilder().snapshot(h, 1), std::runtime_error);
}

TEST_CASE("WorldState from an earlier tick is stale against the clock") {
    HostGlobals g = two_player_globals(4);
    TickClock clock(4);
    WorldState w = SnapshotBuilder().snapshot(g, clock);
    CHECK_NOTHROW(w.ensure_current(clock));

    clock.advance_to(5);
    try {
        w.ensure_current(clock);
        FAIL("expected StaleSnapshotError");
    } catch (const StaleSnapshotError& e) {
        CHECK(e.snapshot_tick() == 4);
        CHECK(e.current_tick() == 5);
        CHECK(e.kind() == ErrorKind::STALE_SNAPSHOT);
    }
}

TEST_CASE("WorldState bound to a clock refuses reads once the clock moves on") {
    HostGlobals g = two_player_globals(5);
    TickClock clock(5);
    WorldState w = SnapshotBuilder().snapshot(g, clock);
    REQUIRE(w.bound());
    REQUIRE(w.star("star_zxq") != nullptr);

    clock.advance_to(6);
    CHECK_FALSE(w.is_current());
    CHECK(w.tick() == 5);
    CHECK_THROWS_AS(w.star("star_zxq"), StaleSnapshotError);
    CHECK_THROWS_AS(w.spirit("me_circle"), StaleSnapshotError);
    CHECK_THROWS_AS(w.stars(), StaleSnapshotError);
    CHECK_THROWS_AS(w.friendly_spirits_of("me"), StaleSnapshotError);
    CHECK_THROWS_AS(w.ensure_current(), StaleSnapshotError);

    EconomyEngine eco;
    DiagnosticLog log;
    EconomyReport report = eco.derive(w, log);
    CHECK(report.stars.empty());
    CHECK(report.bases.empty());
    REQUIRE(log.size() == 1);
    CHECK(log.entries()[0].kind == ErrorKind::STALE_SNAPSHOT);
    CHECK(log.entries()[0].action == "derive");
    CHECK_THROWS_AS(eco.forecast(w, report), StaleSnapshotError);
}

TEST_CASE("WorldState built for a bare tick number is never stale") {
    HostGlobals g = two_player_globals(5);
    WorldState w = SnapshotBuilder().snapshot(g, 5);
    CHECK_FALSE(w.bound());
    CHECK(w.is_current());
    CHECK_NOTHROW(w.ensure_current());
    CHECK(w.star("star_zxq") != nullptr);
}

TEST_CASE("TickClock never goes backwards") {
    TickClock clock(10);
    CHECK_NOTHROW(clock.advance_to(10));
    CHECK_NOTHROW(clock.advance_to(11));
    CHECK_THROWS_AS(clock.advance_to(9), StaleSnapshotError);
    CHECK(clock.current() == 11);
}
