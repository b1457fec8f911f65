// tests/test_support/fixtures.hpp
//
// Entity builders and a ready-wired gateway for the core tests.
// Player "me" owns me_circle / me_square / me_triangle; player "them" owns en_1.

#ifndef SPIRITS_TEST_FIXTURES_HPP
#define SPIRITS_TEST_FIXTURES_HPP

#include "game/action_gateway.hpp"
#include "game/diagnostics.hpp"
#include "game/host_binding.hpp"
#include "game/host_state.hpp"
#include "game/memory.hpp"
#include "game/snapshot.hpp"
#include "game/world_state.hpp"

#include <string>

namespace spirits::test {

inline game::Spirit make_spirit(const std::string& id, const std::string& player,
                                game::Shape shape, Vec2 pos = Vec2(),
                                int energy = 0, int capacity = 10, int hp = 1) {
    game::Spirit s;
    s.id = id;
    s.player_id = player;
    s.shape = shape;
    s.position = pos;
    s.energy = energy;
    s.energy_capacity = capacity;
    s.hp = hp;
    return s;
}

inline game::Star make_star(const std::string& id, int energy, int capacity = 1000) {
    game::Star s;
    s.id = id;
    s.energy = energy;
    s.energy_capacity = capacity;
    return s;
}

inline game::Base make_base(const std::string& id, const std::string& control,
                            int energy, int cost, int capacity = 1000) {
    game::Base b;
    b.id = id;
    b.control = control;
    b.energy = energy;
    b.current_spirit_cost = cost;
    b.energy_capacity = capacity;
    return b;
}

inline game::Outpost make_outpost(const std::string& id, const std::string& control,
                                  Vec2 pos, int energy, int capacity = 1000) {
    game::Outpost o;
    o.id = id;
    o.control = control;
    o.position = pos;
    o.energy = energy;
    o.energy_capacity = capacity;
    return o;
}

inline game::Pylon make_pylon(const std::string& id, const std::string& control,
                              Vec2 pos, int energy, int capacity = 1000) {
    game::Pylon p;
    p.id = id;
    p.control = control;
    p.position = pos;
    p.energy = energy;
    p.energy_capacity = capacity;
    return p;
}

/** Two players, one spirit of each shape for "me", one enemy, two bases and stars. */
inline game::HostGlobals two_player_globals(long tick) {
    game::HostGlobals g;
    g.tick = tick;
    g.player_id = "me";

    g.spirits.push_back(make_spirit("me_circle",   "me",   game::Shape::CIRCLE,   Vec2(100, 100), 5));
    g.spirits.push_back(make_spirit("me_square",   "me",   game::Shape::SQUARE,   Vec2(120, 100), 5));
    g.spirits.push_back(make_spirit("me_triangle", "me",   game::Shape::TRIANGLE, Vec2(140, 100), 5));
    g.spirits.push_back(make_spirit("en_1",        "them", game::Shape::CIRCLE,   Vec2(900, 900), 5));
    g.my_spirits = {"me_circle", "me_square", "me_triangle"};

    g.bases.push_back(make_base("base_me", "me", 150, 100));
    g.bases.push_back(make_base("base_them", "them", 50, 100));
    g.stars.push_back(make_star("star_zxq", 100));
    g.stars.push_back(make_star("star_nua", 100));
    return g;
}

/** Clock, log, memory, command queue and gateway bound to one snapshot. */
struct GatewayRig {
    game::TickClock clock;
    game::DiagnosticLog log;
    game::CrossTickMemory memory;
    game::CommandQueue queue;
    game::ActionGateway gateway;
    game::WorldState world;

    explicit GatewayRig(const game::HostGlobals& host)
        : clock(host.tick), gateway(queue, clock, log, &memory) {
        world = game::SnapshotBuilder().snapshot(host, clock);
        gateway.begin_tick(world);
    }

    /** Host moved on: advance the clock and rebind a fresh snapshot. */
    void next_tick(const game::HostGlobals& host) {
        clock.advance_to(host.tick);
        world = game::SnapshotBuilder().snapshot(host, clock);
        gateway.begin_tick(world);
    }
};

} // namespace spirits::test

#endif // SPIRITS_TEST_FIXTURES_HPP
