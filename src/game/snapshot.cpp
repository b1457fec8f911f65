#include "game/snapshot.hpp"
#include "game/errors.hpp"
#include <iostream>
#include <stdexcept>

namespace spirits::game {

void SnapshotBuilder::index_structure(WorldState& world, const std::string& id,
                                      StructureType type, size_t index) {
    if (world.spirit_index_.count(id) ||
        !world.structure_index_.emplace(id, WorldState::StructureRef{type, index}).second) {
        throw std::runtime_error("snapshot: duplicate entity id " + id);
    }
}

ResolvedSight SnapshotBuilder::resolve(const WorldState& world, const Sight& sight) {
    ResolvedSight out;
    for (const auto& id : sight.friends) {
        if (const Spirit* sp = world.spirit(id)) out.friends.push_back(sp);
    }
    for (const auto& id : sight.enemies) {
        if (const Spirit* sp = world.spirit(id)) out.enemies.push_back(sp);
    }
    for (const auto& id : sight.structures) {
        if (const Structure* st = world.structure(id)) out.structures.push_back(st);
    }
    return out;
}

WorldState SnapshotBuilder::snapshot(const HostGlobals& host, long tick) const {
    if (host.tick != tick) {
        throw StaleSnapshotError(host.tick, tick);
    }

    WorldState world;
    world.tick_ = host.tick;
    world.player_id_ = host.player_id;

    // ── Copy records ──
    world.spirits_  = host.spirits;
    world.bases_    = host.bases;
    world.stars_    = host.stars;
    world.outposts_ = host.outposts;
    world.pylons_   = host.pylons;

    // ── Index ──
    for (size_t i = 0; i < world.spirits_.size(); ++i) {
        if (!world.spirit_index_.emplace(world.spirits_[i].id, i).second) {
            throw std::runtime_error("snapshot: duplicate spirit id " + world.spirits_[i].id);
        }
    }
    for (size_t i = 0; i < world.bases_.size(); ++i)
        index_structure(world, world.bases_[i].id, StructureType::BASE, i);
    for (size_t i = 0; i < world.stars_.size(); ++i)
        index_structure(world, world.stars_[i].id, StructureType::STAR, i);
    for (size_t i = 0; i < world.outposts_.size(); ++i)
        index_structure(world, world.outposts_[i].id, StructureType::OUTPOST, i);
    for (size_t i = 0; i < world.pylons_.size(); ++i)
        index_structure(world, world.pylons_[i].id, StructureType::PYLON, i);

    // ── Roster (ids the registry does not know are dropped) ──
    for (const auto& id : host.my_spirits) {
        if (!world.spirit_index_.count(id)) {
            if (verbose_) {
                std::cerr << "[SNAPSHOT] tick " << tick << ": roster id " << id
                          << " missing from spirit registry, dropped\n";
            }
            continue;
        }
        if (world.mine_.insert(id).second) {
            world.my_spirits_.push_back(id);
        }
    }

    // ── Resolve sight ──
    for (const auto& sp : world.spirits_) {
        world.resolved_[sp.id] = resolve(world, sp.sight);
    }
    auto resolve_structures = [&](const auto& list) {
        for (const auto& st : list) {
            if (st.has_sight) world.resolved_[st.id] = resolve(world, st.sight);
        }
    };
    resolve_structures(world.bases_);
    resolve_structures(world.outposts_);
    resolve_structures(world.pylons_);

    if (verbose_) {
        std::cerr << "[SNAPSHOT] tick " << tick << ": " << world.spirits_.size()
                  << " spirits (" << world.my_spirits_.size() << " own), "
                  << world.bases_.size() << " bases, " << world.stars_.size()
                  << " stars, " << world.outposts_.size() << " outposts, "
                  << world.pylons_.size() << " pylons\n";
    }

    return world;
}

WorldState SnapshotBuilder::snapshot(const HostGlobals& host, const TickClock& clock) const {
    WorldState world = snapshot(host, clock.current());
    world.clock_ = &clock;
    return world;
}

} // namespace spirits::game
