/**
 * SnapshotBuilder — turns one tick of host globals into a WorldState.
 *
 * Copies every record, builds the id indexes and resolves each sight list
 * into entity pointers. Nothing is cached between calls: positions and
 * energies change every tick, so the world is rebuilt from scratch each time.
 */

#ifndef SPIRITS_GAME_SNAPSHOT_HPP
#define SPIRITS_GAME_SNAPSHOT_HPP

#include "game/host_state.hpp"
#include "game/world_state.hpp"

namespace spirits::game {

class SnapshotBuilder {
public:
    explicit SnapshotBuilder(bool verbose = false) : verbose_(verbose) {}

    /**
     * Build the view of tick `tick` from host globals.
     * @throws StaleSnapshotError when the globals belong to another tick
     * @throws std::runtime_error on duplicate entity ids
     */
    WorldState snapshot(const HostGlobals& host, long tick) const;

    /**
     * Build the view for the clock's current tick and bind it to the clock.
     * Reads through the returned world throw once the clock moves on.
     */
    WorldState snapshot(const HostGlobals& host, const TickClock& clock) const;

private:
    bool verbose_;

    static void index_structure(WorldState& world, const std::string& id,
                                StructureType type, size_t index);
    static ResolvedSight resolve(const WorldState& world, const Sight& sight);
};

} // namespace spirits::game

#endif // SPIRITS_GAME_SNAPSHOT_HPP
