/**
 * WorldState — immutable per-tick view of every entity the caller can see.
 *
 * Holds the entity records in contiguous vectors with O(1) id lookup, plus
 * each observer's sight resolved into entity pointers. Built once per tick by
 * SnapshotBuilder and passed by reference to the economy engine, the action
 * gateway and decision logic. Move-only: resolved pointers refer into the
 * owned vectors, which keep their storage across a move.
 *
 * A world built against a TickClock keeps a pointer to it, and every entity
 * read throws StaleSnapshotError once the clock has moved past the world's
 * tick. The clock must outlive the world.
 */

#ifndef SPIRITS_GAME_WORLD_STATE_HPP
#define SPIRITS_GAME_WORLD_STATE_HPP

#include "game/entity.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace spirits::game {

/**
 * The host's tick counter as last observed. Owned by whoever drives ticks;
 * snapshots are checked against it before every read that matters.
 */
class TickClock {
public:
    explicit TickClock(long tick = 0) : tick_(tick) {}

    long current() const { return tick_; }

    /** @throws StaleSnapshotError if the host counter went backwards */
    void advance_to(long tick);

private:
    long tick_;
};

/** Sight with ids replaced by entity pointers; unknown ids are skipped. */
struct ResolvedSight {
    std::vector<const Spirit*> friends;
    std::vector<const Spirit*> enemies;
    std::vector<const Structure*> structures;
};

class WorldState {
public:
    WorldState() = default;
    WorldState(const WorldState&) = delete;
    WorldState& operator=(const WorldState&) = delete;
    WorldState(WorldState&&) = default;
    WorldState& operator=(WorldState&&) = default;

    long tick() const { return tick_; }
    const std::string& player_id() const { return player_id_; }

    /** @throws StaleSnapshotError when this view is not from clock.current() */
    void ensure_current(const TickClock& clock) const;

    /** Same check against the bound clock; a no-op for an unbound world. */
    void ensure_current() const;

    bool is_current() const { return !clock_ || clock_->current() == tick_; }
    bool bound() const { return clock_ != nullptr; }

    // ── Lookup (nullptr when absent) ──
    const Spirit* spirit(const std::string& id) const;
    const Structure* structure(const std::string& id) const;
    const Base* base(const std::string& id) const;
    const Star* star(const std::string& id) const;
    const Outpost* outpost(const std::string& id) const;
    const Pylon* pylon(const std::string& id) const;
    bool contains(const std::string& id) const;

    const std::vector<Spirit>& spirits() const { ensure_current(); return spirits_; }
    const std::vector<Base>& bases() const { ensure_current(); return bases_; }
    const std::vector<Star>& stars() const { ensure_current(); return stars_; }
    const std::vector<Outpost>& outposts() const { ensure_current(); return outposts_; }
    const std::vector<Pylon>& pylons() const { ensure_current(); return pylons_; }

    const std::vector<std::string>& my_spirits() const { ensure_current(); return my_spirits_; }
    bool is_mine(const std::string& spirit_id) const;

    /** Live spirits owned by player_id, ascending id. */
    std::vector<const Spirit*> friendly_spirits_of(const std::string& player_id) const;

    /** Live spirits not owned by player_id, ascending id. */
    std::vector<const Spirit*> enemy_spirits_of(const std::string& player_id) const;

    /** Resolved sight of a spirit or sighted structure; nullptr for stars / unknown ids. */
    const ResolvedSight* sight_of(const std::string& id) const;

    /** Raw id lists as the host reported them, for message passing. */
    const Sight* raw_sight_of(const std::string& id) const;

    /** Compares the entity data; resolved pointers are derived and ignored. */
    bool operator==(const WorldState& other) const;
    bool operator!=(const WorldState& other) const { return !(*this == other); }

private:
    friend class SnapshotBuilder;

    struct StructureRef {
        StructureType type;
        size_t index;
    };

    long tick_ = 0;
    std::string player_id_;
    const TickClock* clock_ = nullptr;  // not owned

    std::vector<Spirit> spirits_;
    std::vector<Base> bases_;
    std::vector<Star> stars_;
    std::vector<Outpost> outposts_;
    std::vector<Pylon> pylons_;
    std::vector<std::string> my_spirits_;

    std::unordered_map<std::string, size_t> spirit_index_;
    std::unordered_map<std::string, StructureRef> structure_index_;
    std::unordered_set<std::string> mine_;
    std::unordered_map<std::string, ResolvedSight> resolved_;
};

} // namespace spirits::game

#endif // SPIRITS_GAME_WORLD_STATE_HPP
