#include "game/world_state.hpp"
#include "game/errors.hpp"
#include <algorithm>

namespace spirits::game {

void TickClock::advance_to(long tick) {
    if (tick < tick_) {
        throw StaleSnapshotError(tick, tick_);
    }
    tick_ = tick;
}

void WorldState::ensure_current(const TickClock& clock) const {
    if (tick_ != clock.current()) {
        throw StaleSnapshotError(tick_, clock.current());
    }
}

void WorldState::ensure_current() const {
    if (clock_) ensure_current(*clock_);
}

const Spirit* WorldState::spirit(const std::string& id) const {
    ensure_current();
    auto it = spirit_index_.find(id);
    if (it == spirit_index_.end()) return nullptr;
    return &spirits_[it->second];
}

const Structure* WorldState::structure(const std::string& id) const {
    ensure_current();
    auto it = structure_index_.find(id);
    if (it == structure_index_.end()) return nullptr;

    const StructureRef& ref = it->second;
    switch (ref.type) {
        case StructureType::BASE:    return &bases_[ref.index];
        case StructureType::STAR:    return &stars_[ref.index];
        case StructureType::OUTPOST: return &outposts_[ref.index];
        case StructureType::PYLON:   return &pylons_[ref.index];
    }
    return nullptr;
}

const Base* WorldState::base(const std::string& id) const {
    ensure_current();
    auto it = structure_index_.find(id);
    if (it == structure_index_.end() || it->second.type != StructureType::BASE) return nullptr;
    return &bases_[it->second.index];
}

const Star* WorldState::star(const std::string& id) const {
    ensure_current();
    auto it = structure_index_.find(id);
    if (it == structure_index_.end() || it->second.type != StructureType::STAR) return nullptr;
    return &stars_[it->second.index];
}

const Outpost* WorldState::outpost(const std::string& id) const {
    ensure_current();
    auto it = structure_index_.find(id);
    if (it == structure_index_.end() || it->second.type != StructureType::OUTPOST) return nullptr;
    return &outposts_[it->second.index];
}

const Pylon* WorldState::pylon(const std::string& id) const {
    ensure_current();
    auto it = structure_index_.find(id);
    if (it == structure_index_.end() || it->second.type != StructureType::PYLON) return nullptr;
    return &pylons_[it->second.index];
}

bool WorldState::contains(const std::string& id) const {
    ensure_current();
    return spirit_index_.count(id) > 0 || structure_index_.count(id) > 0;
}

bool WorldState::is_mine(const std::string& spirit_id) const {
    ensure_current();
    return mine_.count(spirit_id) > 0;
}

static void sort_by_id(std::vector<const Spirit*>& list) {
    std::sort(list.begin(), list.end(),
              [](const Spirit* a, const Spirit* b) { return a->id < b->id; });
}

std::vector<const Spirit*> WorldState::friendly_spirits_of(const std::string& player_id) const {
    ensure_current();
    std::vector<const Spirit*> out;
    for (const auto& sp : spirits_) {
        if (sp.alive() && sp.player_id == player_id) out.push_back(&sp);
    }
    sort_by_id(out);
    return out;
}

std::vector<const Spirit*> WorldState::enemy_spirits_of(const std::string& player_id) const {
    ensure_current();
    std::vector<const Spirit*> out;
    for (const auto& sp : spirits_) {
        if (sp.alive() && sp.player_id != player_id) out.push_back(&sp);
    }
    sort_by_id(out);
    return out;
}

const ResolvedSight* WorldState::sight_of(const std::string& id) const {
    ensure_current();
    auto it = resolved_.find(id);
    if (it == resolved_.end()) return nullptr;
    return &it->second;
}

const Sight* WorldState::raw_sight_of(const std::string& id) const {
    ensure_current();
    if (const Spirit* sp = spirit(id)) return &sp->sight;
    const Structure* st = structure(id);
    if (!st || !st->has_sight) return nullptr;
    return &st->sight;
}

bool WorldState::operator==(const WorldState& other) const {
    return tick_ == other.tick_ &&
           player_id_ == other.player_id_ &&
           spirits_ == other.spirits_ &&
           bases_ == other.bases_ &&
           stars_ == other.stars_ &&
           outposts_ == other.outposts_ &&
           pylons_ == other.pylons_ &&
           my_spirits_ == other.my_spirits_;
}

} // namespace spirits::game
