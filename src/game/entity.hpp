/**
 * Entity records — local mirror of what the host exposes each tick.
 *
 * Plain data, copied out of the host payload by HostStateParser. Spirits are
 * the mobile units; Star/Base/Outpost/Pylon share the Structure fields and
 * add their own. Behaviour lives in the capability views and the economy
 * engine, not here.
 */

#ifndef SPIRITS_GAME_ENTITY_HPP
#define SPIRITS_GAME_ENTITY_HPP

#include "core/vec2.hpp"
#include <limits>
#include <string>
#include <vector>

namespace spirits::game {

/** Energy or capacity the host sent that an int cannot hold. Fails every energy check. */
constexpr int ENERGY_UNREADABLE = std::numeric_limits<int>::min();

// ── Type enums ──

enum class Shape {
    CIRCLE,
    SQUARE,
    TRIANGLE
};

enum class StructureType {
    BASE,
    OUTPOST,
    PYLON,
    STAR
};

inline const char* shape_to_string(Shape shape) {
    switch (shape) {
        case Shape::CIRCLE:   return "circles";
        case Shape::SQUARE:   return "squares";
        case Shape::TRIANGLE: return "triangles";
        default:              return "";
    }
}

/** Accepts the host spelling ("circles") and the singular form. */
inline bool string_to_shape(const std::string& s, Shape& out) {
    if (s == "circles" || s == "circle")       { out = Shape::CIRCLE;   return true; }
    if (s == "squares" || s == "square")       { out = Shape::SQUARE;   return true; }
    if (s == "triangles" || s == "triangle")   { out = Shape::TRIANGLE; return true; }
    return false;
}

inline const char* structure_type_to_string(StructureType type) {
    switch (type) {
        case StructureType::BASE:    return "base";
        case StructureType::OUTPOST: return "outpost";
        case StructureType::PYLON:   return "pylon";
        case StructureType::STAR:    return "star";
        default:                     return "";
    }
}

inline bool string_to_structure_type(const std::string& s, StructureType& out) {
    if (s == "base")    { out = StructureType::BASE;    return true; }
    if (s == "outpost") { out = StructureType::OUTPOST; return true; }
    if (s == "pylon")   { out = StructureType::PYLON;   return true; }
    if (s == "star")    { out = StructureType::STAR;    return true; }
    return false;
}

// ── Sub-structs ──

/** Ids visible to an entity this tick, as the host reports them. */
struct Sight {
    std::vector<std::string> friends;
    std::vector<std::string> enemies;
    std::vector<std::string> structures;

    bool empty() const {
        return friends.empty() && enemies.empty() && structures.empty();
    }

    bool operator==(const Sight& o) const {
        return friends == o.friends && enemies == o.enemies && structures == o.structures;
    }
    bool operator!=(const Sight& o) const { return !(*this == o); }
};

// ── Entities ──

struct Spirit {
    std::string id;
    Vec2 position;
    int size = 1;
    int energy_capacity = 10;
    int energy = 0;
    int hp = 1;
    std::string mark;
    std::string last_energized;     // id of the last energize target, "" if none
    Shape shape = Shape::CIRCLE;
    std::string player_id;
    Sight sight;

    bool alive() const { return hp > 0; }

    bool operator==(const Spirit& o) const {
        return id == o.id && position == o.position && size == o.size &&
               energy_capacity == o.energy_capacity && energy == o.energy &&
               hp == o.hp && mark == o.mark && last_energized == o.last_energized &&
               shape == o.shape && player_id == o.player_id && sight == o.sight;
    }
    bool operator!=(const Spirit& o) const { return !(*this == o); }
};

struct Structure {
    std::string id;
    StructureType structure_type = StructureType::BASE;
    Vec2 position;
    int energy_capacity = 0;
    int energy = 0;
    std::string control;            // controlling player id, "" when neutral
    bool has_sight = true;          // stars have none
    Sight sight;

    bool controlled() const { return !control.empty(); }

    bool operator==(const Structure& o) const {
        return id == o.id && structure_type == o.structure_type &&
               position == o.position && energy_capacity == o.energy_capacity &&
               energy == o.energy && control == o.control &&
               has_sight == o.has_sight && sight == o.sight;
    }
};

struct Star : Structure {
    double regeneration = 0.0;      // host-reported rate, informational

    Star() {
        structure_type = StructureType::STAR;
        has_sight = false;
    }

    bool operator==(const Star& o) const {
        return Structure::operator==(o) && regeneration == o.regeneration;
    }
};

struct Base : Structure {
    int current_spirit_cost = 0;

    Base() { structure_type = StructureType::BASE; }

    bool operator==(const Base& o) const {
        return Structure::operator==(o) && current_spirit_cost == o.current_spirit_cost;
    }
};

struct Outpost : Structure {
    double range = 400.0;

    Outpost() { structure_type = StructureType::OUTPOST; }

    bool operator==(const Outpost& o) const {
        return Structure::operator==(o) && range == o.range;
    }
};

struct Pylon : Structure {
    Pylon() { structure_type = StructureType::PYLON; }

    bool operator==(const Pylon& o) const { return Structure::operator==(o); }
};

} // namespace spirits::game

#endif // SPIRITS_GAME_ENTITY_HPP
