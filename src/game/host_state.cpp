#include "game/host_state.hpp"
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace spirits::game {

static std::vector<std::string> parse_id_list(const JsonValue& arr) {
    std::vector<std::string> ids;
    if (!arr.is_array()) return ids;
    ids.reserve(arr.size());
    for (const auto& el : arr.elements()) {
        if (el.is_string()) ids.push_back(el.as_string());
    }
    return ids;
}

// Out-of-range readings are kept as ENERGY_UNREADABLE so the invariant check sees them
static int read_energy(const JsonValue& v, int def) {
    if (!v.is_number()) return def;
    return v.fits_int() ? v.as_int() : ENERGY_UNREADABLE;
}

static std::string require_id(const JsonValue& def, const char* what) {
    std::string id = def["id"].get_string("");
    if (id.empty()) {
        throw std::runtime_error(std::string("host state: ") + what + " without an id");
    }
    return id;
}

Vec2 HostStateParser::parse_position(const JsonValue& def, const std::string& owner_id) {
    // Hosts send [x, y]; an {x, y} object is accepted as well
    if (def.is_array() && def.size() == 2 && def[0].is_number() && def[1].is_number()) {
        return Vec2(def[0].as_number(), def[1].as_number());
    }
    if (def.is_object() && def["x"].is_number() && def["y"].is_number()) {
        return Vec2(def["x"].as_number(), def["y"].as_number());
    }
    throw std::runtime_error("host state: " + owner_id + " has no valid position");
}

Sight HostStateParser::parse_sight(const JsonValue& def) {
    Sight s;
    if (!def.is_object()) return s;
    s.friends    = parse_id_list(def["friends"]);
    s.enemies    = parse_id_list(def["enemies"]);
    s.structures = parse_id_list(def["structures"]);
    return s;
}

Spirit HostStateParser::parse_spirit(const JsonValue& def, const RuleSet& rules) {
    Spirit sp;
    sp.id = require_id(def, "spirit");
    sp.position = parse_position(def["position"], sp.id);

    std::string shape = def["shape"].get_string("");
    if (!string_to_shape(shape, sp.shape)) {
        throw std::runtime_error("host state: spirit " + sp.id +
                                 " has unknown shape '" + shape + "'");
    }

    sp.size = def["size"].get_int(1);

    long long derived = static_cast<long long>(sp.size) * rules.energy_per_size;
    int default_capacity = (derived < std::numeric_limits<int>::min() ||
                            derived > std::numeric_limits<int>::max())
                               ? ENERGY_UNREADABLE
                               : static_cast<int>(derived);
    sp.energy_capacity = read_energy(def["energy_capacity"], default_capacity);
    sp.energy          = read_energy(def["energy"], 0);
    sp.hp              = def["hp"].get_int(1);
    sp.mark            = def["mark"].get_string("");
    sp.last_energized  = def["last_energized"].get_string("");
    sp.player_id       = def["player_id"].get_string("");
    sp.sight           = parse_sight(def["sight"]);
    return sp;
}

void HostStateParser::parse_structure_fields(const JsonValue& def, Structure& out) {
    out.id = require_id(def, structure_type_to_string(out.structure_type));
    out.position = parse_position(def["position"], out.id);

    // The list a structure arrives in decides its type; a contradicting tag is a desync
    if (def.has("structure_type")) {
        StructureType declared;
        std::string tag = def["structure_type"].get_string("");
        if (!string_to_structure_type(tag, declared) || declared != out.structure_type) {
            throw std::runtime_error("host state: " + out.id + " declares structure_type '" +
                                     tag + "' but was listed as " +
                                     structure_type_to_string(out.structure_type));
        }
    }

    out.energy_capacity = read_energy(def["energy_capacity"], 0);
    out.energy          = read_energy(def["energy"], 0);
    out.control         = def["control"].get_string("");
    if (out.has_sight) {
        out.sight = parse_sight(def["sight"]);
    }
}

HostGlobals HostStateParser::parse(const JsonValue& payload, const RuleSet& rules) {
    if (!payload.is_object()) {
        throw std::runtime_error("host state: payload is not an object");
    }
    if (!payload["tick"].is_number()) {
        throw std::runtime_error("host state: missing tick counter");
    }

    HostGlobals g;
    g.tick = static_cast<long>(payload["tick"].as_int64());
    g.player_id = payload["player_id"].get_string("");

    // ── Structures ──
    for (const auto& def : payload["bases"].elements()) {
        Base b;
        parse_structure_fields(def, b);
        b.current_spirit_cost = def["current_spirit_cost"].get_int(0);
        g.bases.push_back(std::move(b));
    }
    for (const auto& def : payload["stars"].elements()) {
        Star s;
        parse_structure_fields(def, s);
        s.regeneration = def["regeneration"].get_number(0.0);
        g.stars.push_back(std::move(s));
    }
    for (const auto& def : payload["outposts"].elements()) {
        Outpost o;
        parse_structure_fields(def, o);
        o.range = def["range"].get_number(rules.outpost_low_tier.range);
        g.outposts.push_back(std::move(o));
    }
    for (const auto& def : payload["pylons"].elements()) {
        Pylon p;
        parse_structure_fields(def, p);
        g.pylons.push_back(std::move(p));
    }

    // ── Spirit registry: object keyed by id, or a plain array ──
    std::unordered_set<std::string> known;
    const auto& registry = payload["spirits"];
    if (registry.is_object()) {
        for (const auto& [key, def] : registry.members()) {
            Spirit sp = parse_spirit(def, rules);
            if (sp.id != key) {
                throw std::runtime_error("host state: registry key " + key +
                                         " holds spirit " + sp.id);
            }
            known.insert(sp.id);
            g.spirits.push_back(std::move(sp));
        }
    } else if (registry.is_array()) {
        for (const auto& def : registry.elements()) {
            Spirit sp = parse_spirit(def, rules);
            if (!known.insert(sp.id).second) {
                throw std::runtime_error("host state: duplicate spirit " + sp.id);
            }
            g.spirits.push_back(std::move(sp));
        }
    }

    // ── Roster: ids, or full spirit records ──
    for (const auto& el : payload["my_spirits"].elements()) {
        if (el.is_string()) {
            g.my_spirits.push_back(el.as_string());
            continue;
        }
        Spirit sp = parse_spirit(el, rules);
        g.my_spirits.push_back(sp.id);
        if (known.insert(sp.id).second) {
            g.spirits.push_back(std::move(sp));
        }
    }

    // Fall back to the roster owner when the host omits player_id
    if (g.player_id.empty() && !g.my_spirits.empty()) {
        for (const auto& sp : g.spirits) {
            if (sp.id == g.my_spirits.front()) {
                g.player_id = sp.player_id;
                break;
            }
        }
    }

    return g;
}

} // namespace spirits::game
