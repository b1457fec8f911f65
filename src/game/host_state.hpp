/**
 * HostGlobals — raw per-tick state as the host hands it over.
 *
 * The host exposes bases, stars, outposts, pylons, the caller's roster, a
 * global spirit registry and the tick counter. HostStateParser turns one tick
 * payload (JSON) into this struct; SnapshotBuilder then indexes it into a
 * WorldState.
 */

#ifndef SPIRITS_GAME_HOST_STATE_HPP
#define SPIRITS_GAME_HOST_STATE_HPP

#include "game/entity.hpp"
#include "game/rules.hpp"
#include "io/json_reader.hpp"
#include <string>
#include <vector>

namespace spirits::game {

struct HostGlobals {
    long tick = 0;
    std::string player_id;

    std::vector<Base> bases;
    std::vector<Star> stars;
    std::vector<Outpost> outposts;
    std::vector<Pylon> pylons;

    std::vector<std::string> my_spirits;     // roster ids, host order
    std::vector<Spirit> spirits;             // global registry, host order
};

class HostStateParser {
public:
    /**
     * Parse one tick payload.
     * @throws std::runtime_error when a required field is missing or malformed
     */
    static HostGlobals parse(const JsonValue& payload, const RuleSet& rules);

    static Spirit parse_spirit(const JsonValue& def, const RuleSet& rules);
    static Sight parse_sight(const JsonValue& def);
    static Vec2 parse_position(const JsonValue& def, const std::string& owner_id);

private:
    static void parse_structure_fields(const JsonValue& def, Structure& out);
};

} // namespace spirits::game

#endif // SPIRITS_GAME_HOST_STATE_HPP
