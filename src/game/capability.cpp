#include "game/capability.hpp"
#include "game/action_gateway.hpp"
#include "game/world_state.hpp"
#include <initializer_list>

namespace spirits::game {

const char* capability_to_string(Capability cap) {
    return action_to_string(static_cast<ActionType>(static_cast<int>(cap)));
}

static CapabilitySet make_set(std::initializer_list<Capability> caps) {
    CapabilitySet set;
    for (Capability c : caps) set.set(static_cast<size_t>(c));
    return set;
}

CapabilitySet capabilities_of(Shape shape) {
    static const CapabilitySet circle = make_set({
        Capability::ENERGIZE, Capability::MOVE, Capability::JUMP, Capability::MERGE,
        Capability::DIVIDE, Capability::SHOUT, Capability::SET_MARK});
    static const CapabilitySet square = make_set({
        Capability::ENERGIZE, Capability::MOVE, Capability::JUMP, Capability::LOCK,
        Capability::UNLOCK, Capability::SHOUT, Capability::SET_MARK});
    static const CapabilitySet triangle = make_set({
        Capability::ENERGIZE, Capability::MOVE, Capability::JUMP, Capability::EXPLODE,
        Capability::SHOUT, Capability::SET_MARK});

    switch (shape) {
        case Shape::CIRCLE:   return circle;
        case Shape::SQUARE:   return square;
        case Shape::TRIANGLE: return triangle;
    }
    return CapabilitySet();
}

bool has_capability(Shape shape, Capability cap) {
    return capabilities_of(shape).test(static_cast<size_t>(cap));
}

Capability required_capability(ActionType action) {
    return static_cast<Capability>(static_cast<int>(action));
}

DispatchResult issue(const SpiritView& view, const Intent& intent) {
    return view.gateway_->submit(intent);
}

ShapedSpirit narrow(const Spirit& spirit, ActionGateway& gateway) {
    switch (spirit.shape) {
        case Shape::SQUARE:   return SquareSpirit(spirit, gateway);
        case Shape::TRIANGLE: return TriangleSpirit(spirit, gateway);
        case Shape::CIRCLE:
        default:              return CircleSpirit(spirit, gateway);
    }
}

std::vector<ShapedSpirit> narrow_roster(const WorldState& world, ActionGateway& gateway) {
    std::vector<ShapedSpirit> out;
    out.reserve(world.my_spirits().size());
    for (const auto& id : world.my_spirits()) {
        const Spirit* sp = world.spirit(id);
        if (sp && sp->alive()) out.push_back(narrow(*sp, gateway));
    }
    return out;
}

} // namespace spirits::game
