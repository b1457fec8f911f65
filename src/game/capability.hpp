/**
 * Capability model — which commands each spirit shape may issue.
 *
 * The matrix is a pure function of shape:
 *   circles   lack lock, unlock, explode
 *   squares   lack merge, divide, explode
 *   triangles lack merge, divide, lock, unlock
 *
 * Two ways to reach it:
 *  - Static: narrow() turns a Spirit into CircleSpirit / SquareSpirit /
 *    TriangleSpirit. Each view is composed from one mixin per capability,
 *    so a view without a capability has no member function for it.
 *  - Dynamic: ActionGateway checks has_capability() for raw Intents and
 *    rejects the rest with CapabilityError.
 */

#ifndef SPIRITS_GAME_CAPABILITY_HPP
#define SPIRITS_GAME_CAPABILITY_HPP

#include "game/entity.hpp"
#include "game/intent.hpp"
#include <bitset>
#include <string>
#include <variant>
#include <vector>

namespace spirits::game {

class ActionGateway;
class WorldState;

enum class Capability {
    ENERGIZE,
    MOVE,
    JUMP,
    MERGE,
    DIVIDE,
    LOCK,
    UNLOCK,
    EXPLODE,
    SHOUT,
    SET_MARK
};

constexpr int CAPABILITY_COUNT = 10;

using CapabilitySet = std::bitset<CAPABILITY_COUNT>;

const char* capability_to_string(Capability cap);

CapabilitySet capabilities_of(Shape shape);
bool has_capability(Shape shape, Capability cap);

/** Every command needs exactly the capability of the same name. */
Capability required_capability(ActionType action);

// ═══════════════════════════════════════════════════════════════
// Views
// ═══════════════════════════════════════════════════════════════

/**
 * Read access to the spirit plus the gateway its commands go through.
 * Views are cheap handles; they must not outlive the tick's WorldState.
 */
class SpiritView {
public:
    SpiritView(const Spirit& spirit, ActionGateway& gateway)
        : spirit_(&spirit), gateway_(&gateway) {}

    const Spirit& spirit() const { return *spirit_; }
    const std::string& id() const { return spirit_->id; }
    Shape shape() const { return spirit_->shape; }
    const Vec2& position() const { return spirit_->position; }
    int energy() const { return spirit_->energy; }
    int energy_capacity() const { return spirit_->energy_capacity; }

private:
    friend DispatchResult issue(const SpiritView& view, const Intent& intent);

    const Spirit* spirit_;
    ActionGateway* gateway_;
};

/** Submit through the view's gateway. Used by the capability mixins. */
DispatchResult issue(const SpiritView& view, const Intent& intent);

// ── One mixin per capability ──

template<typename View>
class CanEnergize {
public:
    DispatchResult energize(const std::string& target_id) const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::energize(v.id(), target_id));
    }
};

template<typename View>
class CanMove {
public:
    DispatchResult move(const Vec2& to) const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::move(v.id(), to));
    }
};

template<typename View>
class CanJump {
public:
    DispatchResult jump(const Vec2& to) const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::jump(v.id(), to));
    }
};

template<typename View>
class CanMerge {
public:
    DispatchResult merge(const std::string& target_id) const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::merge(v.id(), target_id));
    }
};

template<typename View>
class CanDivide {
public:
    DispatchResult divide() const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::divide(v.id()));
    }
};

template<typename View>
class CanLock {
public:
    DispatchResult lock() const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::lock(v.id()));
    }
};

template<typename View>
class CanUnlock {
public:
    DispatchResult unlock() const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::unlock(v.id()));
    }
};

template<typename View>
class CanExplode {
public:
    DispatchResult explode() const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::explode(v.id()));
    }
};

template<typename View>
class CanShout {
public:
    DispatchResult shout(const std::string& message) const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::shout(v.id(), message));
    }
};

template<typename View>
class CanSetMark {
public:
    DispatchResult set_mark(const std::string& label) const {
        const auto& v = static_cast<const View&>(*this);
        return issue(v, Intent::set_mark(v.id(), label));
    }
};

// ── Shape views ──

class CircleSpirit : public SpiritView,
                     public CanEnergize<CircleSpirit>,
                     public CanMove<CircleSpirit>,
                     public CanJump<CircleSpirit>,
                     public CanMerge<CircleSpirit>,
                     public CanDivide<CircleSpirit>,
                     public CanShout<CircleSpirit>,
                     public CanSetMark<CircleSpirit> {
public:
    static constexpr Shape SHAPE = Shape::CIRCLE;
    using SpiritView::SpiritView;
};

class SquareSpirit : public SpiritView,
                     public CanEnergize<SquareSpirit>,
                     public CanMove<SquareSpirit>,
                     public CanJump<SquareSpirit>,
                     public CanLock<SquareSpirit>,
                     public CanUnlock<SquareSpirit>,
                     public CanShout<SquareSpirit>,
                     public CanSetMark<SquareSpirit> {
public:
    static constexpr Shape SHAPE = Shape::SQUARE;
    using SpiritView::SpiritView;
};

class TriangleSpirit : public SpiritView,
                       public CanEnergize<TriangleSpirit>,
                       public CanMove<TriangleSpirit>,
                       public CanJump<TriangleSpirit>,
                       public CanExplode<TriangleSpirit>,
                       public CanShout<TriangleSpirit>,
                       public CanSetMark<TriangleSpirit> {
public:
    static constexpr Shape SHAPE = Shape::TRIANGLE;
    using SpiritView::SpiritView;
};

using ShapedSpirit = std::variant<CircleSpirit, SquareSpirit, TriangleSpirit>;

/** Narrow a spirit to the view of its shape. */
ShapedSpirit narrow(const Spirit& spirit, ActionGateway& gateway);

/**
 * Narrow to a specific view.
 * @throws CapabilityError when the spirit has another shape
 */
template<typename View>
View narrow_as(const Spirit& spirit, ActionGateway& gateway) {
    if (spirit.shape != View::SHAPE) {
        throw CapabilityError(spirit.id, "spirit " + spirit.id + " is " +
                              shape_to_string(spirit.shape) + ", not " +
                              shape_to_string(View::SHAPE));
    }
    return View(spirit, gateway);
}

/** Views of the caller's live spirits, roster order. */
std::vector<ShapedSpirit> narrow_roster(const WorldState& world, ActionGateway& gateway);

/** Common read access on any narrowed view. */
inline const SpiritView& view_of(const ShapedSpirit& shaped) {
    return std::visit([](const auto& v) -> const SpiritView& { return v; }, shaped);
}

} // namespace spirits::game

#endif // SPIRITS_GAME_CAPABILITY_HPP
