#include "game/action_gateway.hpp"
#include "game/capability.hpp"
#include "game/errors.hpp"
#include <iostream>

namespace spirits::game {

ActionGateway::ActionGateway(HostBinding& host, const TickClock& clock,
                             DiagnosticLog& diagnostics, CrossTickMemory* memory,
                             bool verbose)
    : host_(host), clock_(clock), diagnostics_(diagnostics),
      memory_(memory), verbose_(verbose) {}

void ActionGateway::begin_tick(const WorldState& world) {
    world_ = &world;
    if (world.tick() != acted_tick_) {
        acted_.clear();
        acted_tick_ = world.tick();
    }
}

const Spirit& ActionGateway::resolve_actor(const Intent& intent) const {
    const Spirit* actor = world_->spirit(intent.actor);
    if (!actor) {
        throw UnknownTargetError(intent.actor, "no spirit " + intent.actor + " in snapshot");
    }
    if (!world_->is_mine(actor->id)) {
        throw UnknownTargetError(intent.actor, "spirit " + intent.actor + " is not ours");
    }
    if (!actor->alive()) {
        throw UnknownTargetError(intent.actor, "spirit " + intent.actor + " is dead");
    }
    return *actor;
}

void ActionGateway::check_preconditions(const Intent& intent, const Spirit& actor) const {
    switch (intent.action) {
        case ActionType::ENERGIZE: {
            const Spirit* sp = world_->spirit(intent.target);
            if (sp && sp->alive()) return;
            if (!sp && world_->structure(intent.target)) return;
            throw UnknownTargetError(actor.id, "energize target '" + intent.target +
                                     "' is not a live entity in snapshot");
        }

        case ActionType::MERGE: {
            if (intent.target == actor.id) {
                throw InvalidIntentError(actor.id, "spirit " + actor.id + " cannot merge with itself");
            }
            const Spirit* sp = world_->spirit(intent.target);
            if (!sp || !sp->alive() || !world_->is_mine(sp->id)) {
                throw UnknownTargetError(actor.id, "merge target '" + intent.target +
                                         "' is not one of our live spirits");
            }
            return;
        }

        case ActionType::MOVE:
        case ActionType::JUMP:
            if (!intent.position.is_finite()) {
                throw InvalidIntentError(actor.id, std::string(action_to_string(intent.action)) +
                                         " with non-finite coordinates");
            }
            return;

        default:
            return;
    }
}

void ActionGateway::validate(const Intent& intent) const {
    // 1. Freshness
    if (!world_) {
        throw StaleSnapshotError(-1, clock_.current());
    }
    world_->ensure_current(clock_);

    // 2. Actor
    const Spirit& actor = resolve_actor(intent);

    // 3. Capability
    if (!has_capability(actor.shape, required_capability(intent.action))) {
        throw CapabilityError(actor.id, std::string(shape_to_string(actor.shape)) +
                              " cannot " + action_to_string(intent.action));
    }

    // 4. Preconditions
    check_preconditions(intent, actor);

    // 5. One action per tick
    if (has_acted(actor.id)) {
        throw DoubleActionError(actor.id, "spirit " + actor.id + " already acted on tick " +
                                std::to_string(world_->tick()));
    }
}

void ActionGateway::remember(const Intent& intent) {
    if (!memory_) return;
    if (intent.action == ActionType::SET_MARK) {
        memory_->remember_mark(intent.actor, intent.text);
    } else if (intent.action == ActionType::ENERGIZE) {
        memory_->remember_energized(intent.actor, intent.target);
    }
}

void ActionGateway::dispatch(const Intent& intent) {
    validate(intent);

    host_.forward(intent);
    acted_.insert(intent.actor);
    dispatched_++;
    remember(intent);

    if (verbose_) {
        std::cerr << "[GATEWAY] tick " << world_->tick() << " " << intent.describe() << "\n";
    }
}

DispatchResult ActionGateway::submit(const Intent& intent) {
    DispatchResult result;
    try {
        dispatch(intent);
        result.accepted = true;
    } catch (const GameError& e) {
        rejected_++;
        Diagnostic d;
        d.tick = world_ ? world_->tick() : clock_.current();
        d.kind = e.kind();
        d.subject_id = e.subject_id().empty() ? intent.actor : e.subject_id();
        d.action = action_to_string(intent.action);
        d.message = e.what();
        diagnostics_.record(d);
        result.error = e.kind();
        result.message = e.what();
    }
    return result;
}

} // namespace spirits::game
