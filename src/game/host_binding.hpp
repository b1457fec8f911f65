/**
 * HostBinding — the ten host-mutating spirit commands.
 *
 * The gateway is the only caller. Commands are fire-and-forget: nothing is
 * returned and the host's response is never re-validated.
 *
 * CommandQueue is the binding the engine runs with: it records every command
 * in issue order and serialises the batch as JSON for the host to replay.
 */

#ifndef SPIRITS_GAME_HOST_BINDING_HPP
#define SPIRITS_GAME_HOST_BINDING_HPP

#include "core/vec2.hpp"
#include "game/intent.hpp"
#include "io/json_writer.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace spirits::game {

class HostBinding {
public:
    virtual ~HostBinding() = default;

    virtual void energize(const std::string& actor, const std::string& target) = 0;
    virtual void move(const std::string& actor, const Vec2& to) = 0;
    virtual void jump(const std::string& actor, const Vec2& to) = 0;
    virtual void merge(const std::string& actor, const std::string& target) = 0;
    virtual void divide(const std::string& actor) = 0;
    virtual void lock(const std::string& actor) = 0;
    virtual void unlock(const std::string& actor) = 0;
    virtual void explode(const std::string& actor) = 0;
    virtual void shout(const std::string& actor, const std::string& message) = 0;
    virtual void set_mark(const std::string& actor, const std::string& label) = 0;

    /** Route a validated intent to the matching command. */
    void forward(const Intent& intent);
};

/** A command as the host receives it. Same shape as an Intent. */
using HostCommand = Intent;

/** {"action", "actor"} plus whichever of target / position / text the command takes. */
void write_command(JsonWriter& w, const HostCommand& cmd);

class CommandQueue : public HostBinding {
public:
    void energize(const std::string& actor, const std::string& target) override;
    void move(const std::string& actor, const Vec2& to) override;
    void jump(const std::string& actor, const Vec2& to) override;
    void merge(const std::string& actor, const std::string& target) override;
    void divide(const std::string& actor) override;
    void lock(const std::string& actor) override;
    void unlock(const std::string& actor) override;
    void explode(const std::string& actor) override;
    void shout(const std::string& actor, const std::string& message) override;
    void set_mark(const std::string& actor, const std::string& label) override;

    const std::vector<HostCommand>& commands() const { return commands_; }
    size_t size() const { return commands_.size(); }
    void clear() { commands_.clear(); }

    /** Compact JSON array: [{"action":"move","actor":"me_1","position":[x,y]}, ...] */
    void write_json(std::ostream& os) const;

private:
    std::vector<HostCommand> commands_;
};

} // namespace spirits::game

#endif // SPIRITS_GAME_HOST_BINDING_HPP
