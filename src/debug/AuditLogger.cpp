#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

using namespace shadow::core;

namespace
{

auto s_choice(ZoneChoice const c) -> std::string_view
{
    switch (c)
    {
        case ZoneChoice::Damage: return "damage";
        case ZoneChoice::Heal:   return "heal";
        case ZoneChoice::Steal:  return "steal";
    }
    return "?";
}

auto s_seats(std::vector<PlayerId> const& ids) -> std::string
{
    std::string body;
    for (size_t i{}; i < ids.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::format("P{}", static_cast<int>(ids[i]));
    }
    return body;
}

auto s_position(std::optional<ZoneId> const z) -> std::string_view
{
    return z ? to_string(*z) : std::string_view{"off-board"};
}

} // anonymous namespace

namespace shadow::core::debug
{

auto describe(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollMoveAction>)
            {
                return "RollMove";
            }
            else if constexpr (std::is_same_v<T, MoveAction>)
            {
                return std::format("Move({})", to_string(act.zone));
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                return std::format("Draw({})", to_string(act.deck));
            }
            else if constexpr (std::is_same_v<T, AttackAction>)
            {
                return std::format("Attack(P{})", static_cast<int>(act.target));
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                return "EndTurn";
            }
            else if constexpr (std::is_same_v<T, ActivateAbilityAction>)
            {
                return std::format("Activate[{}]{}", s_seats(act.targets),
                                   act.zone ? std::format("@{}", to_string(*act.zone)) : std::string{});
            }
            else if constexpr (std::is_same_v<T, RevealAction>)
            {
                return "Reveal";
            }
            else if constexpr (std::is_same_v<T, GiveVisionAction>)
            {
                return std::format("GiveVision(#{} -> P{})", act.card_id, static_cast<int>(act.target));
            }
            else
            {
                return std::format("UseZone({} P{})", s_choice(act.choice), static_cast<int>(act.target));
            }
        },
        a
    );
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", static_cast<int>(game.PlayerCount()));
    for (Player const& p : game.Session().Players())
    {
        out_ << std::format("Seat P{} {} ({}, {} hp)\n", static_cast<int>(p.Id()),
                            to_string(p.Character()), to_string(p.Alignment()), p.HpMax());
    }
    out_.flush();
}

auto AuditLogger::turn(GameSnapshot const& s,
                       uint8_t actor,
                       PlayerAction const& a) -> void
{
    PlayerView const& me = s.players.at(actor);
    out_ << std::format(
        "Turn {} actor=P{} phase={} zone={} hp={}/{} hand={}\n",
        s.turn,
        static_cast<int>(actor),
        to_string(s.phase),
        s_position(me.position),
        me.hp,
        me.hp_max,
        static_cast<int>(me.hand_count)
    );

    out_ << std::format("Action: {}\n", describe(a));
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    out_ << std::format("Outcome: {}\n", to_string(m));
}

auto AuditLogger::event(GameEvent const& ev) -> void
{
    out_ << std::format("Event: {}\n", to_string(ev));
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    GameSession const& s = game.Session();
    std::optional<Faction> const f = s.WinningFaction();

    out_ << std::format("Status={} Faction={} Winners=[{}] Turn={}\n",
                        s.Status() == SessionStatus::Stalled ? "stalled" : "finished",
                        f ? to_string(*f) : "none",
                        s_seats(s.Winners()),
                        s.Turn());
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace shadow::core::debug
