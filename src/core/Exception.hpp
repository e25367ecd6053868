//
// Created by Malik T on 14/08/2025.
//

#ifndef SHADOWHUNT_EXCEPTION_HPP
#define SHADOWHUNT_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <string>
#include <utility>
#include "Types.hpp"

namespace shadow::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        InvalidAction, // user/remote proposed action cannot be applied
        Liveness, // the session can no longer make progress
        Timeout, // deadline exceeded for IO or player move
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct LivenessError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Liveness: throw LivenessError(std::move(msg), c, loc);
        case Code::Timeout: throw TimeoutError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define SHD_THROW(code_enum, msg) ::shadow::core::error::fail((code_enum), (msg))
#define SHD_ASSERT(cond, msg) do { if(!(cond)) ::shadow::core::error::fail(::shadow::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        SessionNotRunning,
        WrongActor_CurrentPlayerRequired,
        InvalidReference,
        UnknownAction,

        // Movement roll
        Roll_WrongPhase,
        Roll_AlreadyRolled,

        // Move
        Move_WrongPhase,
        Move_NotRolled,
        Move_AlreadyMoved,
        Move_SameZone,
        Move_OutOfRange,

        // Draw
        Draw_WrongPhase,
        Draw_AlreadyDrawn,
        Draw_NoDeckInZone,
        Draw_DeckNotInZone,
        Draw_DeckExhausted,

        // Attack
        Attack_WrongPhase,
        Attack_AlreadyAttacked,
        Attack_NoLegalTarget,
        Attack_IllegalTarget,

        // Abilities
        Ability_NotActive,
        Ability_Disabled,
        Ability_AlreadyUsed,
        Ability_RequiresReveal,
        Ability_BadTargetCount,
        Ability_IllegalTarget,
        Ability_PreconditionFailed,

        // Reveal
        Reveal_AlreadyRevealed,

        // Vision cards
        Vision_WrongPhase,
        Vision_CardNotInHand,
        Vision_NotAVisionCard,
        Vision_IllegalTarget,

        // Zone powers
        Zone_WrongPhase,
        Zone_NoPower,
        Zone_AlreadyUsed,
        Zone_IllegalTarget,

        // Turn flow
        Liveness_NoLivingPlayers,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlayerId> actor{};
        std::optional<PlayerId> current{};
        std::optional<PlayerId> target{};
        std::optional<ZoneId> zone{};
        std::optional<DeckKind> deck{};

        // Small integers useful in error messages
        std::optional<std::uint8_t> roll{};
        std::optional<std::uint8_t> distance{};
        std::optional<std::uint8_t> attempted_count{}; // e.g., number of targets

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlayerId s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_current(PlayerId s) -> RuleViolation&
        {
            current = s;
            return *this;
        }

        auto with_target(PlayerId s) -> RuleViolation&
        {
            target = s;
            return *this;
        }

        auto with_zone(ZoneId z) -> RuleViolation&
        {
            zone = z;
            return *this;
        }

        auto with_deck(DeckKind d) -> RuleViolation&
        {
            deck = d;
            return *this;
        }

        auto with_roll(std::uint8_t v) -> RuleViolation&
        {
            roll = v;
            return *this;
        }

        auto with_distance(std::uint8_t v) -> RuleViolation&
        {
            distance = v;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }
    };

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{ .code = code };
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::SessionNotRunning: return "Game is not running";
        case E::WrongActor_CurrentPlayerRequired: return "Wrong actor (current player required)";
        case E::InvalidReference: return "Invalid reference (missing player, card or target)";
        case E::UnknownAction: return "Unknown action";

        // Roll / move
        case E::Roll_WrongPhase: return "Roll: movement phase required";
        case E::Roll_AlreadyRolled: return "Roll: already rolled this turn";
        case E::Move_WrongPhase: return "Move: movement phase required";
        case E::Move_NotRolled: return "Move: roll before moving";
        case E::Move_AlreadyMoved: return "Move: already moved this turn";
        case E::Move_SameZone: return "Move: destination is the current zone";
        case E::Move_OutOfRange: return "Move: destination beyond rolled distance";

        // Draw
        case E::Draw_WrongPhase: return "Draw: action phase required";
        case E::Draw_AlreadyDrawn: return "Draw: already drew this turn";
        case E::Draw_NoDeckInZone: return "Draw: no deck in current zone";
        case E::Draw_DeckNotInZone: return "Draw: requested deck not available here";
        case E::Draw_DeckExhausted: return "Draw: deck exhausted";

        // Attack
        case E::Attack_WrongPhase: return "Attack: action phase required";
        case E::Attack_AlreadyAttacked: return "Attack: already attacked this turn";
        case E::Attack_NoLegalTarget: return "Attack: no legal target";
        case E::Attack_IllegalTarget: return "Attack: target out of reach or dead";

        // Abilities
        case E::Ability_NotActive: return "Ability: not an active ability";
        case E::Ability_Disabled: return "Ability: disabled";
        case E::Ability_AlreadyUsed: return "Ability: once-per-game ability already used";
        case E::Ability_RequiresReveal: return "Ability: reveal first";
        case E::Ability_BadTargetCount: return "Ability: wrong number of targets";
        case E::Ability_IllegalTarget: return "Ability: illegal target";
        case E::Ability_PreconditionFailed: return "Ability: conditions not met";

        case E::Reveal_AlreadyRevealed: return "Reveal: already revealed";

        // Vision
        case E::Vision_WrongPhase: return "Vision: action phase required";
        case E::Vision_CardNotInHand: return "Vision: card not in hand";
        case E::Vision_NotAVisionCard: return "Vision: card is not a vision";
        case E::Vision_IllegalTarget: return "Vision: illegal receiver";

        // Zone
        case E::Zone_WrongPhase: return "Zone: action phase required";
        case E::Zone_NoPower: return "Zone: current zone has no power";
        case E::Zone_AlreadyUsed: return "Zone: power already used this turn";
        case E::Zone_IllegalTarget: return "Zone: illegal target";

        case E::Liveness_NoLivingPlayers: return "Turn: no living players";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.current) s += std::format(" | current=P{}", static_cast<int>(*v.current));
        if (v.target) s += std::format(" | target=P{}", static_cast<int>(*v.target));
        if (v.zone) s += std::format(" | zone={}", to_string(*v.zone));
        if (v.deck) s += std::format(" | deck={}", to_string(*v.deck));
        if (v.roll) s += std::format(" | roll={}", *v.roll);
        if (v.distance) s += std::format(" | distance={}", *v.distance);
        if (v.attempted_count) s += std::format(" | attempted={}", *v.attempted_count);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //SHADOWHUNT_EXCEPTION_HPP
