//
// Created by Malik T on 04/10/2025.
//

#include "ActionValidator.hpp"

#include <algorithm>
#include "Abilities.hpp"
#include "Log.hpp"

namespace shadow::core::validator
{
    using RVC = error::RuleViolationCode;
    using error::Viol;

    namespace
    {
        auto InvalidRef(PlayerId const actor, std::string_view what) -> ValidateResult
        {
            log::Warn("invalid reference from P{}: {}", static_cast<int>(actor), what);
            return std::unexpected(Viol(RVC::InvalidReference).with_actor(actor));
        }

        // Running session, known actor, actor owns the turn.
        auto TurnOwner(GameSession const& s, PlayerId const actor) -> ValidateResult
        {
            if (!s.IsRunning())
                return std::unexpected(Viol(RVC::SessionNotRunning).with_actor(actor));
            if (s.PlayerAt(actor) == nullptr)
                return InvalidRef(actor, "unknown actor");
            if (actor != s.Current())
                return std::unexpected(Viol(RVC::WrongActor_CurrentPlayerRequired)
                                       .with_actor(actor).with_current(s.Current()));
            return {};
        }

        auto RequirePhase(GameSession const& s, PlayerId const actor, Phase const p, RVC const code) -> ValidateResult
        {
            if (s.PhaseNow() != p)
                return std::unexpected(Viol(code).with_phase(s.PhaseNow()).with_actor(actor));
            return {};
        }
    }

    auto IsLegalTarget(GameSession const& s, PlayerId const attacker, PlayerId const target) -> bool
    {
        Player const* a = s.PlayerAt(attacker);
        Player const* t = s.PlayerAt(target);
        if (a == nullptr || t == nullptr) return false;
        if (attacker == target || !t->IsAlive()) return false;
        if (!a->Position() || !t->Position()) return false;

        bool const same_area = board::SameArea(*a->Position(), *t->Position());
        return a->HasEquipment(EffectKind::ExtendedRange) ? !same_area : same_area;
    }

    auto LegalTargets(GameSession const& s, PlayerId const attacker) -> std::vector<PlayerId>
    {
        std::vector<PlayerId> out;
        for (Player const& p : s.Players())
        {
            if (IsLegalTarget(s, attacker, p.Id())) out.push_back(p.Id());
        }
        return out;
    }

    auto ReachableZones(GameSession const& s, PlayerId const actor) -> std::vector<ZoneId>
    {
        std::vector<ZoneId> out;
        Player const* p = s.PlayerAt(actor);
        if (p == nullptr || !s.Progress().movement_roll) return out;

        int const roll = *s.Progress().movement_roll;
        for (size_t z{}; z < constants::ZoneCount; ++z)
        {
            auto const zone = static_cast<ZoneId>(z);
            if (p->Position() == zone) continue;
            if (board::Distance(p->Position(), zone) <= roll) out.push_back(zone);
        }
        return out;
    }

    auto RollMovement(GameSession const& s, PlayerId const actor) -> ValidateResult
    {
        if (auto r = TurnOwner(s, actor); !r) return r;
        if (auto r = RequirePhase(s, actor, Phase::Movement, RVC::Roll_WrongPhase); !r) return r;
        if (s.Progress().rolled)
            return std::unexpected(Viol(RVC::Roll_AlreadyRolled).with_actor(actor));
        return {};
    }

    auto Move(GameSession const& s, PlayerId const actor, ZoneId const dest) -> ValidateResult
    {
        if (auto r = TurnOwner(s, actor); !r) return r;
        if (auto r = RequirePhase(s, actor, Phase::Movement, RVC::Move_WrongPhase); !r) return r;

        TurnState const& ts = s.Progress();
        if (!ts.rolled || !ts.movement_roll)
            return std::unexpected(Viol(RVC::Move_NotRolled).with_actor(actor));
        if (ts.moved)
            return std::unexpected(Viol(RVC::Move_AlreadyMoved).with_actor(actor));
        if (static_cast<size_t>(dest) >= constants::ZoneCount)
            return InvalidRef(actor, "unknown zone");

        Player const& p = *s.PlayerAt(actor);
        if (p.Position() == dest)
            return std::unexpected(Viol(RVC::Move_SameZone).with_actor(actor).with_zone(dest));

        int const dist = board::Distance(p.Position(), dest);
        if (dist > *ts.movement_roll)
            return std::unexpected(Viol(RVC::Move_OutOfRange)
                                   .with_actor(actor).with_zone(dest)
                                   .with_roll(*ts.movement_roll)
                                   .with_distance(static_cast<uint8_t>(dist)));
        return {};
    }

    auto Draw(GameSession const& s, PlayerId const actor, DeckKind const deck) -> ValidateResult
    {
        if (auto r = TurnOwner(s, actor); !r) return r;
        if (auto r = RequirePhase(s, actor, Phase::Action, RVC::Draw_WrongPhase); !r) return r;
        if (s.Progress().drawn)
            return std::unexpected(Viol(RVC::Draw_AlreadyDrawn).with_actor(actor));
        if (static_cast<size_t>(deck) >= constants::DeckCount)
            return InvalidRef(actor, "unknown deck");

        Player const& p = *s.PlayerAt(actor);
        if (!p.Position())
            return std::unexpected(Viol(RVC::Draw_NoDeckInZone).with_actor(actor));

        std::vector<DeckKind> const here = s.DecksAt(*p.Position());
        if (here.empty())
            return std::unexpected(Viol(RVC::Draw_NoDeckInZone).with_actor(actor).with_zone(*p.Position()));
        if (std::ranges::find(here, deck) == std::end(here))
            return std::unexpected(Viol(RVC::Draw_DeckNotInZone)
                                   .with_actor(actor).with_zone(*p.Position()).with_deck(deck));
        if (!s.DeckOf(deck).HasDrawable())
            return std::unexpected(Viol(RVC::Draw_DeckExhausted).with_actor(actor).with_deck(deck));
        return {};
    }

    auto Attack(GameSession const& s, PlayerId const actor, PlayerId const target) -> ValidateResult
    {
        if (auto r = TurnOwner(s, actor); !r) return r;
        if (auto r = RequirePhase(s, actor, Phase::Action, RVC::Attack_WrongPhase); !r) return r;
        if (s.Progress().attacked)
            return std::unexpected(Viol(RVC::Attack_AlreadyAttacked).with_actor(actor));
        if (s.PlayerAt(target) == nullptr)
            return InvalidRef(actor, "unknown attack target");
        if (LegalTargets(s, actor).empty())
            return std::unexpected(Viol(RVC::Attack_NoLegalTarget).with_actor(actor));
        if (!IsLegalTarget(s, actor, target))
            return std::unexpected(Viol(RVC::Attack_IllegalTarget).with_actor(actor).with_target(target));
        return {};
    }

    auto EndTurn(GameSession const&, PlayerId) -> ValidateResult
    {
        return {};
    }

    auto ActivateAbility(GameSession const& s, PlayerId const actor) -> ValidateResult
    {
        if (auto r = TurnOwner(s, actor); !r) return r;
        return AbilitySystem::CanActivate(*s.PlayerAt(actor));
    }

    auto Reveal(GameSession const& s, PlayerId const actor) -> ValidateResult
    {
        if (auto r = TurnOwner(s, actor); !r) return r;
        if (s.PlayerAt(actor)->IsRevealed())
            return std::unexpected(Viol(RVC::Reveal_AlreadyRevealed).with_actor(actor));
        return {};
    }

    auto GiveVision(GameSession const& s, PlayerId const actor, uint16_t const card_id, PlayerId const target) -> ValidateResult
    {
        if (auto r = TurnOwner(s, actor); !r) return r;
        if (auto r = RequirePhase(s, actor, Phase::Action, RVC::Vision_WrongPhase); !r) return r;

        CardSP const card = s.PlayerAt(actor)->FindInHand(card_id);
        if (!card)
            return std::unexpected(Viol(RVC::Vision_CardNotInHand).with_actor(actor));
        if (card->type != CardType::Vision)
            return std::unexpected(Viol(RVC::Vision_NotAVisionCard).with_actor(actor));

        Player const* t = s.PlayerAt(target);
        if (t == nullptr)
            return InvalidRef(actor, "unknown vision receiver");
        if (target == actor || !t->IsAlive())
            return std::unexpected(Viol(RVC::Vision_IllegalTarget).with_actor(actor).with_target(target));
        return {};
    }

    auto UseZone(GameSession const& s, PlayerId const actor, PlayerId const target, ZoneChoice const choice) -> ValidateResult
    {
        if (auto r = TurnOwner(s, actor); !r) return r;
        if (auto r = RequirePhase(s, actor, Phase::Action, RVC::Zone_WrongPhase); !r) return r;

        Player const& p = *s.PlayerAt(actor);
        if (!p.Position() || !board::HasZonePower(*p.Position()))
            return std::unexpected(Viol(RVC::Zone_NoPower).with_actor(actor));
        if (s.Progress().zone_used)
            return std::unexpected(Viol(RVC::Zone_AlreadyUsed).with_actor(actor).with_zone(*p.Position()));

        Player const* t = s.PlayerAt(target);
        if (t == nullptr)
            return InvalidRef(actor, "unknown zone target");

        auto illegal = [&]() -> ValidateResult
        {
            return std::unexpected(Viol(RVC::Zone_IllegalTarget)
                                   .with_actor(actor).with_target(target).with_zone(*p.Position()));
        };

        if (!t->IsAlive()) return illegal();

        if (*p.Position() == ZoneId::WeirdWoods)
        {
            if (choice != ZoneChoice::Damage && choice != ZoneChoice::Heal) return illegal();
            return {};
        }
        // Erstwhile Altar
        if (choice != ZoneChoice::Steal || target == actor || t->Equipment().empty()) return illegal();
        return {};
    }

    auto Named(GameSession const& s, PlayerId const actor, std::string_view const action_id) -> ValidateResult
    {
        if (action_id == RollMovementId)
            return RollMovement(s, actor);

        if (action_id == MoveId)
        {
            if (auto r = TurnOwner(s, actor); !r) return r;
            if (auto r = RequirePhase(s, actor, Phase::Movement, RVC::Move_WrongPhase); !r) return r;
            if (!s.Progress().rolled)
                return std::unexpected(Viol(RVC::Move_NotRolled).with_actor(actor));
            if (s.Progress().moved)
                return std::unexpected(Viol(RVC::Move_AlreadyMoved).with_actor(actor));
            return {};
        }

        if (action_id == DrawCardId)
        {
            if (auto r = TurnOwner(s, actor); !r) return r;
            if (auto r = RequirePhase(s, actor, Phase::Action, RVC::Draw_WrongPhase); !r) return r;
            if (s.Progress().drawn)
                return std::unexpected(Viol(RVC::Draw_AlreadyDrawn).with_actor(actor));

            Player const& p = *s.PlayerAt(actor);
            std::vector<DeckKind> const here = p.Position() ? s.DecksAt(*p.Position()) : std::vector<DeckKind>{};
            if (here.empty())
                return std::unexpected(Viol(RVC::Draw_NoDeckInZone).with_actor(actor));
            if (std::ranges::none_of(here, [&s](DeckKind const d) { return s.DeckOf(d).HasDrawable(); }))
                return std::unexpected(Viol(RVC::Draw_DeckExhausted).with_actor(actor).with_zone(*p.Position()));
            return {};
        }

        if (action_id == AttackId)
        {
            if (auto r = TurnOwner(s, actor); !r) return r;
            if (auto r = RequirePhase(s, actor, Phase::Action, RVC::Attack_WrongPhase); !r) return r;
            if (s.Progress().attacked)
                return std::unexpected(Viol(RVC::Attack_AlreadyAttacked).with_actor(actor));
            if (LegalTargets(s, actor).empty())
                return std::unexpected(Viol(RVC::Attack_NoLegalTarget).with_actor(actor));
            return {};
        }

        if (action_id == EndTurnId)
            return EndTurn(s, actor);

        log::Warn("unknown action id '{}' from P{}", action_id, static_cast<int>(actor));
        return std::unexpected(Viol(RVC::UnknownAction).with_actor(actor));
    }

    auto Check(GameSession const& s, PlayerId const actor, PlayerAction const& a) -> ValidateResult
    {
        return std::visit([&]<typename T0>(T0 const& act) -> ValidateResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollMoveAction>)
                return RollMovement(s, actor);
            else if constexpr (std::is_same_v<T, MoveAction>)
                return Move(s, actor, act.zone);
            else if constexpr (std::is_same_v<T, DrawAction>)
                return Draw(s, actor, act.deck);
            else if constexpr (std::is_same_v<T, AttackAction>)
                return Attack(s, actor, act.target);
            else if constexpr (std::is_same_v<T, EndTurnAction>)
                return EndTurn(s, actor);
            else if constexpr (std::is_same_v<T, ActivateAbilityAction>)
                return ActivateAbility(s, actor);
            else if constexpr (std::is_same_v<T, RevealAction>)
                return Reveal(s, actor);
            else if constexpr (std::is_same_v<T, GiveVisionAction>)
                return GiveVision(s, actor, act.card_id, act.target);
            else
                return UseZone(s, actor, act.target, act.choice);
        }, a);
    }
}
