//
// Created by Malik T on 15/08/2025.
//

#include "StandardRules.hpp"

#include <utility>
#include "ActionValidator.hpp"
#include "Game.hpp"
#include "Log.hpp"

namespace shadow::core
{
    auto StandardRules::Validate(GameImpl const& game, PlayerId const actor, PlayerAction const& a) const -> CheckResult
    {
        using RVC = ::shadow::core::error::RuleViolationCode;
        GameSession const& s = *game.session_;

        // Passing is legal in any phase, but only the turn owner may pass.
        if (std::holds_alternative<EndTurnAction>(a))
        {
            if (!s.IsRunning())
                return std::unexpected(error::Viol(RVC::SessionNotRunning).with_actor(actor));
            if (actor != s.Current())
                return std::unexpected(error::Viol(RVC::WrongActor_CurrentPlayerRequired)
                                       .with_actor(actor).with_current(s.Current()));
        }
        return validator::Check(s, actor, a);
    }

    auto StandardRules::Apply(GameImpl& game, PlayerId const actor, PlayerAction const& a) -> void
    {
        GameSession& s = *game.session_;
        Player& p = *s.PlayerAt(actor);

        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollMoveAction>)
            {
                int const roll = game.dice_->D6();
                s.Progress().rolled = true;
                s.Progress().movement_roll = static_cast<uint8_t>(roll);
                log::Debug("P{} rolls {} for movement", static_cast<int>(actor), roll);
            }
            else if constexpr (std::is_same_v<T, MoveAction>)
            {
                p.MoveTo(act.zone);
                s.Progress().moved = true;
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                s.Progress().drawn = true;
                CardSP card = s.DeckOf(act.deck).Draw(s.Rng());
                if (!card)
                {
                    log::Warn("P{} drew from an exhausted {} deck", static_cast<int>(actor), to_string(act.deck));
                    return;
                }
                game.bus_.Publish(CardDrawn{actor, act.deck, card->id});
                if (auto const res = game.cards_->Resolve(actor, std::move(card)); !res)
                    log::Warn("card resolution failed: {}", error::describe(res.error()));
            }
            else if constexpr (std::is_same_v<T, AttackAction>)
            {
                s.Progress().attacked = true;
                if (auto const res = game.combat_->Attack(actor, act.target); !res)
                    log::Warn("attack failed: {}", error::describe(res.error()));
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                game.turn_end_requested_ = true;
            }
            else if constexpr (std::is_same_v<T, ActivateAbilityAction>)
            {
                ActivationOutcome const out = game.abilities_->Activate(actor, act.targets, act.zone);
                log::Debug("P{} activation: {} ({})", static_cast<int>(actor), out.description,
                           out.success ? "ok" : "failed");
                if (!out.success) game.last_violation_ = out.violation;
            }
            else if constexpr (std::is_same_v<T, RevealAction>)
            {
                if (p.Reveal())
                    game.bus_.Publish(CharacterRevealed{actor, p.Character(), p.Alignment(), p.Ability().name});
            }
            else if constexpr (std::is_same_v<T, GiveVisionAction>)
            {
                if (auto const res = game.cards_->GiveVision(actor, act.card_id, act.target); !res)
                    log::Warn("vision failed: {}", error::describe(res.error()));
            }
            else
            {
                s.Progress().zone_used = true;
                if (auto const res = game.cards_->UseZone(actor, act.target, act.choice); !res)
                    log::Warn("zone power failed: {}", error::describe(res.error()));
            }
        }, a);
    }

    auto StandardRules::Advance(GameImpl& game) -> MoveOutcome
    {
        GameSession& s = *game.session_;
        if (!s.IsRunning())
            return s.Status() == SessionStatus::Stalled ? MoveOutcome::Stalled : MoveOutcome::GameEnded;

        // A player who died on their own turn loses the rest of it.
        bool const end = std::exchange(game.turn_end_requested_, false) || !s.CurrentPlayer().IsAlive();
        if (end)
        {
            if (auto const r = game.turns_->EndTurn(); !r)
            {
                game.last_violation_ = r.error();
                return s.Status() == SessionStatus::Stalled ? MoveOutcome::Stalled : MoveOutcome::Invalid;
            }
            return MoveOutcome::TurnEnded;
        }

        if (s.PhaseNow() == Phase::Movement && s.Progress().moved)
        {
            if (auto const r = game.turns_->AdvancePhase(); !r)
            {
                game.last_violation_ = r.error();
                return MoveOutcome::Invalid;
            }
        }
        return MoveOutcome::Applied;
    }
}
