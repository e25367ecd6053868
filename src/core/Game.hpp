//
// Created by Malik T on 15/08/2025.
//

#ifndef SHADOWHUNT_GAME_HPP
#define SHADOWHUNT_GAME_HPP

#include <memory>
#include <optional>
#include <random>
#include <vector>
#include "Abilities.hpp"
#include "Actions.hpp"
#include "Agent.hpp"
#include "CardEffects.hpp"
#include "Combat.hpp"
#include "Dice.hpp"
#include "Events.hpp"
#include "Judge.hpp"
#include "Rules.hpp"
#include "Session.hpp"
#include "State.hpp"
#include "TurnOrchestrator.hpp"
#include "Types.hpp"
#include "WinConditions.hpp"

namespace shadow::core::debug {struct Inspector;}
namespace shadow::core
{
    // Owns one session and every component acting on it. Only Submit mutates.
    class GameImpl
    {
    public:
        // Repeated rejections from the same seat end its turn.
        static constexpr uint32_t MaxInvalidStreak = 8;
        // Applied actions per turn before the turn is ended for the agent.
        static constexpr uint32_t MaxActionsPerTurn = 32;

        GameImpl() = delete;
        // agents may be empty when the caller drives the game through Submit only.
        // dice defaults to RngDice seeded from the config.
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Agent>> agents,
                 std::unique_ptr<Dice> dice = nullptr);
        ~GameImpl();

        GameImpl(GameImpl const&) = delete;
        auto operator=(GameImpl const&) -> GameImpl& = delete;

        // One state-machine step: ask current actor for an action, then Submit it.
        auto Step() -> MoveOutcome;
        // validate -> apply -> propagate -> win check -> advance
        auto Submit(PlayerId actor, PlayerAction const& action) -> MoveOutcome;
        auto SnapshotFor(PlayerId seat) const -> std::shared_ptr<GameSnapshot const>;

        auto LastViolation() const noexcept -> std::optional<error::RuleViolation> const& { return last_violation_; }
        auto IsOver() const noexcept -> bool { return !session_->IsRunning(); }

        auto Session() noexcept -> GameSession& { return *session_; }
        auto Session() const noexcept -> GameSession const& { return *session_; }
        auto Bus() noexcept -> EventBus& { return bus_; }
        auto Combat() noexcept -> CombatResolver& { return *combat_; }
        auto Abilities() noexcept -> AbilitySystem& { return *abilities_; }
        auto Cards() noexcept -> CardResolver& { return *cards_; }
        auto Wins() noexcept -> WinEvaluator& { return *wins_; }
        auto Wins() const noexcept -> WinEvaluator const& { return *wins_; }
        auto Turns() noexcept -> TurnOrchestrator& { return *turns_; }
        auto Cfg() const noexcept -> Config const& { return cfg_; }

        auto Current() const noexcept -> PlayerId { return session_->Current(); }
        auto PhaseNow() const noexcept -> Phase { return session_->PhaseNow(); }
        auto PlayerCount() const noexcept -> size_t { return session_->PlayerCount(); }
        auto AgentAt(PlayerId seat) -> Agent*;

        // Evaluates every death/equipment change queued since the last call.
        // Returns true once the game is over.
        auto ResolvePendingWins() -> bool;

        // Standard split per table size, or the explicit list from the config.
        static auto DealCharacters(Config const& config, std::mt19937_64& rng) -> std::vector<CharacterId>;

        //allows class to directly access private data on an instance
        friend class StandardRules;
        friend struct debug::Inspector;

    private:
        auto OnRulesEvent(GameEvent const& ev) -> void;
        auto Finish(WinResult const& result) -> void;
        auto StatusOutcome() const -> MoveOutcome;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::vector<std::unique_ptr<Agent>> agents_;

        EventBus bus_;
        std::unique_ptr<GameSession> session_;
        std::unique_ptr<Dice> dice_;
        std::unique_ptr<CombatResolver> combat_;
        EventBus::SubscriptionId win_sub_{};
        std::unique_ptr<AbilitySystem> abilities_;
        std::unique_ptr<CardResolver> cards_;
        std::unique_ptr<WinEvaluator> wins_;
        std::unique_ptr<TurnOrchestrator> turns_;
        std::shared_ptr<Judge> judge_;

        std::vector<WinContext> pending_wins_;
        std::optional<error::RuleViolation> last_violation_;
        bool turn_end_requested_{false}; // set by Apply(EndTurn)
        PlayerId streak_actor_{};
        uint32_t invalid_streak_{0};
        uint32_t actions_this_turn_{0};
    };
}
#endif //SHADOWHUNT_GAME_HPP
