//
// Created by Malik T on 03/10/2025.
//

#ifndef SHADOWHUNT_SESSION_HPP
#define SHADOWHUNT_SESSION_HPP

#include <array>
#include <memory>
#include <optional>
#include <random>
#include <vector>
#include "Board.hpp"
#include "Deck.hpp"
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace shadow::core
{
    namespace debug {struct Inspector;}

    struct DeathRecord
    {
        PlayerId victim{};
        std::optional<PlayerId> killer{};
        uint32_t turn{};
    };

    // Append-only for the lifetime of one session.
    struct WinTracking
    {
        std::optional<PlayerId> first_kill{};
        std::optional<PlayerId> first_death{};
        std::vector<DeathRecord> deaths{};
    };

    // Progress of the current player's turn; reset whenever a turn starts.
    struct TurnState
    {
        bool rolled{false};
        std::optional<uint8_t> movement_roll{};
        bool moved{false};
        bool drawn{false};
        bool attacked{false};
        bool zone_used{false};
    };

    // All mutable state of one game. Created at setup, discarded for a new game.
    class GameSession
    {
    public:
        GameSession(std::vector<Player> players, uint64_t seed, DeckLookup deck_lookup = board::StandardDecks);

        GameSession(GameSession const&) = delete;
        auto operator=(GameSession const&) -> GameSession& = delete;

        // nullptr for ids outside the table
        auto PlayerAt(PlayerId id) -> Player*;
        auto PlayerAt(PlayerId id) const -> Player const*;
        auto Players() noexcept -> std::vector<Player>& { return players_; }
        auto Players() const noexcept -> std::vector<Player> const& { return players_; }
        auto PlayerCount() const noexcept -> size_t { return players_.size(); }
        auto CurrentPlayer() -> Player& { return players_[current_]; }
        auto CurrentPlayer() const -> Player const& { return players_[current_]; }

        auto DeckOf(DeckKind kind) -> Deck& { return *decks_[static_cast<size_t>(kind)]; }
        auto DeckOf(DeckKind kind) const -> Deck const& { return *decks_[static_cast<size_t>(kind)]; }
        auto DecksAt(ZoneId zone) const -> std::vector<DeckKind>;
        // Returns the card to the discard pile of the deck it came from.
        auto DiscardCard(CardSP card) -> void;

        auto PhaseNow() const noexcept -> Phase { return phase_; }
        auto SetPhase(Phase p) noexcept -> void { phase_ = p; }
        auto Current() const noexcept -> PlayerId { return current_; }
        auto SetCurrent(PlayerId p) -> void;
        auto Turn() const noexcept -> uint32_t { return turn_; }
        auto IncrementTurn() noexcept -> void { ++turn_; }

        auto Progress() noexcept -> TurnState& { return turn_state_; }
        auto Progress() const noexcept -> TurnState const& { return turn_state_; }
        auto ResetProgress() noexcept -> void { turn_state_ = TurnState{}; }

        auto ExtraTurns() const noexcept -> uint8_t { return extra_turns_; }
        auto GrantExtraTurns(uint8_t n) noexcept -> void { extra_turns_ = static_cast<uint8_t>(extra_turns_ + n); }
        auto ConsumeExtraTurn() noexcept -> bool;
        auto ClearExtraTurns() noexcept -> void { extra_turns_ = 0; }

        auto Tracking() noexcept -> WinTracking& { return tracking_; }
        auto Tracking() const noexcept -> WinTracking const& { return tracking_; }

        auto Status() const noexcept -> SessionStatus { return status_; }
        auto SetStatus(SessionStatus s) noexcept -> void { status_ = s; }
        auto IsRunning() const noexcept -> bool { return status_ == SessionStatus::Running; }
        auto Finish(std::optional<Faction> faction, std::vector<PlayerId> winners) -> void;
        auto Winners() const noexcept -> std::vector<PlayerId> const& { return winners_; }
        auto WinningFaction() const noexcept -> std::optional<Faction> { return winning_faction_; }

        auto LivingCount() const -> size_t;
        auto LivingCount(Faction f) const -> size_t;
        auto DeadCount() const -> size_t { return players_.size() - LivingCount(); }

        auto Rng() noexcept -> std::mt19937_64& { return rng_; }

        auto SnapshotFor(PlayerId seat) const -> std::shared_ptr<GameSnapshot const>;

        friend struct debug::Inspector;

    private:
        std::vector<Player> players_;
        std::array<std::unique_ptr<Deck>, constants::DeckCount> decks_;
        DeckLookup deck_lookup_;
        std::mt19937_64 rng_;

        Phase phase_{Phase::Movement};
        PlayerId current_{0};
        uint32_t turn_{1};
        TurnState turn_state_{};
        uint8_t extra_turns_{0};

        WinTracking tracking_{};
        SessionStatus status_{SessionStatus::Running};
        std::optional<Faction> winning_faction_{};
        std::vector<PlayerId> winners_{};
    };
}

#endif //SHADOWHUNT_SESSION_HPP
