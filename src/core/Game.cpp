//
// Created by Malik T on 15/08/2025.
//
#include "Game.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <utility>
#include "Log.hpp"

namespace shadow::core
{
    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::unique_ptr<Agent>> agents,
                       std::unique_ptr<Dice> dice) :
        cfg_(config),
        rules_(std::move(rules)),
        agents_(std::move(agents)),
        dice_(std::move(dice)),
        judge_(std::make_shared<Judge>())
    {
        SHD_ASSERT(rules_ != nullptr, "Missing rules while initialising core");
        if (cfg_.n_players < constants::MinPlayers || cfg_.n_players > constants::MaxPlayers)
        {
            auto const clamped = std::clamp<uint32_t>(cfg_.n_players, constants::MinPlayers, constants::MaxPlayers);
            log::Warn("{} players is not a valid table, using {}", cfg_.n_players, clamped);
            cfg_.n_players = clamped;
        }
        SHD_ASSERT(agents_.empty() || agents_.size() == cfg_.n_players, "Agent count does not match the table");
        SHD_ASSERT(!std::ranges::any_of(agents_,
                                        [](std::unique_ptr<Agent> const& a) { return !a; }), "Invalid agent in core");

        std::mt19937_64 deal_rng{cfg_.seed};
        std::vector<CharacterId> const cast = DealCharacters(cfg_, deal_rng);

        std::vector<Player> players;
        players.reserve(cast.size());
        for (size_t i{}; i < cast.size(); ++i)
        {
            CharacterInfo const* info = FindCharacter(cast[i]);
            SHD_ASSERT(info != nullptr, "Dealt a character missing from the roster");
            bool const bot = i < cfg_.bot_seats.size() && cfg_.bot_seats[i];
            players.emplace_back(static_cast<PlayerId>(i), std::format("P{}", i), bot, *info);
        }

        session_ = std::make_unique<GameSession>(std::move(players), cfg_.seed ^ 0x9E3779B97F4A7C15ULL);
        if (!dice_) dice_ = std::make_unique<RngDice>(cfg_.seed + 1);
        combat_ = std::make_unique<CombatResolver>(*session_, bus_, *dice_);
        // Deaths are booked before any ability reacts to them.
        win_sub_ = bus_.Subscribe([this](GameEvent const& ev) { OnRulesEvent(ev); }, Channel::Rules);
        abilities_ = std::make_unique<AbilitySystem>(*session_, bus_, *combat_, *dice_);
        cards_ = std::make_unique<CardResolver>(*session_, bus_, *combat_, *dice_);
        wins_ = std::make_unique<WinEvaluator>(*session_);
        turns_ = std::make_unique<TurnOrchestrator>(*session_, bus_);

        abilities_->RegisterAll();
        if (auto const started = turns_->Start(); !started) last_violation_ = started.error();
        (void)ResolvePendingWins();
    }

    GameImpl::~GameImpl()
    {
        bus_.Unsubscribe(win_sub_);
    }

    auto GameImpl::DealCharacters(Config const& config, std::mt19937_64& rng) -> std::vector<CharacterId>
    {
        size_t const n = config.n_players;
        SHD_ASSERT(n >= constants::MinPlayers && n <= constants::MaxPlayers, "Table size out of range");

        if (!config.characters.empty())
        {
            std::vector<CharacterId> sorted = config.characters;
            std::ranges::sort(sorted);
            bool const fits = config.characters.size() == n &&
                              std::ranges::adjacent_find(sorted) == std::end(sorted) &&
                              std::ranges::all_of(sorted, [](CharacterId const c) { return FindCharacter(c) != nullptr; });
            if (fits) return config.characters;
            log::Warn("explicit character list does not fit {} seats, dealing the standard split", n);
        }

        struct Split
        {
            uint8_t hunters, shadows, neutrals;
        };
        static constexpr std::array<Split, constants::MaxPlayers + 1> Splits{{
            {0, 0, 0}, {0, 0, 0}, {1, 1, 0}, {1, 1, 1}, {2, 2, 0}, {2, 2, 1}, {2, 2, 2}, {2, 2, 3}, {3, 3, 2}
        }};
        Split const split = Splits[n];

        std::vector<CharacterId> out;
        out.reserve(n);
        auto take = [&](Faction const f, uint8_t const count)
        {
            std::vector<CharacterId> pool;
            for (CharacterInfo const& c : Roster())
            {
                if (c.faction == f) pool.push_back(c.id);
            }
            std::ranges::shuffle(pool, rng);
            out.insert(std::end(out), std::begin(pool), std::begin(pool) + count);
        };
        take(Faction::Hunter, split.hunters);
        take(Faction::Shadow, split.shadows);
        take(Faction::Neutral, split.neutrals);

        std::ranges::shuffle(out, rng);
        return out;
    }

    auto GameImpl::AgentAt(PlayerId const seat) -> Agent*
    {
        return seat < agents_.size() ? agents_[seat].get() : nullptr;
    }

    auto GameImpl::SnapshotFor(PlayerId const seat) const -> std::shared_ptr<GameSnapshot const>
    {
        return session_->SnapshotFor(seat);
    }

    auto GameImpl::OnRulesEvent(GameEvent const& ev) -> void
    {
        std::visit([&]<typename T0>(T0 const& e)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayerDied>)
            {
                wins_->RegisterKill(e.killer, e.victim);
                pending_wins_.push_back(WinContext{WinEvent::Kill, e.killer, e.victim});
            }
            else if constexpr (std::is_same_v<T, EquipmentChanged>)
            {
                pending_wins_.push_back(WinContext{});
            }
        }, ev);
    }

    auto GameImpl::ResolvePendingWins() -> bool
    {
        if (!session_->IsRunning())
        {
            pending_wins_.clear();
            return session_->Status() == SessionStatus::Finished;
        }

        while (!pending_wins_.empty())
        {
            WinContext const ctx = pending_wins_.front();
            pending_wins_.erase(std::begin(pending_wins_));

            WinResult const res = wins_->CheckWinConditions(ctx);
            if (res.game_over)
            {
                pending_wins_.clear();
                Finish(res);
                return true;
            }
        }
        return false;
    }

    auto GameImpl::Finish(WinResult const& result) -> void
    {
        session_->Finish(result.faction, result.winners);

        std::string ids;
        for (PlayerId const p : result.winners)
        {
            ids += std::format("{}P{}", ids.empty() ? "" : ",", static_cast<int>(p));
        }
        log::Info("game over at turn {}: faction={} winners=[{}]", session_->Turn(),
                  result.faction ? to_string(*result.faction) : "none", ids);
        bus_.Publish(GameOver{result.faction, result.winners});
    }

    auto GameImpl::StatusOutcome() const -> MoveOutcome
    {
        switch (session_->Status())
        {
        case SessionStatus::Finished: return MoveOutcome::GameEnded;
        case SessionStatus::Stalled: return MoveOutcome::Stalled;
        case SessionStatus::Running: return MoveOutcome::Invalid;
        }
        return MoveOutcome::Invalid;
    }

    auto GameImpl::Submit(PlayerId const actor, PlayerAction const& action) -> MoveOutcome
    {
        if (!session_->IsRunning())
        {
            last_violation_ = error::Viol(error::RuleViolationCode::SessionNotRunning).with_actor(actor);
            return StatusOutcome();
        }

        if (auto const ok = rules_->Validate(*this, actor, action); !ok.has_value())
        {
            log::Info("P{} rejected: {}", static_cast<int>(actor), error::describe(ok.error()));
            last_violation_ = ok.error();
            return MoveOutcome::Invalid;
        }
        last_violation_.reset();

        rules_->Apply(*this, actor, action);
        ++actions_this_turn_;
        if (ResolvePendingWins()) return MoveOutcome::GameEnded;

        MoveOutcome const m = rules_->Advance(*this);
        if (ResolvePendingWins()) return MoveOutcome::GameEnded;
        if (m == MoveOutcome::TurnEnded) actions_this_turn_ = 0;
        return m;
    }

    auto GameImpl::Step() -> MoveOutcome
    {
        if (IsOver()) return StatusOutcome();

        PlayerId const actor = session_->Current();
        TimedDecision const dec = judge_->GetAction(*this, actor);
        PlayerAction action = dec.action;

        if (actor != streak_actor_)
        {
            streak_actor_ = actor;
            invalid_streak_ = 0;
        }
        if (invalid_streak_ >= MaxInvalidStreak || actions_this_turn_ >= MaxActionsPerTurn)
        {
            log::Warn("P{} is not making progress, ending its turn", static_cast<int>(actor));
            action = EndTurnAction{};
        }

        MoveOutcome const m = Submit(actor, action);
        invalid_streak_ = (m == MoveOutcome::Invalid) ? invalid_streak_ + 1 : 0;
        return m;
    }
}
