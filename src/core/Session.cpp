//
// Created by Malik T on 03/10/2025.
//

#include "Session.hpp"

#include <algorithm>
#include <utility>
#include "Exception.hpp"

namespace shadow::core
{
    GameSession::GameSession(std::vector<Player> players, uint64_t const seed, DeckLookup deck_lookup) :
        players_(std::move(players)),
        deck_lookup_(std::move(deck_lookup)),
        rng_{seed}
    {
        SHD_ASSERT(players_.size() >= constants::MinPlayers, "Less than 2 players while initialising session");
        SHD_ASSERT(players_.size() <= constants::MaxPlayers, "Too many players for one table");
        for (size_t i{}; i < players_.size(); ++i)
        {
            SHD_ASSERT(players_[i].Id() == i, "Player ids must match their seat");
        }
        SHD_ASSERT(static_cast<bool>(deck_lookup_), "Missing deck lookup");

        uint16_t next_id{1};
        for (DeckKind const kind : {DeckKind::Light, DeckKind::Dark, DeckKind::Vision})
        {
            auto& slot = decks_[static_cast<size_t>(kind)];
            slot = std::make_unique<Deck>(kind, BuildDeckCards(kind, next_id));
            slot->Shuffle(rng_);
        }
    }

    auto GameSession::PlayerAt(PlayerId const id) -> Player*
    {
        return id < players_.size() ? &players_[id] : nullptr;
    }

    auto GameSession::PlayerAt(PlayerId const id) const -> Player const*
    {
        return id < players_.size() ? &players_[id] : nullptr;
    }

    auto GameSession::DecksAt(ZoneId const zone) const -> std::vector<DeckKind>
    {
        return deck_lookup_(zone);
    }

    auto GameSession::DiscardCard(CardSP card) -> void
    {
        SHD_ASSERT(card != nullptr, "Discarding a null card");
        DeckOf(card->deck).Discard(std::move(card));
    }

    auto GameSession::SetCurrent(PlayerId const p) -> void
    {
        SHD_ASSERT(p < players_.size(), "Current player out of range");
        current_ = p;
    }

    auto GameSession::ConsumeExtraTurn() noexcept -> bool
    {
        if (extra_turns_ == 0) return false;
        --extra_turns_;
        return true;
    }

    auto GameSession::Finish(std::optional<Faction> const faction, std::vector<PlayerId> winners) -> void
    {
        status_ = SessionStatus::Finished;
        winning_faction_ = faction;
        winners_ = std::move(winners);
    }

    auto GameSession::LivingCount() const -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(players_, [](Player const& p) { return p.IsAlive(); }));
    }

    auto GameSession::LivingCount(Faction const f) const -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(players_, [f](Player const& p)
        {
            return p.IsAlive() && p.Alignment() == f;
        }));
    }

    //helpers for snapshotfor
    template <typename T>
    static auto Shared_to_weak(std::vector<std::shared_ptr<T>> const& vec)
        -> std::vector<std::weak_ptr<T>>
    {
        return std::vector<std::weak_ptr<T>>(vec.cbegin(), vec.cend());
    }

    auto GameSession::SnapshotFor(PlayerId const seat) const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->seat = seat;
        snap->n_players = static_cast<uint8_t>(players_.size());
        snap->phase = phase_;
        snap->current = current_;
        snap->turn = turn_;
        snap->status = status_;

        snap->players.reserve(players_.size());
        for (Player const& p : players_)
        {
            PlayerView v{};
            v.id = p.Id();
            v.name = p.Name();
            v.is_bot = p.IsBot();
            v.hp = p.Hp();
            v.hp_max = p.HpMax();
            v.alive = p.IsAlive();
            v.revealed = p.IsRevealed();
            v.position = p.Position();
            v.equipment = Shared_to_weak(p.Equipment());
            v.hand_count = static_cast<uint8_t>(p.Hand().size());
            if (p.IsRevealed() || p.Id() == seat)
            {
                v.character = p.Character();
                v.faction = p.Alignment();
                v.ability_used = p.AbilityUsed();
                v.ability_disabled = p.AbilityDisabled();
            }
            snap->players.push_back(std::move(v));
        }

        if (Player const* me = PlayerAt(seat))
        {
            snap->my_hand = Shared_to_weak(me->Hand());
        }

        snap->rolled = turn_state_.rolled;
        snap->movement_roll = turn_state_.movement_roll;
        snap->moved = turn_state_.moved;
        snap->drawn = turn_state_.drawn;
        snap->attacked = turn_state_.attacked;
        snap->zone_used = turn_state_.zone_used;

        snap->winning_faction = winning_faction_;
        snap->winners = winners_;
        return snap;
    }
}
