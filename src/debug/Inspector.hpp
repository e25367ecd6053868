//
// Created by Malik T on 19/08/2025.
//

#ifndef SHADOWHUNT_INSPECTOR_HPP
#define SHADOWHUNT_INSPECTOR_HPP

#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Game.hpp"

namespace shadow::core::debug
{
    struct Inspector
    {
        struct PlayerAll
        {
            PlayerId id{};
            int hp{};
            int hp_max{};
            bool alive{};
            bool revealed{};
            std::optional<ZoneId> position{};
            std::vector<Card const*> hand;
            std::vector<Card const*> equipment;
        };

        struct SnapshotAll
        {
            std::array<std::vector<Card const*>, constants::DeckCount> draw;
            std::array<std::vector<Card const*>, constants::DeckCount> discard;
            std::vector<PlayerAll> players;
            uint8_t n_players{};
            Phase phase{};
            PlayerId current{};
            uint32_t turn{};
            SessionStatus status{};
            size_t catalogue_size{};
            size_t dead_recorded{};
        };

        static inline auto Gather(GameSession const& s) -> SnapshotAll
        {
            auto raw = [](std::vector<CardSP> const& src, std::vector<Card const*>& dst)
            {
                dst.reserve(src.size());
                std::ranges::transform(src, std::back_inserter(dst),
                                       [](CardSP const& c) -> Card const* { return c.get(); });
            };

            SnapshotAll ret{};
            ret.n_players = static_cast<uint8_t>(s.players_.size());
            ret.phase = s.phase_;
            ret.current = s.current_;
            ret.turn = s.turn_;
            ret.status = s.status_;
            ret.catalogue_size = CatalogueSize();
            ret.dead_recorded = s.tracking_.deaths.size();

            for (size_t i{}; i < s.decks_.size(); ++i)
            {
                raw(s.decks_[i]->draw_, ret.draw[i]);
                raw(s.decks_[i]->discard_, ret.discard[i]);
            }

            ret.players.reserve(s.players_.size());
            for (Player const& p : s.players_)
            {
                PlayerAll& dst = ret.players.emplace_back();
                dst.id = p.Id();
                dst.hp = p.Hp();
                dst.hp_max = p.HpMax();
                dst.alive = p.IsAlive();
                dst.revealed = p.IsRevealed();
                dst.position = p.Position();
                raw(p.Hand(), dst.hand);
                raw(p.Equipment(), dst.equipment);
            }
            return ret;
        }

        static inline auto Gather(GameImpl const& g) -> SnapshotAll
        {
            return Gather(*g.session_);
        }
    };
}

#endif //SHADOWHUNT_INSPECTOR_HPP
