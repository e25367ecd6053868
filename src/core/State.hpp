//
// Created by Malik T on 14/08/2025.
//

#ifndef SHADOWHUNT_STATE_HPP
#define SHADOWHUNT_STATE_HPP

#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "Types.hpp"

namespace shadow::core
{
    // What everybody at the table can see about one player (non-owning).
    struct PlayerView
    {
        PlayerId id{};
        std::string name;
        bool is_bot{false};
        int hp{};
        int hp_max{};
        bool alive{true};
        bool revealed{false};
        std::optional<ZoneId> position{};
        std::vector<CardWP> equipment;
        uint8_t hand_count{};

        // Only filled for revealed players and for the viewer's own seat.
        std::optional<CharacterId> character{};
        std::optional<Faction> faction{};
        bool ability_used{false};
        bool ability_disabled{false};
    };

    // Immutable snapshot exposed to agents, UI and network (non-owning)
    struct GameSnapshot
    {
        PlayerId seat{};
        uint8_t n_players{};
        Phase phase{Phase::Movement};
        PlayerId current{};
        uint32_t turn{};
        SessionStatus status{SessionStatus::Running};

        std::vector<PlayerView> players;
        std::vector<CardWP> my_hand;

        // Current player's turn progress
        bool rolled{false};
        std::optional<uint8_t> movement_roll{};
        bool moved{false};
        bool drawn{false};
        bool attacked{false};
        bool zone_used{false};

        std::optional<Faction> winning_faction{};
        std::vector<PlayerId> winners;
    };

} // namespace shadow::core

#endif //SHADOWHUNT_STATE_HPP
