//
// Created by Malik T on 03/10/2025.
//

#ifndef SHADOWHUNT_BOARD_HPP
#define SHADOWHUNT_BOARD_HPP

#include <array>
#include <functional>
#include <optional>
#include <vector>
#include "Types.hpp"

namespace shadow::core
{
    // Supplied by the board configuration: which decks may be drawn from in a zone.
    using DeckLookup = std::function<std::vector<DeckKind>(ZoneId)>;
}

namespace shadow::core::board
{
    inline constexpr size_t AreaCount = 3;

    // Zones pair up into areas: (0,1), (2,3), (4,5).
    inline auto AreaOf(ZoneId const z) -> uint8_t
    {
        return static_cast<uint8_t>(static_cast<uint8_t>(z) / 2);
    }

    inline auto SameArea(ZoneId const a, ZoneId const b) -> bool
    {
        return AreaOf(a) == AreaOf(b);
    }

    inline auto ZonesInArea(uint8_t const area) -> std::array<ZoneId, 2>
    {
        return {static_cast<ZoneId>(area * 2), static_cast<ZoneId>(area * 2 + 1)};
    }

    // Track distance. A player not yet on the board stands one step before zone 0.
    auto Distance(std::optional<ZoneId> from, ZoneId to) -> int;

    auto StandardDecks(ZoneId zone) -> std::vector<DeckKind>;

    // Weird Woods and Erstwhile Altar act instead of a deck.
    auto HasZonePower(ZoneId zone) -> bool;
}

#endif //SHADOWHUNT_BOARD_HPP
