//
// Created by Malik T on 03/10/2025.
//

#include "Board.hpp"

#include <cstdlib>

namespace shadow::core::board
{
    auto Distance(std::optional<ZoneId> const from, ZoneId const to) -> int
    {
        int const dst = static_cast<int>(to);
        int const src = from ? static_cast<int>(*from) : -1;
        return std::abs(dst - src);
    }

    auto StandardDecks(ZoneId const zone) -> std::vector<DeckKind>
    {
        switch (zone)
        {
        case ZoneId::HermitsCabin: return {DeckKind::Vision};
        case ZoneId::UnderworldGate: return {DeckKind::Light, DeckKind::Dark, DeckKind::Vision};
        case ZoneId::Church: return {DeckKind::Light};
        case ZoneId::Cemetery: return {DeckKind::Dark};
        case ZoneId::WeirdWoods:
        case ZoneId::ErstwhileAltar:
            return {};
        }
        return {};
    }

    auto HasZonePower(ZoneId const zone) -> bool
    {
        return zone == ZoneId::WeirdWoods || zone == ZoneId::ErstwhileAltar;
    }
}
