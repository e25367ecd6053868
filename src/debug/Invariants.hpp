//
// Created by Malik T on 19/08/2025.
//

#ifndef SHADOWHUNT_INVARIANTS_HPP
#define SHADOWHUNT_INVARIANTS_HPP

#include "../core/Game.hpp"
#include "../core/OmegaException.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <format>
#include <ranges>
#include <unordered_set>
#include <vector>

namespace shadow::core::debug
{
    // A second layer of checks run between steps. Any broken invariant throws an AssertionError.
    inline auto CheckInvariants(GameImpl const& g) -> void
    {
#if SHD_ENABLE_TEST_HOOKS == false
        (void)g;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(g);

    // 1) Hit points stay within [0, hp_max]; the living have some left
    for (Inspector::PlayerAll const& p : s.players)
    {
        SHD_ASSERT(p.hp >= 0 && p.hp <= p.hp_max, std::format("P{} hp {} outside [0,{}]",
                   static_cast<int>(p.id), p.hp, p.hp_max));
        SHD_ASSERT(!p.alive || p.hp > 0, std::format("P{} alive at 0 hp", static_cast<int>(p.id)));
    }

    // 2) Every dead character has been revealed and recorded
    {
        size_t dead = 0;
        for (Inspector::PlayerAll const& p : s.players)
        {
            if (p.alive) continue;
            ++dead;
            SHD_ASSERT(p.revealed, std::format("P{} died unrevealed", static_cast<int>(p.id)));
        }
        SHD_ASSERT(dead == s.dead_recorded, "Death records out of sync with the table");
    }

    // 3) A running session always has a living current player at the start of a step
    if (s.status == SessionStatus::Running)
    {
        SHD_ASSERT(s.current < s.n_players, "Current seat outside the table");
        SHD_ASSERT(s.players[s.current].alive, "Running session handed the turn to a dead seat");
    }

    // 4) Deep: no card in two places, and every catalogue card is somewhere
    {
        std::unordered_set<Card const*> seen;
        util::CardUniqueChecker ids;
        seen.reserve(s.catalogue_size);

        auto push_unique = [&](Card const* p)
        {
            if (!p) return;
            bool const inserted = seen.insert(p).second;
            SHD_ASSERT(inserted, "Duplicate card pointer across zones");
            ids.Add(*p);
        };

        for (auto const& pile : s.draw) for (auto const p : pile) push_unique(p);
        for (auto const& pile : s.discard) for (auto const p : pile) push_unique(p);
        for (auto const& pl : s.players)
        {
            for (auto const p : pl.hand) push_unique(p);
            for (auto const p : pl.equipment) push_unique(p);
        }

        SHD_ASSERT(!ids.ContainsDup(), "Two cards share an id");
        SHD_ASSERT(seen.size() == s.catalogue_size, "Materialized card count != catalogue size");
    }

#endif // SHD_ENABLE_TEST_HOOKS == true
    }
}
#endif //SHADOWHUNT_INVARIANTS_HPP
