//
// Created by Malik T on 07/10/2025.
//

#include "WinConditions.hpp"

#include <algorithm>
#include "Log.hpp"

namespace shadow::core
{
    WinEvaluator::WinEvaluator(GameSession& session) :
        session_(session)
    {
    }

    auto WinEvaluator::RegisterKill(std::optional<PlayerId> const killer, PlayerId const victim) -> void
    {
        WinTracking& t = session_.Tracking();
        bool const seen = std::ranges::any_of(t.deaths, [victim](DeathRecord const& d) { return d.victim == victim; });
        if (seen) return;

        std::optional<PlayerId> const credited = (killer && *killer != victim) ? killer : std::nullopt;
        if (!t.first_death) t.first_death = victim;
        if (!t.first_kill && credited) t.first_kill = credited;
        t.deaths.push_back(DeathRecord{victim, credited, session_.Turn()});
    }

    auto WinEvaluator::FactionWinner() const -> std::optional<Faction>
    {
        size_t const hunters = session_.LivingCount(Faction::Hunter);
        size_t const shadows = session_.LivingCount(Faction::Shadow);
        if (shadows == 0 && hunters > 0) return Faction::Hunter;
        if (hunters == 0 && shadows > 0) return Faction::Shadow;
        return std::nullopt;
    }

    auto WinEvaluator::FactionsExtinct() const -> bool
    {
        auto seated = [this](Faction const f)
        {
            return std::ranges::any_of(session_.Players(), [f](Player const& p) { return p.Alignment() == f; });
        };
        return seated(Faction::Hunter) && seated(Faction::Shadow) &&
               session_.LivingCount(Faction::Hunter) == 0 && session_.LivingCount(Faction::Shadow) == 0;
    }

    auto WinEvaluator::IsGameEnding(CharacterId const id) -> bool
    {
        switch (id)
        {
        case CharacterId::Bob:
        case CharacterId::Bryan:
        case CharacterId::Catherine:
        case CharacterId::Charles:
        case CharacterId::David:
            return true;
        default:
            return false;
        }
    }

    auto WinEvaluator::Neighbour(Player const& p) const -> Player const&
    {
        size_t const n = session_.PlayerCount();
        size_t const right = (p.Id() + 1) % n;
        size_t const left = (p.Id() + n - 1) % n;
        return session_.Players()[p.status.capriccio ? left : right];
    }

    auto WinEvaluator::NeutralSatisfied(Player const& p, WinContext const& ctx) const -> bool
    {
        return Satisfied(p, ctx, true);
    }

    auto WinEvaluator::Satisfied(Player const& p, WinContext const& ctx, bool const follow_neighbour) const -> bool
    {
        WinTracking const& t = session_.Tracking();
        PlayerId const me = p.Id();

        switch (p.Character())
        {
        case CharacterId::Allie:
            return ctx.event == WinEvent::GameEnding && p.IsAlive();

        case CharacterId::Bob:
            return p.IsAlive() && p.Equipment().size() >= 5;

        case CharacterId::Charles:
            return ctx.event == WinEvent::Kill && ctx.killer == me && session_.DeadCount() >= 3;

        case CharacterId::Daniel:
            return t.first_kill == me || t.first_death == me;

        case CharacterId::Agnes:
        {
            if (!follow_neighbour) return false;
            Player const& n = Neighbour(p);
            if (n.Id() == me) return false;
            if (n.Alignment() == Faction::Neutral) return Satisfied(n, ctx, false);
            return FactionWinner() == n.Alignment();
        }

        case CharacterId::Bryan:
        {
            bool const big_kill = std::ranges::any_of(t.deaths, [&](DeathRecord const& d)
            {
                Player const* v = session_.PlayerAt(d.victim);
                return d.killer == me && v != nullptr && v->HpMax() >= 13;
            });
            bool const at_altar = ctx.event == WinEvent::GameEnding && p.IsAlive() &&
                                  p.Position() == ZoneId::ErstwhileAltar;
            return big_kill || at_altar;
        }

        case CharacterId::Catherine:
            return t.first_death == me || (p.IsAlive() && session_.LivingCount() <= 2);

        case CharacterId::David:
            return p.IsAlive() && p.HolyRelicCount() >= 3;

        case CharacterId::Emi:
        case CharacterId::Franklin:
        case CharacterId::George:
        case CharacterId::Ellen:
        case CharacterId::Fuka:
        case CharacterId::Gregor:
        case CharacterId::Unknown:
        case CharacterId::Vampire:
        case CharacterId::Werewolf:
        case CharacterId::UltraSoul:
        case CharacterId::Valkyrie:
        case CharacterId::Wight:
            log::Warn("{} has no individual win condition, using 'alive'", to_string(p.Character()));
            return p.IsAlive();
        }

        log::Warn("no win condition for character id {}, using 'alive'", static_cast<int>(p.Character()));
        return p.IsAlive();
    }

    auto WinEvaluator::CheckWinConditions(WinContext const& ctx) const -> WinResult
    {
        WinResult res{};
        std::optional<Faction> const faction = FactionWinner();

        std::vector<PlayerId> satisfied;
        bool neutral_ends{false};
        for (Player const& p : session_.Players())
        {
            if (p.Alignment() != Faction::Neutral || !NeutralSatisfied(p, ctx)) continue;
            satisfied.push_back(p.Id());
            neutral_ends |= IsGameEnding(p.Character());
        }

        res.game_over = faction.has_value() || neutral_ends || FactionsExtinct();
        if (!res.game_over) return res;

        res.faction = faction;
        WinContext const ending{WinEvent::GameEnding, ctx.killer, ctx.victim};
        for (Player const& p : session_.Players())
        {
            bool const member = faction && p.Alignment() == *faction;
            bool const neutral = p.Alignment() == Faction::Neutral &&
                                 (std::ranges::find(satisfied, p.Id()) != std::end(satisfied) ||
                                  NeutralSatisfied(p, ending));
            if (member || neutral) res.winners.push_back(p.Id());
        }
        return res;
    }
}
