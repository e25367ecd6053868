//
// Created by Malik T on 18/08/2025.
//

#include "RandomAi.hpp"
#include <algorithm>
#include <random>
#include <utility>

#include "Board.hpp"
#include "Characters.hpp"
#include "Exception.hpp"
#include "Util.hpp"

namespace shadow::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(rng_seed) {}

    using namespace shadow::core;

    auto RandomAI::Play(std::shared_ptr<const GameSnapshot> snapshot, std::chrono::steady_clock::time_point deadline)
        -> shadow::core::PlayerAction
    {
        (void)deadline;

        if (snapshot->status != SessionStatus::Running || snapshot->current != snapshot->seat)
        {
            return EndTurnAction{};
        }
        if (snapshot->phase == Phase::Movement)
        {
            return MovementMove(*snapshot);
        }
        if (snapshot->phase == Phase::Action)
        {
            return ActionMove(*snapshot);
        }
        return EndTurnAction{};
    }

    static inline auto Me(GameSnapshot const& s) -> PlayerView const&
    {
        return s.players[s.seat];
    }

    static inline auto HasEffect(PlayerView const& p, EffectKind const kind) -> bool
    {
        return std::ranges::any_of(p.equipment, [kind](CardWP const& c)
        {
            CardSP const card = c.lock();
            return card && card->effect.kind == kind;
        });
    }

    auto RandomAI::MovementMove(GameSnapshot const& s) -> PlayerAction
    {
        if (!s.rolled || !s.movement_roll) return RollMoveAction{};

        PlayerView const& me = Me(s);
        std::vector<ZoneId> reachable;
        for (size_t z{}; z < constants::ZoneCount; ++z)
        {
            auto const zone = static_cast<ZoneId>(z);
            if (me.position == zone) continue;
            if (board::Distance(me.position, zone) <= *s.movement_roll) reachable.push_back(zone);
        }
        if (reachable.empty()) return EndTurnAction{};
        return MoveAction{reachable[pick(reachable)]};
    }

    auto RandomAI::ActionMove(GameSnapshot const& s) -> PlayerAction
    {
        SHD_ASSERT(!shadow::core::util::any_invalid(std::span{s.my_hand}), "No cards in hand should be invalid");
        PlayerView const& me = Me(s);

        if (!s.drawn && me.position)
        {
            std::vector<DeckKind> const decks = board::StandardDecks(*me.position);
            if (!decks.empty()) return DrawAction{decks[pick(decks)]};
        }

        if (!s.attacked && me.position)
        {
            bool const long_range = HasEffect(me, EffectKind::ExtendedRange);
            std::vector<PlayerId> targets;
            for (PlayerView const& p : s.players)
            {
                if (p.id == me.id || !p.alive || !p.position) continue;
                bool const same_area = board::SameArea(*me.position, *p.position);
                if (long_range != same_area) targets.push_back(p.id);
            }
            if (!targets.empty()) return AttackAction{targets[pick(targets)]};
        }

        std::vector<PlayerAction> const extras = Extras(s);
        // End the turn about two times in three so a bot does not loop on extras.
        if (extras.empty() || std::uniform_int_distribution<int>{0, 2}(rng_) != 0) return EndTurnAction{};
        return extras[pick(extras)];
    }

    auto RandomAI::Extras(GameSnapshot const& s) -> std::vector<PlayerAction>
    {
        PlayerView const& me = Me(s);
        std::vector<PlayerAction> out;

        std::vector<PlayerId> others;
        std::vector<PlayerId> equipped;
        for (PlayerView const& p : s.players)
        {
            if (p.id == me.id || !p.alive) continue;
            others.push_back(p.id);
            if (!p.equipment.empty()) equipped.push_back(p.id);
        }

        if (!others.empty())
        {
            for (CardWP const& c : s.my_hand)
            {
                CardSP const card = c.lock();
                if (card && card->type == CardType::Vision)
                    out.emplace_back(GiveVisionAction{card->id, others[pick(others)]});
            }
        }

        if (!s.zone_used && me.position == ZoneId::WeirdWoods)
        {
            out.emplace_back(UseZoneAction{me.id, ZoneChoice::Heal});
            if (!others.empty()) out.emplace_back(UseZoneAction{others[pick(others)], ZoneChoice::Damage});
        }
        if (!s.zone_used && me.position == ZoneId::ErstwhileAltar && !equipped.empty())
        {
            out.emplace_back(UseZoneAction{equipped[pick(equipped)], ZoneChoice::Steal});
        }

        if (!me.revealed) out.emplace_back(RevealAction{});

        CharacterInfo const* info = me.character ? FindCharacter(*me.character) : nullptr;
        bool const usable = info != nullptr &&
                            info->ability.kind == AbilityKind::Active &&
                            !me.ability_disabled &&
                            !(info->ability.usage == UsagePolicy::Once && me.ability_used) &&
                            (!info->ability.requires_reveal || me.revealed);
        if (usable)
        {
            switch (info->id)
            {
            case CharacterId::Franklin:
            case CharacterId::George:
            case CharacterId::Ellen:
            case CharacterId::Fuka:
                if (!others.empty()) out.emplace_back(ActivateAbilityAction{{others[pick(others)]}, std::nullopt});
                break;
            case CharacterId::Charles:
                if (s.attacked && me.hp > 2 && !others.empty())
                    out.emplace_back(ActivateAbilityAction{{others[pick(others)]}, std::nullopt});
                break;
            case CharacterId::Gregor:
            case CharacterId::Wight:
            case CharacterId::Allie:
            case CharacterId::David:
                out.emplace_back(ActivateAbilityAction{{}, std::nullopt});
                break;
            default:
                // Teleport replaces the roll, the movement phase is already over here.
                break;
            }
        }
        return out;
    }
}
