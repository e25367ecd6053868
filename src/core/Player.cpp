//
// Created by Malik T on 02/10/2025.
//

#include "Player.hpp"

#include <algorithm>
#include <utility>
#include "Exception.hpp"

namespace shadow::core
{
    Player::Player(PlayerId const id, std::string name, bool const is_bot, CharacterInfo const& info) :
        id_(id),
        name_(std::move(name)),
        is_bot_(is_bot),
        character_(info.id),
        faction_(info.faction),
        ability_(info.ability),
        hp_(info.hp_max),
        hp_max_(info.hp_max)
    {
        SHD_ASSERT(hp_max_ > 0, "Character without hit points");
    }

    auto Player::Heal(int const amount) -> int
    {
        if (!alive_ || amount <= 0) return 0;
        int const before = hp_;
        hp_ = std::min(hp_max_, hp_ + amount);
        return hp_ - before;
    }

    auto Player::Wound(int const amount) -> int
    {
        if (amount <= 0) return 0;
        int const before = hp_;
        hp_ = std::max(0, hp_ - amount);
        return before - hp_;
    }

    auto Player::SetHp(int const hp) -> void
    {
        hp_ = std::clamp(hp, 0, hp_max_);
    }

    auto Player::Reveal() -> bool
    {
        if (revealed_) return false;
        revealed_ = true;
        return true;
    }

    auto Player::MarkDead() -> void
    {
        alive_ = false;
        revealed_ = true;
        hp_ = 0;
        // capriccio outlives its holder
        status.shielded = false;
        status.damage_immune = false;
        status.counterattacking = false;
    }

    auto Player::AttackBonus() const -> int
    {
        int bonus{};
        for (CardSP const& c : equipment_)
        {
            if (c->effect.kind != EffectKind::AttackBonus) continue;
            // Restricted weapons only answer to a revealed member of their faction.
            if (c->effect.restriction && !(revealed_ && *c->effect.restriction == faction_)) continue;
            bonus += c->effect.value;
        }
        return bonus;
    }

    auto Player::DefenseBonus() const -> int
    {
        int bonus{};
        for (CardSP const& c : equipment_)
        {
            if (c->effect.kind == EffectKind::DefenseBonus && RestrictionMatches(c->effect, faction_))
                bonus += c->effect.value;
        }
        return bonus;
    }

    auto Player::HasEquipment(EffectKind const kind) const -> bool
    {
        return EquipmentFor(kind) != nullptr;
    }

    auto Player::EquipmentFor(EffectKind const kind) const -> Card const*
    {
        auto const it = std::ranges::find_if(equipment_, [kind](CardSP const& c)
        {
            return c->effect.kind == kind;
        });
        return it != std::end(equipment_) ? it->get() : nullptr;
    }

    auto Player::HolyRelicCount() const -> int
    {
        return static_cast<int>(std::ranges::count_if(equipment_, [](CardSP const& c)
        {
            return IsHolyRelic(c->key);
        }));
    }

    auto Player::FindInHand(uint16_t const card_id) const -> CardSP
    {
        auto const it = std::ranges::find_if(hand_, [card_id](CardSP const& c) { return c->id == card_id; });
        return it != std::end(hand_) ? *it : nullptr;
    }
}
