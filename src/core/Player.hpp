//
// Created by Malik T on 02/10/2025.
//

#ifndef SHADOWHUNT_PLAYER_HPP
#define SHADOWHUNT_PLAYER_HPP

#include <optional>
#include <string>
#include <vector>
#include "Card.hpp"
#include "Characters.hpp"
#include "Types.hpp"

namespace shadow::core
{
    // Every transient state a character effect may attach to a player.
    struct StatusFlags
    {
        bool shielded{false};         // consumed by the next damage
        bool damage_immune{false};    // until the holder's next turn
        bool capriccio{false};        // Agnes looks left instead of right
        bool counterattacking{false}; // a counterattack is being resolved
    };

    class Player
    {
    public:
        Player(PlayerId id, std::string name, bool is_bot, CharacterInfo const& info);

        auto Id() const noexcept -> PlayerId { return id_; }
        auto Name() const noexcept -> std::string const& { return name_; }
        auto IsBot() const noexcept -> bool { return is_bot_; }
        auto Character() const noexcept -> CharacterId { return character_; }
        auto Alignment() const noexcept -> Faction { return faction_; }
        auto Ability() const noexcept -> AbilityDecl const& { return ability_; }

        auto Hp() const noexcept -> int { return hp_; }
        auto HpMax() const noexcept -> int { return hp_max_; }
        auto Damage() const noexcept -> int { return hp_max_ - hp_; }
        auto IsAlive() const noexcept -> bool { return alive_; }
        auto IsRevealed() const noexcept -> bool { return revealed_; }
        auto Position() const noexcept -> std::optional<ZoneId> { return position_; }

        // Returns the hp actually restored, never exceeding hp_max.
        auto Heal(int amount) -> int;
        // Returns the hp actually removed; hp is clamped at 0.
        auto Wound(int amount) -> int;
        auto SetHp(int hp) -> void;
        auto Reveal() -> bool;
        // Dead players are always revealed.
        auto MarkDead() -> void;
        auto MoveTo(ZoneId zone) -> void { position_ = zone; }

        auto Hand() noexcept -> std::vector<CardSP>& { return hand_; }
        auto Hand() const noexcept -> std::vector<CardSP> const& { return hand_; }
        auto Equipment() noexcept -> std::vector<CardSP>& { return equipment_; }
        auto Equipment() const noexcept -> std::vector<CardSP> const& { return equipment_; }

        // Equipment lookups; restricted items only count when the restriction matches.
        auto AttackBonus() const -> int;
        auto DefenseBonus() const -> int;
        auto HasEquipment(EffectKind kind) const -> bool;
        auto EquipmentFor(EffectKind kind) const -> Card const*;
        auto HolyRelicCount() const -> int;
        auto FindInHand(uint16_t card_id) const -> CardSP;

        auto AbilityUsed() const noexcept -> bool { return ability_used_; }
        auto ConsumeAbility() -> void { ability_used_ = true; }
        auto AbilityDisabled() const noexcept -> bool { return ability_disabled_; }
        auto DisableAbility() -> void { ability_disabled_ = true; }

        StatusFlags status{};

    private:
        PlayerId id_;
        std::string name_;
        bool is_bot_;

        CharacterId character_;
        Faction faction_;
        AbilityDecl ability_;

        int hp_;
        int hp_max_;
        bool alive_{true};
        bool revealed_{false};
        std::optional<ZoneId> position_{};

        std::vector<CardSP> hand_;
        std::vector<CardSP> equipment_;

        bool ability_used_{false};
        bool ability_disabled_{false};
    };
}

#endif //SHADOWHUNT_PLAYER_HPP
