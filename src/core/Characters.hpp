//
// Created by Malik T on 02/10/2025.
//

#ifndef SHADOWHUNT_CHARACTERS_HPP
#define SHADOWHUNT_CHARACTERS_HPP

#include <optional>
#include <span>
#include <string_view>
#include "Types.hpp"

namespace shadow::core
{
    enum class AbilityKind : uint8_t
    {
        None = 0,
        Passive, // fires on a registered trigger
        Active,  // invoked by its holder
        Static   // always-on modifier read by the combat resolver
    };

    enum class UsagePolicy : uint8_t
    {
        Unlimited = 0,
        Once
    };

    enum class Trigger : uint8_t
    {
        OnAttacked = 0,
        OnAttack,
        OnTurnStart,
        OnKill,
        OnDeath,
        OnCharacterDeath,
        OnReveal,
        Manual
    };

    // Declaration as it comes from character data; the trigger stays a key until registration.
    struct AbilityDecl
    {
        AbilityKind kind{AbilityKind::None};
        std::string_view name{};
        std::string_view trigger_key{};
        UsagePolicy usage{UsagePolicy::Unlimited};
        bool requires_reveal{true};
    };

    struct CharacterInfo
    {
        CharacterId id{};
        std::string_view name{};
        Faction faction{};
        int hp_max{};
        AbilityDecl ability{};
    };

    // nullptr for ids outside the roster.
    auto FindCharacter(CharacterId id) -> CharacterInfo const*;
    auto Roster() -> std::span<CharacterInfo const>;

    auto ParseTrigger(std::string_view key) -> std::optional<Trigger>;
    auto to_string(Trigger t) -> std::string_view;
    auto to_string(CharacterId id) -> std::string_view;
}

#endif //SHADOWHUNT_CHARACTERS_HPP
