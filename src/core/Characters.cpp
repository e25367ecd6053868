//
// Created by Malik T on 02/10/2025.
//

#include "Characters.hpp"

#include <array>

namespace shadow::core
{
    namespace
    {
        using enum AbilityKind;
        using enum UsagePolicy;

        constexpr std::array<CharacterInfo, CharacterCount> RosterTable{{
            // Hunters
            {CharacterId::Emi, "Emi", Faction::Hunter, 10, {Active, "Teleport", "manual", Unlimited, true}},
            {CharacterId::Franklin, "Franklin", Faction::Hunter, 12, {Active, "Lightning", "manual", Once, true}},
            {CharacterId::George, "George", Faction::Hunter, 14, {Active, "Demolish", "manual", Once, true}},
            {CharacterId::Ellen, "Ellen", Faction::Hunter, 10,
             {Active, "Chain of Forbidden Curse", "manual", Once, true}},
            {CharacterId::Fuka, "Fu-ka", Faction::Hunter, 12, {Active, "Dynamite Nurse", "manual", Once, true}},
            {CharacterId::Gregor, "Gregor", Faction::Hunter, 14, {Active, "Ghostly Barrier", "manual", Once, true}},
            // Shadows
            {CharacterId::Unknown, "Unknown", Faction::Shadow, 11, {Static, "Deceit", "", Unlimited, false}},
            {CharacterId::Vampire, "Vampire", Faction::Shadow, 13, {Passive, "Suck Blood", "on_attack", Unlimited, true}},
            {CharacterId::Werewolf, "Werewolf", Faction::Shadow, 14,
             {Passive, "Counterattack", "on_attacked", Unlimited, true}},
            {CharacterId::UltraSoul, "Ultra Soul", Faction::Shadow, 11,
             {Passive, "Murder Ray", "on_turn_start", Unlimited, true}},
            {CharacterId::Valkyrie, "Valkyrie", Faction::Shadow, 13,
             {Static, "Horn of War Outbreak", "", Unlimited, true}},
            {CharacterId::Wight, "Wight", Faction::Shadow, 14, {Active, "Multiplication", "manual", Once, true}},
            // Neutrals
            {CharacterId::Allie, "Allie", Faction::Neutral, 8, {Active, "Mother's Love", "manual", Once, true}},
            {CharacterId::Agnes, "Agnes", Faction::Neutral, 8, {Passive, "Capriccio", "on_reveal", Unlimited, false}},
            {CharacterId::Bob, "Bob", Faction::Neutral, 10, {Passive, "Robbery", "on_attack", Unlimited, true}},
            {CharacterId::Bryan, "Bryan", Faction::Neutral, 10, {Passive, "My GOD!!", "on_kill", Unlimited, false}},
            {CharacterId::Catherine, "Catherine", Faction::Neutral, 11,
             {Passive, "Stigmata", "on_turn_start", Unlimited, true}},
            {CharacterId::Charles, "Charles", Faction::Neutral, 11,
             {Active, "Bloody Feast", "manual", Unlimited, true}},
            {CharacterId::Daniel, "Daniel", Faction::Neutral, 13,
             {Passive, "Scream", "on_character_death", Unlimited, false}},
            {CharacterId::David, "David", Faction::Neutral, 13, {Active, "Grave Digger", "manual", Once, true}},
        }};

        static_assert(RosterTable.back().id == CharacterId::David, "Roster table out of order");
    }

    auto FindCharacter(CharacterId const id) -> CharacterInfo const*
    {
        auto const idx = static_cast<size_t>(id);
        if (idx >= RosterTable.size()) return nullptr;
        return &RosterTable[idx];
    }

    auto Roster() -> std::span<CharacterInfo const>
    {
        return RosterTable;
    }

    auto ParseTrigger(std::string_view const key) -> std::optional<Trigger>
    {
        if (key == "on_attacked") return Trigger::OnAttacked;
        if (key == "on_attack") return Trigger::OnAttack;
        if (key == "on_turn_start") return Trigger::OnTurnStart;
        if (key == "on_kill") return Trigger::OnKill;
        if (key == "on_death") return Trigger::OnDeath;
        if (key == "on_character_death") return Trigger::OnCharacterDeath;
        if (key == "on_reveal") return Trigger::OnReveal;
        if (key == "manual") return Trigger::Manual;
        return std::nullopt;
    }

    auto to_string(Trigger const t) -> std::string_view
    {
        switch (t)
        {
        case Trigger::OnAttacked: return "on_attacked";
        case Trigger::OnAttack: return "on_attack";
        case Trigger::OnTurnStart: return "on_turn_start";
        case Trigger::OnKill: return "on_kill";
        case Trigger::OnDeath: return "on_death";
        case Trigger::OnCharacterDeath: return "on_character_death";
        case Trigger::OnReveal: return "on_reveal";
        case Trigger::Manual: return "manual";
        }
        return "?";
    }

    auto to_string(CharacterId const id) -> std::string_view
    {
        CharacterInfo const* info = FindCharacter(id);
        return info ? info->name : std::string_view{"<unknown character>"};
    }
}
