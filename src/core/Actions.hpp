//
// Created by Malik T on 14/08/2025.
//

#ifndef SHADOWHUNT_ACTIONS_HPP
#define SHADOWHUNT_ACTIONS_HPP

#include <optional>
#include <string_view>
#include <variant>
#include <vector>
#include "Types.hpp"

namespace shadow::core
{
    // What a zone power should do when the zone offers more than one effect.
    enum class ZoneChoice : uint8_t
    {
        Damage = 0, // Weird Woods: 2 damage
        Heal,       // Weird Woods: heal 1
        Steal       // Erstwhile Altar: take one equipment
    };

    struct RollMoveAction {};
    struct MoveAction { ZoneId zone{}; };
    struct DrawAction { DeckKind deck{}; };
    struct AttackAction { PlayerId target{}; };
    struct EndTurnAction {};
    struct ActivateAbilityAction
    {
        std::vector<PlayerId> targets;
        std::optional<ZoneId> zone{};
    };
    struct RevealAction {};
    struct GiveVisionAction
    {
        uint16_t card_id{};
        PlayerId target{};
    };
    struct UseZoneAction
    {
        PlayerId target{};
        ZoneChoice choice{ZoneChoice::Damage};
    };

    using PlayerAction = std::variant<
      RollMoveAction, MoveAction, DrawAction, AttackAction, EndTurnAction,
      ActivateAbilityAction, RevealAction, GiveVisionAction, UseZoneAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        TurnEnded,
        GameEnded,
        Stalled
    };

    inline auto to_string(MoveOutcome m) -> std::string_view
    {
        switch (m)
        {
        case MoveOutcome::Invalid: return "Invalid";
        case MoveOutcome::Applied: return "Applied";
        case MoveOutcome::TurnEnded: return "TurnEnded";
        case MoveOutcome::GameEnded: return "GameEnded";
        case MoveOutcome::Stalled: return "Stalled";
        }
        return "?";
    }
} // namespace shadow::core

#endif //SHADOWHUNT_ACTIONS_HPP
