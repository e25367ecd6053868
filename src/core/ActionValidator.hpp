//
// Created by Malik T on 04/10/2025.
//

#ifndef SHADOWHUNT_ACTIONVALIDATOR_HPP
#define SHADOWHUNT_ACTIONVALIDATOR_HPP

#include <string_view>
#include <vector>
#include "Actions.hpp"
#include "Exception.hpp"
#include "Session.hpp"

// Stateless gating of player actions. Nothing in here mutates the session,
// so every check may be repeated freely (bots probe with them).
namespace shadow::core::validator
{
    using error::ValidateResult;

    // Named action ids understood by Named().
    inline constexpr std::string_view RollMovementId = "roll_movement";
    inline constexpr std::string_view DrawCardId = "draw_card";
    inline constexpr std::string_view AttackId = "attack";
    inline constexpr std::string_view MoveId = "move";
    inline constexpr std::string_view EndTurnId = "end_turn";

    auto RollMovement(GameSession const& s, PlayerId actor) -> ValidateResult;
    auto Move(GameSession const& s, PlayerId actor, ZoneId dest) -> ValidateResult;
    auto Draw(GameSession const& s, PlayerId actor, DeckKind deck) -> ValidateResult;
    auto Attack(GameSession const& s, PlayerId actor, PlayerId target) -> ValidateResult;
    // Legal in every phase; used to pass.
    auto EndTurn(GameSession const& s, PlayerId actor) -> ValidateResult;
    auto ActivateAbility(GameSession const& s, PlayerId actor) -> ValidateResult;
    auto Reveal(GameSession const& s, PlayerId actor) -> ValidateResult;
    auto GiveVision(GameSession const& s, PlayerId actor, uint16_t card_id, PlayerId target) -> ValidateResult;
    auto UseZone(GameSession const& s, PlayerId actor, PlayerId target, ZoneChoice choice) -> ValidateResult;

    // Parameterless form by id: draw_card accepts any drawable deck here, attack any legal target,
    // move any destination within the roll.
    auto Named(GameSession const& s, PlayerId actor, std::string_view action_id) -> ValidateResult;

    auto Check(GameSession const& s, PlayerId actor, PlayerAction const& a) -> ValidateResult;

    // Alive, not the attacker, positioned, and in reach (own area, or only outside it with a Handgun).
    auto IsLegalTarget(GameSession const& s, PlayerId attacker, PlayerId target) -> bool;
    auto LegalTargets(GameSession const& s, PlayerId attacker) -> std::vector<PlayerId>;
    auto ReachableZones(GameSession const& s, PlayerId actor) -> std::vector<ZoneId>;
}

#endif //SHADOWHUNT_ACTIONVALIDATOR_HPP
