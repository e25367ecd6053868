//
// Created by Malik T on 06/10/2025.
//

#ifndef SHADOWHUNT_CARDEFFECTS_HPP
#define SHADOWHUNT_CARDEFFECTS_HPP

#include <expected>
#include <string>
#include "Actions.hpp"
#include "Combat.hpp"
#include "Dice.hpp"
#include "Events.hpp"
#include "Session.hpp"

namespace shadow::core
{
    struct CardOutcome
    {
        bool applied{false};
        std::string description;
        int amount{};
    };

    using CardResult = std::expected<CardOutcome, error::RuleViolation>;

    // Resolves drawn cards, visions handed to other players and zone powers.
    class CardResolver
    {
    public:
        CardResolver(GameSession& session, EventBus& bus, CombatResolver& combat, Dice& dice);

        CardResolver(CardResolver const&) = delete;
        auto operator=(CardResolver const&) -> CardResolver& = delete;

        // Equipment is kept, visions go to the hand, instants resolve and are discarded.
        auto Resolve(PlayerId drawer, CardSP card) -> CardResult;
        auto GiveVision(PlayerId giver, uint16_t card_id, PlayerId receiver) -> CardResult;
        auto UseZone(PlayerId user, PlayerId target, ZoneChoice choice) -> CardResult;

    private:
        auto ResolveInstant(Player& drawer, Card const& card) -> CardResult;

    private:
        GameSession& session_;
        EventBus& bus_;
        CombatResolver& combat_;
        Dice& dice_;
    };
}

#endif //SHADOWHUNT_CARDEFFECTS_HPP
