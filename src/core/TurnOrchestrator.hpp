//
// Created by Malik T on 07/10/2025.
//

#ifndef SHADOWHUNT_TURNORCHESTRATOR_HPP
#define SHADOWHUNT_TURNORCHESTRATOR_HPP

#include "Events.hpp"
#include "Exception.hpp"
#include "Session.hpp"

namespace shadow::core
{
    // MOVEMENT -> ACTION -> END, then MOVEMENT of the next living player.
    class TurnOrchestrator
    {
    public:
        TurnOrchestrator(GameSession& session, EventBus& bus);

        // Starts turn 1 with the first living seat.
        auto Start() -> error::ValidateResult;

        // One step forward. Leaving END hands the turn over.
        auto AdvancePhase() -> error::ValidateResult;

        // Fast-forwards through END into the next turn.
        auto EndTurn() -> error::ValidateResult;

        // Next living seat after `from`, or nothing when everybody is dead.
        auto NextLiving(PlayerId from) const -> std::optional<PlayerId>;

    private:
        auto HandOver() -> error::ValidateResult;
        auto EnterTurn(PlayerId player) -> void;
        auto Stall() -> error::ValidateResult;

    private:
        GameSession& session_;
        EventBus& bus_;
    };
}

#endif //SHADOWHUNT_TURNORCHESTRATOR_HPP
