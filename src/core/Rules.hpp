//
// Created by Malik T on 15/08/2025.
//

#ifndef SHADOWHUNT_RULES_HPP
#define SHADOWHUNT_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace shadow::core
{
    //forward declaration
    class GameImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameImpl const& game, PlayerId actor, PlayerAction const& a) const -> CheckResult = 0;

        // Mutate authoritative state. Raised events cascade before this returns.
        virtual auto Apply(GameImpl& game, PlayerId actor, PlayerAction const& a) -> void = 0;

        // Moves the phase machine on after an applied action.
        virtual auto Advance(GameImpl& game) -> MoveOutcome = 0;
    };
}

#endif //SHADOWHUNT_RULES_HPP
