//
// Created by Malik T on 15/08/2025.
//

#ifndef SHADOWHUNT_STANDARDRULES_HPP
#define SHADOWHUNT_STANDARDRULES_HPP
#include "Rules.hpp"

namespace shadow::core
{
    class StandardRules final : public Rules
    {
    public:
        auto Validate(GameImpl const& game, PlayerId actor, PlayerAction const& a) const -> CheckResult override;
        auto Apply(GameImpl& game, PlayerId actor, PlayerAction const& a) -> void override;
        auto Advance(GameImpl& game) -> MoveOutcome override;
    };
}

#endif //SHADOWHUNT_STANDARDRULES_HPP
