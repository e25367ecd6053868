//
// Created by Malik T on 26/09/2025.
//

#ifndef SHADOWHUNT_JUDGE_HPP
#define SHADOWHUNT_JUDGE_HPP

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace shadow::core
{
    class GameImpl;

    enum class DecisionResult : uint8_t
    {
        OK,
        Timeout
    };

    struct TimedDecision
    {
        PlayerAction action{};
        DecisionResult result{};
    };

    class Judge
    {
    public:
        Judge() = default;

        // Asks the seat's agent on a worker thread. A late agent forfeits the rest of its turn.
        auto GetAction(GameImpl& game, PlayerId actor) const -> TimedDecision;
    };
}
#endif //SHADOWHUNT_JUDGE_HPP
