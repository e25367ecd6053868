//
// Created by Malik T on 14/08/2025.
//

#ifndef SHADOWHUNT_AGENT_HPP
#define SHADOWHUNT_AGENT_HPP

#include <chrono>
#include <memory>
#include "Actions.hpp"
#include "State.hpp"

namespace shadow::core
{
    // Whoever decides for a seat: local bot, test script or remote client.
    class Agent
    {
    public:
        virtual ~Agent() = default;

        // Called by the authoritative game loop (local AI/human adapter or server-side remote).
        // Deadline is authoritative; on timeout the caller ends the turn instead.
        virtual PlayerAction Play(std::shared_ptr<const GameSnapshot> snapshot,
                                  std::chrono::steady_clock::time_point deadline) = 0;
    };
}
#endif //SHADOWHUNT_AGENT_HPP
