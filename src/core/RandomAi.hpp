//
// Created by Malik T on 18/08/2025.
//

#ifndef SHADOWHUNT_RANDOMAI_HPP
#define SHADOWHUNT_RANDOMAI_HPP

#include <random>
#include "Agent.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace shadow::core
{
    // Picks uniformly among the actions it believes legal; draws and attacks first.
    class RandomAI final : public shadow::core::Agent
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto Play(std::shared_ptr<const shadow::core::GameSnapshot> snapshot,
                  std::chrono::steady_clock::time_point deadline) -> shadow::core::PlayerAction override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto MovementMove(shadow::core::GameSnapshot const&) -> shadow::core::PlayerAction;
        auto ActionMove(shadow::core::GameSnapshot const&) -> shadow::core::PlayerAction;
        auto Extras(shadow::core::GameSnapshot const&) -> std::vector<shadow::core::PlayerAction>;

    private:
        std::mt19937 rng_;
    };
}

#endif //SHADOWHUNT_RANDOMAI_HPP
