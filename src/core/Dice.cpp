//
// Created by Malik T on 03/10/2025.
//

#include "Dice.hpp"
#include "Types.hpp"

namespace shadow::core
{
    RngDice::RngDice(uint64_t const seed) :
        rng_(seed) {}

    auto RngDice::D6() -> int
    {
        return std::uniform_int_distribution<int>{1, constants::DieSixFaces}(rng_);
    }

    auto RngDice::D4() -> int
    {
        return std::uniform_int_distribution<int>{1, constants::DieFourFaces}(rng_);
    }
}
