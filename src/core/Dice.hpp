//
// Created by Malik T on 03/10/2025.
//

#ifndef SHADOWHUNT_DICE_HPP
#define SHADOWHUNT_DICE_HPP

#include <cstdint>
#include <random>

namespace shadow::core
{
    class Dice
    {
    public:
        virtual ~Dice() = default;

        virtual auto D6() -> int = 0; // [1,6]
        virtual auto D4() -> int = 0; // [1,4]
    };

    class RngDice final : public Dice
    {
    public:
        explicit RngDice(uint64_t seed);

        auto D6() -> int override;
        auto D4() -> int override;

    private:
        std::mt19937_64 rng_;
    };
}

#endif //SHADOWHUNT_DICE_HPP
