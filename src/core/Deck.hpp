//
// Created by Malik T on 02/10/2025.
//

#ifndef SHADOWHUNT_DECK_HPP
#define SHADOWHUNT_DECK_HPP

#include <functional>
#include <random>
#include <vector>
#include "Card.hpp"
#include "Types.hpp"

namespace shadow::core
{
    namespace debug {struct Inspector;}

    // Draw pile + discard pile. The back of draw_ is the top of the pile.
    class Deck
    {
    public:
        Deck(DeckKind kind, std::vector<CardSP> cards);

        // Returns nullptr when both piles are empty (not an error).
        // An empty draw pile is refilled from the shuffled discard pile first.
        auto Draw(std::mt19937_64& rng) -> CardSP;
        auto Discard(CardSP card) -> void;
        auto Shuffle(std::mt19937_64& rng) -> void;

        // Removes and returns the first discarded card matching pred, or nullptr.
        auto TakeFromDiscard(std::function<bool(Card const&)> const& pred) -> CardSP;

        [[nodiscard]] auto HasDrawable() const noexcept -> bool { return !draw_.empty() || !discard_.empty(); }
        [[nodiscard]] auto DrawPileSize() const noexcept -> size_t { return draw_.size(); }
        [[nodiscard]] auto DiscardSize() const noexcept -> size_t { return discard_.size(); }
        [[nodiscard]] auto Kind() const noexcept -> DeckKind { return kind_; }

        friend struct debug::Inspector;

    private:
        DeckKind kind_;
        std::vector<CardSP> draw_;
        std::vector<CardSP> discard_;
    };
}

#endif //SHADOWHUNT_DECK_HPP
