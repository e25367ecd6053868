//
// Created by Malik T on 02/10/2025.
//

#include "Deck.hpp"

#include <algorithm>
#include <utility>
#include "Exception.hpp"

namespace shadow::core
{
    Deck::Deck(DeckKind const kind, std::vector<CardSP> cards) :
        kind_(kind),
        draw_(std::move(cards))
    {
        SHD_ASSERT(std::ranges::none_of(draw_, [](CardSP const& c) { return !c; }), "Null card in deck");
    }

    auto Deck::Draw(std::mt19937_64& rng) -> CardSP
    {
        if (draw_.empty())
        {
            if (discard_.empty()) return nullptr;
            draw_ = std::move(discard_);
            discard_.clear();
            std::ranges::shuffle(draw_, rng);
        }
        CardSP top = std::move(draw_.back());
        draw_.pop_back();
        return top;
    }

    auto Deck::Discard(CardSP card) -> void
    {
        SHD_ASSERT(card != nullptr, "Discarding a null card");
        SHD_ASSERT(card->deck == kind_, "Card discarded into the wrong deck");
        discard_.push_back(std::move(card));
    }

    auto Deck::Shuffle(std::mt19937_64& rng) -> void
    {
        std::ranges::shuffle(draw_, rng);
    }

    auto Deck::TakeFromDiscard(std::function<bool(Card const&)> const& pred) -> CardSP
    {
        auto const it = std::ranges::find_if(discard_, [&pred](CardSP const& c) { return pred(*c); });
        if (it == std::end(discard_)) return nullptr;
        CardSP out = std::move(*it);
        discard_.erase(it);
        return out;
    }
}
