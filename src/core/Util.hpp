//
// Created by Malik T on 14/08/2025.
//

#ifndef SHADOWHUNT_UTIL_HPP
#define SHADOWHUNT_UTIL_HPP

#include <algorithm>
#include <span>
#include <memory>
#include <vector>
#include "Card.hpp"
#include "OmegaException.hpp"



namespace shadow::core::util
{
    template <typename T>
    inline auto any_invalid(std::span<T const> ptrs) -> bool
    {
        if constexpr (std::is_same_v<T, std::weak_ptr<typename T::element_type>>)
        {
            // For weak_ptr: check if expired
            return std::ranges::any_of(ptrs, [](auto const& p) { return p.expired(); });
        }
        else if constexpr (std::is_same_v<T, std::shared_ptr<typename T::element_type>>)
        {
            // For shared_ptr: check if null
            return std::ranges::any_of(ptrs, [](auto const& p) { return !p; });
        }
        else
        {
            static_assert([]{return false;}(), "Ptr must be std::shared_ptr<T> or std::weak_ptr<T>");
        }
    }

    // Card ids are dense from 1, so a flag per id is enough.
    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            seen_(), count_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            if (seen_.size() <= c.id) seen_.resize(c.id + 1u, false);
            contains_dup_ |= static_cast<bool>(seen_[c.id]);
            seen_[c.id] = true;
            ++count_;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Count() const -> size_t
        {
            return count_;
        }
    private:
        std::vector<bool> seen_;
        size_t count_;
        bool contains_dup_;
    };
}

#endif //SHADOWHUNT_UTIL_HPP
