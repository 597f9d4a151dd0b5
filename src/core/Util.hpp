//
// Util.hpp
//

#ifndef NERTZSIM_UTIL_HPP
#define NERTZSIM_UTIL_HPP

#include <algorithm>
#include <array>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "Types.hpp"

namespace nertz::core::util
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

    inline auto SuitName(Suit const s) -> std::string_view
    {
        switch (s)
        {
            case Suit::Spades:   return "spades";
            case Suit::Clubs:    return "clubs";
            case Suit::Hearts:   return "hearts";
            case Suit::Diamonds: return "diamonds";
        }
        return "?";
    }

    inline auto RankName(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::TotalRanks> map{
            "A","2","3","4","5","6","7","8","9","10","J","Q","K"
        };
        return map[RankIndex(r)];
    }

    // "10 of hearts (P1)"
    inline auto ToString(Card const& c) -> std::string
    {
        return fmt::format("{} of {} (P{})", RankName(c.rank), SuitName(c.suit), static_cast<int>(c.owner));
    }

    inline auto ToString(CardWP const& w) -> std::string
    {
        if (CardSP const sp = w.lock()) return ToString(*sp);
        return "<none>";
    }

    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(c.suit) * constants::TotalRanks + static_cast<uint64_t>(c.rank);
    }

    // Tracks one player's 52 faces; a second sighting of a face is a duplicate.
    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), count_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
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
        // all 52 faces seen exactly once
        [[nodiscard]]
        auto IsFullDeck() const -> bool
        {
            return !contains_dup_ && count_ == constants::CardsPerDeck;
        }
    private:
        uint64_t cards_;
        size_t count_;
        bool contains_dup_;
    };
}

#endif //NERTZSIM_UTIL_HPP
