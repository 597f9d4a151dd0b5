//
// Types.hpp
//

#ifndef NERTZSIM_TYPES_HPP
#define NERTZSIM_TYPES_HPP

#ifndef NTZ_ENABLE_TEST_HOOKS
#define NTZ_ENABLE_TEST_HOOKS true
#endif

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace nertz::core::constants
{
    inline constexpr size_t RiverSlots = 4;
    inline constexpr size_t NertzPileSize = 13;
    inline constexpr size_t CardsPerDeck = 52;
    inline constexpr size_t TotalRanks = 13;
    inline constexpr size_t StreamFlipCount = 3;
}

namespace nertz::core
{
    enum class Suit : uint8_t
    {
        Spades = 0,
        Clubs,
        Hearts,
        Diamonds
    };

    // A < 2 < ... < K, no wraparound
    enum class Rank : uint8_t
    {
        Ace = 0,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King
    };

    using PlyrIdxT = uint8_t;

    struct Card
    {
        Card() = delete;
        Card(Suit suit, Rank rank, PlyrIdxT owner) : suit(suit), rank(rank), owner(owner) {}

        Suit suit;
        Rank rank;
        PlyrIdxT owner;
        ///////////////////////////////////
        // every player owns a structurally identical deck; a card is never cloned
        Card(Card const&) = delete;
        auto operator=(Card const&) -> Card& = delete;
    };

    // Full identity: suit, rank and owning player.
    inline auto Identical(Card const& a, Card const& b) -> bool
    {
        return a.suit == b.suit && a.rank == b.rank && a.owner == b.owner;
    }

    // Value equality only; never use for pile membership.
    inline auto SameFace(Card const& a, Card const& b) -> bool
    {
        return a.suit == b.suit && a.rank == b.rank;
    }

    inline constexpr auto IsRed(Suit s) noexcept -> bool
    {
        return s == Suit::Hearts || s == Suit::Diamonds;
    }

    inline constexpr auto IsOppositeColour(Suit a, Suit b) noexcept -> bool
    {
        return IsRed(a) != IsRed(b);
    }

    inline constexpr auto RankIndex(Rank r) noexcept -> size_t
    {
        return static_cast<size_t>(r);
    }

    // Successor in A..K, empty after King.
    inline constexpr auto NextRank(Rank r) noexcept -> std::optional<Rank>
    {
        if (r == Rank::King) return std::nullopt;
        return static_cast<Rank>(static_cast<uint8_t>(r) + 1);
    }

    // Solitaire adjacency: opposite colour and exactly one rank below dest.
    inline constexpr auto CanStackOn(Card const& source, Card const& dest) noexcept -> bool
    {
        std::optional<Rank> const above = NextRank(source.rank);
        return IsOppositeColour(source.suit, dest.suit) && above.has_value() && *above == dest.rank;
    }

    using CardSP = std::shared_ptr<Card>;
    using CCardSP = std::shared_ptr<Card const>;
    using CardWP = std::weak_ptr<Card>;

    using FoundationId = std::string;

    struct Point
    {
        double x{};
        double y{};
    };

    struct Config
    {
        uint32_t n_players{2};
        uint64_t seed{std::random_device{}()};
    };
}

#endif //NERTZSIM_TYPES_HPP
