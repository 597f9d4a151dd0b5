//
// Foundation.hpp
//

#ifndef NERTZSIM_FOUNDATION_HPP
#define NERTZSIM_FOUNDATION_HPP

#include <vector>

#include "Types.hpp"

namespace nertz::core
{
    //"foundation_<owner>_<suit>"
    auto MakeFoundationId(PlyrIdxT owner, Suit suit) -> FoundationId;

    // Shared, suit-pure pile that always starts with an Ace. Anyone may extend it;
    // the identifier stays bound to the player who created it.
    class Foundation
    {
    public:
        //throws ValidationError unless the card is an Ace
        Foundation(CardSP ace, PlyrIdxT owner);

        // Appends without checking adjacency; move generation only offers the next rank.
        auto AddCard(CardSP card) -> void;

        auto Top() const -> Card const&;
        auto TopRef() const -> CardWP;

        auto Identifier() const noexcept -> FoundationId const& { return identifier_; }
        auto SuitOf() const noexcept -> Suit { return suit_; }
        auto Owner() const noexcept -> PlyrIdxT { return owner_; }
        auto Cards() const noexcept -> std::vector<CardSP> const& { return cards_; }
        auto Size() const noexcept -> size_t { return cards_.size(); }

    private:
        FoundationId identifier_;
        Suit suit_;
        PlyrIdxT owner_;
        std::vector<CardSP> cards_;
    };
}

#endif //NERTZSIM_FOUNDATION_HPP
