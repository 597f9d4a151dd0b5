//
// Foundation.cpp
//

#include "Foundation.hpp"

#include <utility>

#include <fmt/format.h>

#include "Exception.hpp"
#include "Util.hpp"

namespace nertz::core
{
    auto MakeFoundationId(PlyrIdxT const owner, Suit const suit) -> FoundationId
    {
        return fmt::format("foundation_{}_{}", static_cast<int>(owner), util::SuitName(suit));
    }

    Foundation::Foundation(CardSP ace, PlyrIdxT const owner) :
        owner_(owner)
    {
        NTZ_ASSERT(ace != nullptr, "Foundation created from a null card");
        if (ace->rank != Rank::Ace)
            NTZ_THROW(error::Code::Validation,
                      fmt::format("Initial foundation card must be an ace, got {}", util::ToString(*ace)));

        suit_ = ace->suit;
        identifier_ = MakeFoundationId(owner_, suit_);
        cards_.push_back(std::move(ace));
    }

    auto Foundation::AddCard(CardSP card) -> void
    {
        NTZ_ASSERT(card != nullptr, "Null card added to foundation");
        cards_.push_back(std::move(card));
    }

    auto Foundation::Top() const -> Card const&
    {
        NTZ_ASSERT(!cards_.empty(), "Top of empty foundation");
        return *cards_.back();
    }

    auto Foundation::TopRef() const -> CardWP
    {
        return cards_.empty() ? CardWP{} : CardWP{cards_.back()};
    }
}
