//
// PileSet.cpp
//

#include "PileSet.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "Exception.hpp"

namespace nertz::core
{
    PileSet::PileSet(PlyrIdxT const owner) :
        owner_(owner)
    {
    }

    auto PileSet::BuildDeck() -> void
    {
        deck_.clear();
        deck_.reserve(constants::CardsPerDeck);
        for (size_t i{}; i < 4; ++i)
        {
            for (size_t j{}; j < constants::TotalRanks; ++j)
            {
                deck_.emplace_back(std::make_shared<Card>(
                    static_cast<Suit>(i), static_cast<Rank>(j), owner_));
            }
        }
    }

    auto PileSet::DealStartingHand(std::mt19937_64& rng) -> void
    {
        stream_.clear();
        nertz_.clear();
        lake_.clear();
        for (auto& slot : river_) slot.clear();

        BuildDeck();
        std::ranges::shuffle(deck_, rng);

        for (auto& slot : river_)
        {
            slot.push_back(DealCard());
        }

        nertz_.reserve(constants::NertzPileSize);
        for (size_t i{}; i < constants::NertzPileSize; ++i)
        {
            nertz_.push_back(DealCard());
        }

        FlipIntoStream();
    }

    auto PileSet::DealCard() -> CardSP
    {
        if (deck_.empty())
            NTZ_THROW(error::Code::State, fmt::format("Player {}: no cards left in deck", static_cast<int>(owner_)));

        CardSP card = std::move(deck_.back());
        deck_.pop_back();
        return card;
    }

    auto PileSet::FlipIntoStream(size_t const n) -> size_t
    {
        if (deck_.empty())
        {
            deck_ = std::move(stream_);
            stream_.clear();
        }

        size_t flipped{};
        //no recycling mid-flip, a short deck gives a short flip
        while (flipped < n && !deck_.empty())
        {
            stream_.push_back(DealCard());
            ++flipped;
        }
        return flipped;
    }

    auto PileSet::RiverSlot(size_t const slot) const -> RiverSlotT const&
    {
        if (slot >= river_.size())
            NTZ_THROW(error::Code::State, fmt::format("River slot {} out of range", slot));
        return river_[slot];
    }

    auto PileSet::MutSlot(size_t const slot) -> RiverSlotT&
    {
        if (slot >= river_.size())
            NTZ_THROW(error::Code::State, fmt::format("River slot {} out of range", slot));
        return river_[slot];
    }

    auto PileSet::TopNertz() const -> CardWP
    {
        return nertz_.empty() ? CardWP{} : CardWP{nertz_.back()};
    }

    auto PileSet::TopStream() const -> CardWP
    {
        return stream_.empty() ? CardWP{} : CardWP{stream_.back()};
    }

    auto PileSet::RiverTop(size_t const slot) const -> CardWP
    {
        RiverSlotT const& s = RiverSlot(slot);
        return s.empty() ? CardWP{} : CardWP{s.back()};
    }

    auto PileSet::RiverBottom(size_t const slot) const -> CardWP
    {
        RiverSlotT const& s = RiverSlot(slot);
        return s.empty() ? CardWP{} : CardWP{s.front()};
    }

    auto PileSet::RiverSlotTopCards() const -> std::array<CardWP, constants::RiverSlots>
    {
        std::array<CardWP, constants::RiverSlots> tops{};
        for (size_t i{}; i < river_.size(); ++i)
        {
            tops[i] = RiverTop(i);
        }
        return tops;
    }

    auto PileSet::TopStreamCards(size_t const count) const -> std::vector<CardWP>
    {
        // Unlike the other top accessors this one refuses to return a short result.
        if (stream_.size() < count)
            NTZ_THROW(error::Code::State,
                      fmt::format("Not enough cards in stream: wanted {}, have {}", count, stream_.size()));

        return std::vector<CardWP>(stream_.cend() - static_cast<std::ptrdiff_t>(count), stream_.cend());
    }

    auto PileSet::PopNertz() -> CardSP
    {
        NTZ_ASSERT(!nertz_.empty(), "Pop from empty nertz pile");
        CardSP card = std::move(nertz_.back());
        nertz_.pop_back();
        return card;
    }

    auto PileSet::PopStream() -> CardSP
    {
        NTZ_ASSERT(!stream_.empty(), "Pop from empty stream");
        CardSP card = std::move(stream_.back());
        stream_.pop_back();
        return card;
    }

    auto PileSet::PopRiverTop(size_t const slot) -> CardSP
    {
        RiverSlotT& s = MutSlot(slot);
        NTZ_ASSERT(!s.empty(), "Pop from empty river slot");
        CardSP card = std::move(s.back());
        s.pop_back();
        return card;
    }

    auto PileSet::PopRiverBottom(size_t const slot) -> CardSP
    {
        RiverSlotT& s = MutSlot(slot);
        NTZ_ASSERT(!s.empty(), "Pop from empty river slot");
        CardSP card = std::move(s.front());
        s.pop_front();
        return card;
    }

    auto PileSet::PushRiver(size_t const slot, CardSP card) -> void
    {
        NTZ_ASSERT(card != nullptr, "Null card pushed to river");
        MutSlot(slot).push_back(std::move(card));
    }

    auto PileSet::RecordLake(CardWP card) -> void
    {
        lake_.push_back(std::move(card));
    }
}
