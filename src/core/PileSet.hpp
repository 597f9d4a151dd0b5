//
// PileSet.hpp
//

#ifndef NERTZSIM_PILESET_HPP
#define NERTZSIM_PILESET_HPP

#include <array>
#include <deque>
#include <random>
#include <vector>

#include "Types.hpp"

namespace nertz::core::debug {struct Inspector;}
namespace nertz::core
{
    using RiverSlotT = std::deque<CardSP>;
    using RiverT = std::array<RiverSlotT, constants::RiverSlots>;

    // One player's private piles. Every sequence keeps its playable card at the back;
    // a river slot also exposes its front (bottom) for whole-slot transfers.
    class PileSet
    {
    public:
        explicit PileSet(PlyrIdxT owner);

        PileSet(PileSet const&) = delete;
        auto operator=(PileSet const&) -> PileSet& = delete;
        PileSet(PileSet&&) noexcept = default;
        auto operator=(PileSet&&) noexcept -> PileSet& = default;

        // Fresh shuffled 52 cards, 1 card per river slot, 13 to nertz, first flip to stream.
        auto DealStartingHand(std::mt19937_64& rng) -> void;

        // Recycles the whole stream into the deck when the deck is empty, then moves
        // up to n cards deck -> stream. Returns how many cards were flipped.
        auto FlipIntoStream(size_t n = constants::StreamFlipCount) -> size_t;

        //throws if the deck is empty
        auto DealCard() -> CardSP;

        auto Owner() const noexcept -> PlyrIdxT { return owner_; }
        auto CardsLeft() const noexcept -> size_t { return deck_.size(); }

        auto Deck() const noexcept -> std::vector<CardSP> const& { return deck_; }
        auto Stream() const noexcept -> std::vector<CardSP> const& { return stream_; }
        auto Nertz() const noexcept -> std::vector<CardSP> const& { return nertz_; }
        auto River() const noexcept -> RiverT const& { return river_; }
        auto RiverSlot(size_t slot) const -> RiverSlotT const&;
        auto Lake() const noexcept -> std::vector<CardWP> const& { return lake_; }

        //empty weak_ptr when the pile is empty
        auto TopNertz() const -> CardWP;
        auto TopStream() const -> CardWP;
        auto RiverTop(size_t slot) const -> CardWP;
        auto RiverBottom(size_t slot) const -> CardWP;
        auto RiverSlotTopCards() const -> std::array<CardWP, constants::RiverSlots>;

        // Last `count` stream cards, oldest first. Throws StateError when fewer are present.
        auto TopStreamCards(size_t count = constants::StreamFlipCount) const -> std::vector<CardWP>;

        // Mutators used by the move executor; each returns the owning pointer it removed.
        auto PopNertz() -> CardSP;
        auto PopStream() -> CardSP;
        auto PopRiverTop(size_t slot) -> CardSP;
        auto PopRiverBottom(size_t slot) -> CardSP;
        auto PushRiver(size_t slot, CardSP card) -> void;
        auto RecordLake(CardWP card) -> void;

        friend struct debug::Inspector;

    private:
        auto BuildDeck() -> void;
        auto MutSlot(size_t slot) -> RiverSlotT&;

    private:
        PlyrIdxT owner_;
        std::vector<CardSP> deck_;
        std::vector<CardSP> stream_;
        RiverT river_{};
        std::vector<CardSP> nertz_;
        std::vector<CardWP> lake_; // record of cards placed on foundations, not owning
    };
}

#endif //NERTZSIM_PILESET_HPP
