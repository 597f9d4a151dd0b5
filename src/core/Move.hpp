//
// Move.hpp
//

#ifndef NERTZSIM_MOVE_HPP
#define NERTZSIM_MOVE_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Types.hpp"
#include "Foundation.hpp"

namespace nertz::core::constants
{
    inline constexpr double MaxDistancePenaltyFactor = 0.3;
    inline constexpr double NertzUniqueFoundationBonus = 20.0;
    inline constexpr double DefaultMoveWeight = 0.5;
}

namespace nertz::core
{
    // Deck covers both the face-down deck and the face-up stream.
    enum class PileKind : uint8_t
    {
        Nertz,
        River,
        Deck,
        Foundation
    };

    enum class MoveKind : uint8_t
    {
        NertzToFoundation,
        NertzToRiver,
        RiverToFoundation,
        DeckToFoundation,
        DeckToRiver,
        RiverToRiver,
        DeckToDeck // flip deck -> stream
    };

    auto to_string(PileKind p) -> std::string_view;
    auto to_string(MoveKind k) -> std::string_view;

    auto BaseWeight(MoveKind k) noexcept -> double;

    struct FoundationSummary
    {
        FoundationId identifier;
        Suit suit{};
        Rank top_rank{};
        PlyrIdxT owner{};
    };

    // Foundation state frozen at the start of a turn. Generation and priority
    // read only this, never the live foundations.
    struct MoveContext
    {
        std::map<FoundationId, FoundationSummary> foundations;
        std::vector<FoundationId> opened; // ids in the order their foundations were opened

        static auto FromFoundations(std::map<FoundationId, Foundation> const& live,
                                    std::vector<FoundationId> const& opened) -> MoveContext;
    };

    struct MoveParams
    {
        PlyrIdxT player{};
        PileKind source{};
        PileKind destination{};
        MoveKind kind{};
        CardWP card{};
        double distance{};
        std::optional<FoundationId> foundation_id{};
        std::optional<uint8_t> source_slot{};
        std::optional<uint8_t> destination_slot{};
    };

    // One candidate transition for one player. Fields are validated and the
    // priority fixed at construction.
    class Move
    {
    public:
        //throws ValidationError when a field required by the pile kinds is missing
        Move(MoveParams params, MoveContext const& ctx);

        auto Player() const noexcept -> PlyrIdxT { return p_.player; }
        auto Source() const noexcept -> PileKind { return p_.source; }
        auto Destination() const noexcept -> PileKind { return p_.destination; }
        auto Kind() const noexcept -> MoveKind { return p_.kind; }
        auto CardRef() const noexcept -> CardWP const& { return p_.card; }
        auto Distance() const noexcept -> double { return p_.distance; }
        auto Priority() const noexcept -> double { return priority_; }
        auto FoundationTarget() const noexcept -> std::optional<FoundationId> const& { return p_.foundation_id; }
        auto SourceSlot() const noexcept -> std::optional<uint8_t> { return p_.source_slot; }
        auto DestinationSlot() const noexcept -> std::optional<uint8_t> { return p_.destination_slot; }

        auto IsFlip() const noexcept -> bool { return p_.kind == MoveKind::DeckToDeck; }
        // Ace onto a foundation always opens a new one.
        auto OpensFoundation() const -> bool;

    private:
        auto Validate() const -> void;
        auto CalculatePriority(MoveContext const& ctx) const -> double;
        auto StrategicBonus(MoveContext const& ctx) const -> double;

    private:
        MoveParams p_;
        double priority_{};
    };

    auto Describe(Move const& m) -> std::string;
}

#endif //NERTZSIM_MOVE_HPP
