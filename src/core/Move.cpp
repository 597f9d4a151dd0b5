//
// Move.cpp
//

#include "Move.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "Exception.hpp"
#include "Util.hpp"

namespace nertz::core
{
    auto to_string(PileKind const p) -> std::string_view
    {
        switch (p)
        {
        case PileKind::Nertz: return "NertzPile";
        case PileKind::River: return "RiverPile";
        case PileKind::Deck: return "DeckPile";
        case PileKind::Foundation: return "FoundationPile";
        }
        return "?";
    }

    auto to_string(MoveKind const k) -> std::string_view
    {
        switch (k)
        {
        case MoveKind::NertzToFoundation: return "NertzToFoundation";
        case MoveKind::NertzToRiver: return "NertzToRiver";
        case MoveKind::RiverToFoundation: return "RiverToFoundation";
        case MoveKind::DeckToFoundation: return "DeckToFoundation";
        case MoveKind::DeckToRiver: return "DeckToRiver";
        case MoveKind::RiverToRiver: return "RiverToRiver";
        case MoveKind::DeckToDeck: return "DeckToDeck";
        }
        return "?";
    }

    auto BaseWeight(MoveKind const k) noexcept -> double
    {
        switch (k)
        {
        case MoveKind::NertzToFoundation: return 1.0;
        case MoveKind::NertzToRiver: return 0.9;
        case MoveKind::RiverToFoundation: return 0.5;
        case MoveKind::DeckToFoundation: return 0.4;
        case MoveKind::DeckToRiver: return 0.3;
        case MoveKind::RiverToRiver: return 0.3;
        case MoveKind::DeckToDeck: return 0.1;
        }
        return constants::DefaultMoveWeight;
    }

    auto MoveContext::FromFoundations(std::map<FoundationId, Foundation> const& live,
                                      std::vector<FoundationId> const& opened) -> MoveContext
    {
        MoveContext ctx{};
        ctx.opened = opened;
        for (auto const& [id, f] : live)
        {
            ctx.foundations.emplace(id, FoundationSummary{
                .identifier = f.Identifier(),
                .suit = f.SuitOf(),
                .top_rank = f.Top().rank,
                .owner = f.Owner()
            });
        }
        return ctx;
    }

    Move::Move(MoveParams params, MoveContext const& ctx) :
        p_(std::move(params))
    {
        Validate();
        priority_ = CalculatePriority(ctx);
    }

    auto Move::Validate() const -> void
    {
        auto const who = static_cast<int>(p_.player);

        if (p_.destination == PileKind::Foundation && (!p_.foundation_id || p_.foundation_id->empty()))
            NTZ_THROW(error::Code::Validation,
                      fmt::format("Player {}: foundation id must be provided for FoundationPile moves", who));

        if (p_.source == PileKind::River && !p_.source_slot)
            NTZ_THROW(error::Code::Validation,
                      fmt::format("Player {}: source slot must be provided for RiverPile source moves", who));

        if (p_.destination == PileKind::River && !p_.destination_slot)
            NTZ_THROW(error::Code::Validation,
                      fmt::format("Player {}: destination slot must be provided for RiverPile moves", who));

        auto const slot_ok = [](std::optional<uint8_t> const s)
        {
            return !s || *s < constants::RiverSlots;
        };
        if (!slot_ok(p_.source_slot) || !slot_ok(p_.destination_slot))
            NTZ_THROW(error::Code::Validation, fmt::format("Player {}: river slot index out of range", who));

        if (p_.kind != MoveKind::DeckToDeck && p_.card.expired())
            NTZ_THROW(error::Code::Validation, fmt::format("Player {}: {} move without a card", who,
                                                           to_string(p_.kind)));
    }

    auto Move::OpensFoundation() const -> bool
    {
        if (p_.destination != PileKind::Foundation) return false;
        CCardSP const card = p_.card.lock();
        return card && card->rank == Rank::Ace;
    }

    auto Move::CalculatePriority(MoveContext const& ctx) const -> double
    {
        // closer is better, distance costs at most 30% of the base weight
        double const distance_factor = 1.0 - p_.distance * constants::MaxDistancePenaltyFactor;
        return BaseWeight(p_.kind) * distance_factor + StrategicBonus(ctx);
    }

    auto Move::StrategicBonus(MoveContext const& ctx) const -> double
    {
        CCardSP const card = p_.card.lock();
        if (!card) return 0.0;
        if (p_.source != PileKind::Nertz || p_.destination != PileKind::Foundation) return 0.0;

        bool const duplicate_suit = std::ranges::any_of(ctx.foundations, [&](auto const& entry)
        {
            FoundationSummary const& fs = entry.second;
            return fs.suit == card->suit && fs.identifier != p_.foundation_id;
        });
        if (duplicate_suit) return 0.0;

        // high nertz cards are hardest to unload when their foundation is the only outlet
        double const rank_weight = static_cast<double>(RankIndex(card->rank) + 1)
                                 / static_cast<double>(constants::TotalRanks);
        return rank_weight * constants::NertzUniqueFoundationBonus;
    }

    auto Describe(Move const& m) -> std::string
    {
        std::string where_from{to_string(m.Source())};
        if (m.SourceSlot()) where_from += fmt::format("[{}]", *m.SourceSlot());

        std::string where_to{to_string(m.Destination())};
        if (m.DestinationSlot()) where_to += fmt::format("[{}]", *m.DestinationSlot());
        if (m.FoundationTarget()) where_to += fmt::format("[{}]", *m.FoundationTarget());

        return fmt::format("P{} {} {} from {} to {} (priority {:.2f}, distance {:.2f})",
                           static_cast<int>(m.Player()), to_string(m.Kind()),
                           m.IsFlip() ? std::string{"<flip>"} : util::ToString(m.CardRef()),
                           where_from, where_to, m.Priority(), m.Distance());
    }
}
