//
// MoveExecutor.cpp
//

#include "MoveExecutor.hpp"

#include <optional>
#include <string>

#include <fmt/format.h>

#include "Exception.hpp"
#include "Game.hpp"
#include "PileSet.hpp"
#include "Util.hpp"

namespace nertz::core
{
    namespace
    {
        inline auto CardText(CCardSP const& c) -> std::optional<std::string>
        {
            if (!c) return std::nullopt;
            return util::ToString(*c);
        }

        inline auto CheckIdentical(CCardSP const& actual, Card const& expected,
                                   std::string const& pile_name, PlyrIdxT const player) -> void
        {
            if (actual && Identical(*actual, expected)) return;
            throw error::CardMismatchError(pile_name, util::ToString(expected), CardText(actual), player);
        }
    }

    MoveExecutor::MoveExecutor(Logger& log) :
        log_(log)
    {
    }

    auto MoveExecutor::Execute(GameImpl& game, Move const& move) const -> void
    {
        log_.Info("Executing move: {}", Describe(move));

        if (move.Player() >= game.piles_.size())
            NTZ_THROW(error::Code::State, fmt::format("Move for unknown player {}", static_cast<int>(move.Player())));
        PileSet& piles = game.piles_[move.Player()];

        if (move.IsFlip())
        {
            size_t const flipped = piles.FlipIntoStream();
            log_.Info("Player {} flipped {} card(s) into stream.", static_cast<int>(move.Player()), flipped);
            return;
        }

        CardSP const card = move.CardRef().lock();
        if (!card)
            NTZ_THROW(error::Code::Validation,
                      fmt::format("Player {}: {} move without a card", static_cast<int>(move.Player()),
                                  to_string(move.Kind())));

        if (move.Source() == PileKind::River && move.Destination() == PileKind::River)
        {
            TransferRiverSlot(move, piles, *card);
            log_.Debug("Move executed successfully.");
            return;
        }

        VerifySource(move, piles, *card);

        switch (move.Destination())
        {
        case PileKind::Foundation: PlaceOnFoundation(game, move, piles, card); break;
        case PileKind::River: PlaceOnRiver(move, piles, card); break;
        case PileKind::Nertz:
        case PileKind::Deck:
            NTZ_THROW(error::Code::InvalidPile,
                      fmt::format("Player {}: Invalid pile '{}': not a destination", static_cast<int>(move.Player()),
                                  to_string(move.Destination())));
        }

        RemoveFromSource(move, piles);
        log_.Debug("Move executed successfully.");
    }

    auto MoveExecutor::VerifySource(Move const& move, PileSet const& piles, Card const& card) const -> void
    {
        switch (move.Source())
        {
        case PileKind::Nertz:
            CheckIdentical(piles.TopNertz().lock(), card, "NertzPile", move.Player());
            return;
        case PileKind::Deck:
            CheckIdentical(piles.TopStream().lock(), card, "DeckPile (stream)", move.Player());
            return;
        case PileKind::River:
        {
            if (!move.SourceSlot())
                NTZ_THROW(error::Code::Validation,
                          fmt::format("Player {}: river slot source index must be specified for RiverPile moves",
                                      static_cast<int>(move.Player())));
            uint8_t const slot = *move.SourceSlot();
            CheckIdentical(piles.RiverTop(slot).lock(), card,
                           fmt::format("RiverPile (slot {}, top)", slot), move.Player());
            return;
        }
        case PileKind::Foundation:
            NTZ_THROW(error::Code::InvalidPile,
                      fmt::format("Player {}: Invalid pile 'FoundationPile': not a source",
                                  static_cast<int>(move.Player())));
        }
    }

    auto MoveExecutor::PlaceOnFoundation(GameImpl& game, Move const& move, PileSet& piles,
                                         CardSP const& card) const -> void
    {
        PlyrIdxT const player = move.Player();

        if (card->rank == Rank::Ace)
        {
            FoundationId const id = MakeFoundationId(player, card->suit);
            if (game.foundations_.contains(id))
                NTZ_THROW(error::Code::InvalidPile,
                          fmt::format("Player {}: Invalid pile '{}': already exists", static_cast<int>(player), id));

            game.layout_.EnsureFoundation(id);
            game.foundations_.try_emplace(id, card, player);
            game.opened_.push_back(id);
            piles.RecordLake(card);
            log_.Info("Player {} opened {}", static_cast<int>(player), id);
            return;
        }

        NTZ_ASSERT(move.FoundationTarget().has_value(), "Foundation move without a target id");
        FoundationId const& id = *move.FoundationTarget();

        auto const it = game.foundations_.find(id);
        if (it == game.foundations_.end())
            NTZ_THROW(error::Code::InvalidPile,
                      fmt::format("Player {}: Invalid pile '{}': does not exist", static_cast<int>(player), id));

        it->second.AddCard(card);
        piles.RecordLake(card);
    }

    auto MoveExecutor::PlaceOnRiver(Move const& move, PileSet& piles, CardSP const& card) const -> void
    {
        if (!move.DestinationSlot())
            NTZ_THROW(error::Code::Validation,
                      fmt::format("Player {}: river slot destination index must be specified for RiverPile moves",
                                  static_cast<int>(move.Player())));
        piles.PushRiver(*move.DestinationSlot(), card);
    }

    auto MoveExecutor::RemoveFromSource(Move const& move, PileSet& piles) const -> void
    {
        switch (move.Source())
        {
        case PileKind::Nertz: (void)piles.PopNertz(); return;
        case PileKind::Deck: (void)piles.PopStream(); return;
        case PileKind::River: (void)piles.PopRiverTop(*move.SourceSlot()); return;
        case PileKind::Foundation: return;
        }
    }

    auto MoveExecutor::TransferRiverSlot(Move const& move, PileSet& piles, Card const& card) const -> void
    {
        if (!move.SourceSlot() || !move.DestinationSlot())
            NTZ_THROW(error::Code::Validation,
                      fmt::format("Player {}: river-to-river move needs both slot indices",
                                  static_cast<int>(move.Player())));

        uint8_t const from = *move.SourceSlot();
        uint8_t const to = *move.DestinationSlot();
        if (from == to)
            NTZ_THROW(error::Code::Validation,
                      fmt::format("Player {}: river-to-river move onto its own slot {}",
                                  static_cast<int>(move.Player()), from));

        log_.Debug("Removing card {} from RiverPile (player={}, slot={})",
                   util::ToString(card), static_cast<int>(move.Player()), from);

        CheckIdentical(piles.RiverBottom(from).lock(), card,
                       fmt::format("RiverPile (slot {}, bottom)", from), move.Player());

        // bottom first keeps the slot's order on top of the destination
        while (!piles.RiverSlot(from).empty())
        {
            piles.PushRiver(to, piles.PopRiverBottom(from));
        }
    }
}
