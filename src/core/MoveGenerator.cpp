//
// MoveGenerator.cpp
//

#include "MoveGenerator.hpp"

#include <fmt/format.h>

#include "Exception.hpp"
#include "Game.hpp"
#include "Util.hpp"

namespace nertz::core
{
    MoveGenerator::MoveGenerator(Logger& log) :
        log_(log)
    {
    }

    auto MoveGenerator::LegalMoves(GameImpl& game, MoveContext const& ctx, PlyrIdxT const seat) const
        -> std::vector<Move>
    {
        std::vector<Move> legal;

        AddNertzMoves(game, ctx, seat, legal);
        AddRiverToFoundationMoves(game, ctx, seat, legal);
        AddRiverToRiverMoves(game, ctx, seat, legal);
        AddDeckMoves(game, ctx, seat, legal);

        return legal;
    }

    auto MoveGenerator::DistancePlayerToRiver(GameImpl const& game, PlyrIdxT const seat) -> double
    {
        Point const pos = game.LayoutRef().PlayerPosition(seat);
        return Layout::DistanceBetween(pos, pos);
    }

    auto MoveGenerator::GenerateFoundationMove(GameImpl& game,
                                               MoveContext const& ctx,
                                               PlyrIdxT const seat,
                                               CardSP const& card,
                                               PileKind const source,
                                               std::optional<uint8_t> const river_slot) const -> std::optional<Move>
    {
        MoveKind kind{};
        switch (source)
        {
        case PileKind::Nertz: kind = MoveKind::NertzToFoundation; break;
        case PileKind::River: kind = MoveKind::RiverToFoundation; break;
        case PileKind::Deck: kind = MoveKind::DeckToFoundation; break;
        case PileKind::Foundation:
            NTZ_THROW(error::Code::InvalidPile,
                      fmt::format("Player {}: Invalid pile '{}': unsupported source for a foundation move",
                                  static_cast<int>(seat), to_string(source)));
        }

        Point const player_pos = game.LayoutRef().PlayerPosition(seat);

        auto const build = [&](FoundationId const& id, Point const foundation_pos) -> Move
        {
            return Move(MoveParams{
                .player = seat,
                .source = source,
                .destination = PileKind::Foundation,
                .kind = kind,
                .card = card,
                .distance = Layout::DistanceBetween(player_pos, foundation_pos),
                .foundation_id = id,
                .source_slot = river_slot
            }, ctx);
        };

        if (card->rank == Rank::Ace)
        {
            FoundationId const id = MakeFoundationId(seat, card->suit);
            return build(id, game.layout_.EnsureFoundation(id));
        }

        // oldest foundation first when several of the suit accept the card
        for (FoundationId const& id : ctx.opened)
        {
            FoundationSummary const& summary = ctx.foundations.at(id);
            std::optional<Rank> const wanted = NextRank(summary.top_rank);
            if (summary.suit == card->suit && wanted && *wanted == card->rank)
            {
                return build(id, game.LayoutRef().FoundationPosition(id));
            }
        }
        return std::nullopt;
    }

    auto MoveGenerator::GenerateRiverMove(GameImpl const& game,
                                          MoveContext const& ctx,
                                          PlyrIdxT const seat,
                                          CardSP const& card,
                                          PileKind const source) const -> std::optional<Move>
    {
        if (source == PileKind::River)
            NTZ_THROW(error::Code::InvalidPile,
                      fmt::format("Player {}: Invalid pile 'RiverPile': use the river-to-river scan",
                                  static_cast<int>(seat)));

        PileSet const& piles = game.Piles(seat);
        double const distance = DistancePlayerToRiver(game, seat);

        for (uint8_t i{}; i < constants::RiverSlots; ++i)
        {
            CardSP const top = piles.RiverTop(i).lock();
            if (!top || CanStackOn(*card, *top))
            {
                return Move(MoveParams{
                    .player = seat,
                    .source = source,
                    .destination = PileKind::River,
                    .kind = source == PileKind::Deck ? MoveKind::DeckToRiver : MoveKind::NertzToRiver,
                    .card = card,
                    .distance = distance,
                    .destination_slot = i
                }, ctx);
            }
        }
        return std::nullopt;
    }

    auto MoveGenerator::GenerateStreamFlipMove(MoveContext const& ctx, PlyrIdxT const seat) const -> Move
    {
        return Move(MoveParams{
            .player = seat,
            .source = PileKind::Deck,
            .destination = PileKind::Deck,
            .kind = MoveKind::DeckToDeck,
            .card = {},
            .distance = 0.0
        }, ctx);
    }

    auto MoveGenerator::AddNertzMoves(GameImpl& game, MoveContext const& ctx, PlyrIdxT const seat,
                                      std::vector<Move>& out) const -> void
    {
        CardSP const nertz_card = game.Piles(seat).TopNertz().lock();
        if (!nertz_card) return;

        if (auto move = GenerateFoundationMove(game, ctx, seat, nertz_card, PileKind::Nertz))
        {
            out.push_back(std::move(*move));
        }
        else if (auto river = GenerateRiverMove(game, ctx, seat, nertz_card, PileKind::Nertz))
        {
            out.push_back(std::move(*river));
        }
    }

    auto MoveGenerator::AddRiverToFoundationMoves(GameImpl& game, MoveContext const& ctx, PlyrIdxT const seat,
                                                  std::vector<Move>& out) const -> void
    {
        for (uint8_t i{}; i < constants::RiverSlots; ++i)
        {
            CardSP const top = game.Piles(seat).RiverTop(i).lock();
            if (!top) continue;

            if (auto move = GenerateFoundationMove(game, ctx, seat, top, PileKind::River, i))
            {
                out.push_back(std::move(*move));
            }
        }
    }

    auto MoveGenerator::AddRiverToRiverMoves(GameImpl const& game, MoveContext const& ctx, PlyrIdxT const seat,
                                             std::vector<Move>& out) const -> void
    {
        PileSet const& piles = game.Piles(seat);
        double const distance = DistancePlayerToRiver(game, seat);

        for (uint8_t i{}; i < constants::RiverSlots; ++i)
        {
            // the whole slot moves, so its bottom card must fit the destination top
            CardSP const bottom = piles.RiverBottom(i).lock();
            if (!bottom) continue;

            for (uint8_t j{}; j < constants::RiverSlots; ++j)
            {
                if (i == j) continue;
                CardSP const dest_top = piles.RiverTop(j).lock();
                if (!dest_top || !CanStackOn(*bottom, *dest_top)) continue;

                log_.Debug("Legal RiverToRiver move: player={} card={} from_slot={} to_slot={} distance={:.2f}",
                           static_cast<int>(seat), util::ToString(*bottom), i, j, distance);

                out.emplace_back(MoveParams{
                    .player = seat,
                    .source = PileKind::River,
                    .destination = PileKind::River,
                    .kind = MoveKind::RiverToRiver,
                    .card = bottom,
                    .distance = distance,
                    .source_slot = i,
                    .destination_slot = j
                }, ctx);
            }
        }
    }

    auto MoveGenerator::AddDeckMoves(GameImpl& game, MoveContext const& ctx, PlyrIdxT const seat,
                                     std::vector<Move>& out) const -> void
    {
        out.push_back(GenerateStreamFlipMove(ctx, seat));

        CardSP const stream_top = game.Piles(seat).TopStream().lock();
        if (!stream_top) return;

        if (auto river = GenerateRiverMove(game, ctx, seat, stream_top, PileKind::Deck))
        {
            out.push_back(std::move(*river));
        }
        else if (auto move = GenerateFoundationMove(game, ctx, seat, stream_top, PileKind::Deck))
        {
            out.push_back(std::move(*move));
        }
    }
}
