//
// MoveGenerator.hpp: legal move enumeration per player
//

#ifndef NERTZSIM_MOVEGENERATOR_HPP
#define NERTZSIM_MOVEGENERATOR_HPP

#include <optional>
#include <vector>

#include "Types.hpp"
#include "Move.hpp"
#include "Logger.hpp"

namespace nertz::core
{
    //forward declaration
    class GameImpl;

    // Enumerates every legal move of one player against the turn-start MoveContext.
    // Categories are appended in a fixed order: nertz, river->foundation,
    // river->river, deck/stream.
    class MoveGenerator
    {
    public:
        explicit MoveGenerator(Logger& log);

        auto LegalMoves(GameImpl& game, MoveContext const& ctx, PlyrIdxT seat) const -> std::vector<Move>;

        // First foundation accepting the card as its next rank. An Ace always yields a
        // move opening foundation_<seat>_<suit>; its position is reserved idempotently.
        auto GenerateFoundationMove(GameImpl& game,
                                    MoveContext const& ctx,
                                    PlyrIdxT seat,
                                    CardSP const& card,
                                    PileKind source,
                                    std::optional<uint8_t> river_slot = std::nullopt) const -> std::optional<Move>;

        // First river slot that is empty or accepts the card by solitaire adjacency.
        // Not for river->river moves (throws InvalidPileError).
        auto GenerateRiverMove(GameImpl const& game,
                               MoveContext const& ctx,
                               PlyrIdxT seat,
                               CardSP const& card,
                               PileKind source) const -> std::optional<Move>;

        auto GenerateStreamFlipMove(MoveContext const& ctx, PlyrIdxT seat) const -> Move;

    private:
        auto AddNertzMoves(GameImpl& game, MoveContext const& ctx, PlyrIdxT seat, std::vector<Move>& out) const -> void;
        auto AddRiverToFoundationMoves(GameImpl& game, MoveContext const& ctx, PlyrIdxT seat, std::vector<Move>& out) const -> void;
        auto AddRiverToRiverMoves(GameImpl const& game, MoveContext const& ctx, PlyrIdxT seat, std::vector<Move>& out) const -> void;
        auto AddDeckMoves(GameImpl& game, MoveContext const& ctx, PlyrIdxT seat, std::vector<Move>& out) const -> void;

        // rivers sit with the player
        static auto DistancePlayerToRiver(GameImpl const& game, PlyrIdxT seat) -> double;

    private:
        Logger& log_;
    };
}

#endif //NERTZSIM_MOVEGENERATOR_HPP
