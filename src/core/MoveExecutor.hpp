//
// MoveExecutor.hpp
//

#ifndef NERTZSIM_MOVEEXECUTOR_HPP
#define NERTZSIM_MOVEEXECUTOR_HPP

#include "Types.hpp"
#include "Move.hpp"
#include "Logger.hpp"

namespace nertz::core
{
    //forward declarations
    class GameImpl;
    class PileSet;

    // Applies a resolved move to the mover's piles and the shared foundations.
    // The source card is verified by identity before anything is touched, then the
    // destination receives it and the source gives it up. Throws CardMismatchError,
    // InvalidPileError or ValidationError; nothing is rolled back by the caller.
    class MoveExecutor
    {
    public:
        explicit MoveExecutor(Logger& log);

        auto Execute(GameImpl& game, Move const& move) const -> void;

    private:
        auto VerifySource(Move const& move, PileSet const& piles, Card const& card) const -> void;
        auto PlaceOnFoundation(GameImpl& game, Move const& move, PileSet& piles, CardSP const& card) const -> void;
        auto PlaceOnRiver(Move const& move, PileSet& piles, CardSP const& card) const -> void;
        auto RemoveFromSource(Move const& move, PileSet& piles) const -> void;
        auto TransferRiverSlot(Move const& move, PileSet& piles, Card const& card) const -> void;

    private:
        Logger& log_;
    };
}

#endif //NERTZSIM_MOVEEXECUTOR_HPP
