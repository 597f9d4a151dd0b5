//
// Scoring.hpp
//

#ifndef NERTZSIM_SCORING_HPP
#define NERTZSIM_SCORING_HPP

#include <vector>

#include "Types.hpp"
#include "Logger.hpp"

namespace nertz::core
{
    //forward declarations
    class GameImpl;
    class PileSet;

    class Scoring
    {
    public:
        // -2 per nertz card left, +1 per lake card
        static auto Score(PileSet const& piles) -> int;

        // Adds every player's score to its running total and returns this round's
        // scores. Not idempotent: a second call counts again.
        static auto ProcessGameScores(GameImpl& game, Logger& log) -> std::vector<int>;
    };
}

#endif //NERTZSIM_SCORING_HPP
