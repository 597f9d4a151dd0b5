//
// Scoring.cpp
//

#include "Scoring.hpp"

#include "Game.hpp"
#include "PileSet.hpp"

namespace nertz::core
{
    auto Scoring::Score(PileSet const& piles) -> int
    {
        int const nertz_remaining = static_cast<int>(piles.Nertz().size());
        int const lake_played = static_cast<int>(piles.Lake().size());
        return nertz_remaining * -2 + lake_played;
    }

    auto Scoring::ProcessGameScores(GameImpl& game, Logger& log) -> std::vector<int>
    {
        log.Info("Game scores processed:");

        std::vector<int> round;
        round.reserve(game.piles_.size());
        for (PileSet const& piles : game.piles_)
        {
            int const score = Score(piles);
            log.Info("Player {}: Nertz remaining={}, Lake played={}, Score={}",
                     static_cast<int>(piles.Owner()), piles.Nertz().size(), piles.Lake().size(), score);

            game.scores_[piles.Owner()] += score;
            round.push_back(score);
        }
        return round;
    }
}
