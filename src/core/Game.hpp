//
// Game.hpp: authoritative table state and the turn loop
//

#ifndef NERTZSIM_GAME_HPP
#define NERTZSIM_GAME_HPP

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <vector>

#include "Types.hpp"
#include "State.hpp"
#include "Logger.hpp"
#include "PileSet.hpp"
#include "Foundation.hpp"
#include "Layout.hpp"
#include "Move.hpp"
#include "MoveGenerator.hpp"
#include "ConflictResolver.hpp"
#include "MoveExecutor.hpp"

namespace nertz::core::debug {struct Inspector;}
namespace nertz::core
{
    // Authoritative game state plus the turn loop:
    // generate -> select -> resolve -> execute, for all players at once.
    class GameImpl
    {
    public:
        GameImpl() = delete;
        // Deals every player's starting hand; the game is not started until StartNewGame.
        explicit GameImpl(Config const& config, std::shared_ptr<Logger> log = nullptr);

        GameImpl(GameImpl const&) = delete;
        auto operator=(GameImpl const&) -> GameImpl& = delete;

        auto StartNewGame() -> void;

        // Throws GameNotStartedError before StartNewGame and GameOverError once any
        // nertz pile is empty (final scores are processed the first time).
        // No rollback: moves executed before a failing one stay applied.
        auto PlayTurn() -> TurnReport;

        auto IsGameOver() const -> bool;
        auto IsStarted() const noexcept -> bool { return started_; }
        auto Turn() const noexcept -> uint32_t { return turn_; }
        auto PlayerCount() const noexcept -> size_t { return piles_.size(); }
        auto Seed() const noexcept -> uint64_t { return cfg_.seed; }
        // Wall-clock time since StartNewGame, frozen once game over is seen. Zero before start.
        auto Elapsed() const -> std::chrono::duration<double>;

        auto Piles(PlyrIdxT seat) const -> PileSet const&;
        auto Foundations() const noexcept -> std::map<FoundationId, Foundation> const& { return foundations_; }
        //returns nullptr if doesnt exist
        auto FindFoundation(FoundationId const& id) const -> Foundation const*;
        auto LayoutRef() const noexcept -> Layout const& { return layout_; }

        auto Scores() const noexcept -> std::vector<int> const& { return scores_; }
        auto ScoresProcessed() const noexcept -> bool { return scored_; }
        // highest running score, lowest seat on ties; empty until scores are processed
        auto Winner() const -> std::optional<PlyrIdxT>;

        auto Snapshot() const -> std::shared_ptr<GameSnapshot const>;
        // Foundation summaries frozen for one round of move generation.
        auto CaptureContext() const -> MoveContext;

        auto Log() noexcept -> Logger& { return *log_; }

        // Highest priority + distance wins, first one on ties.
        static auto SelectMove(std::vector<Move> const& moves) -> std::optional<Move>;

        //allows components to directly access private data on an instance
        friend class MoveGenerator;
        friend class MoveExecutor;
        friend class Scoring;
        friend struct debug::Inspector;

    private:
        auto DealInitialHands() -> void;

    private:
        Config cfg_;
        std::shared_ptr<Logger> log_;
        std::mt19937_64 rng_;

        // Authoritative state
        std::vector<PileSet> piles_;                        // [seat] owns that player's cards
        std::map<FoundationId, Foundation> foundations_;    // shared, keyed foundation_<owner>_<suit>
        std::vector<FoundationId> opened_;                  // foundation ids in creation order
        Layout layout_;

        MoveGenerator generator_;
        ConflictResolver resolver_;
        MoveExecutor executor_;

        // Lifecycle
        uint32_t turn_{0};
        bool started_{false};
        bool scored_{false};
        std::chrono::steady_clock::time_point started_at_{};
        std::optional<std::chrono::steady_clock::time_point> ended_at_;
        std::vector<int> scores_;
    };
}
#endif //NERTZSIM_GAME_HPP
