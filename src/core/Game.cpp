//
// Game.cpp
//

#include "Game.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <ranges>
#include <utility>

#include <fmt/format.h>

#include "Exception.hpp"
#include "Scoring.hpp"
#include "Util.hpp"

namespace nertz::core
{
    namespace
    {
        // foundation jitter draws from its own stream so deals stay independent of it
        constexpr uint64_t LayoutSeedSalt = 0x9E3779B97F4A7C15ULL;

        auto DefaultLogger() -> std::shared_ptr<Logger>
        {
            return std::make_shared<Logger>(std::clog, LogLevel::Info);
        }
    }

    GameImpl::GameImpl(Config const& config, std::shared_ptr<Logger> log) :
        cfg_(config),
        log_(log ? std::move(log) : DefaultLogger()),
        rng_{cfg_.seed},
        layout_(cfg_.n_players, cfg_.seed ^ LayoutSeedSalt, *log_),
        generator_(*log_),
        resolver_(*log_),
        executor_(*log_),
        scores_(cfg_.n_players, 0)
    {
        if (cfg_.n_players < 2)
            log_->Warning("Configured with {} player(s); layout assumes at least 2", cfg_.n_players);
        NTZ_ASSERT(cfg_.n_players <= 255, "Player count does not fit a seat index");
        DealInitialHands();
    }

    auto GameImpl::DealInitialHands() -> void
    {
        piles_.clear();
        piles_.reserve(cfg_.n_players);
        for (uint32_t i{}; i < cfg_.n_players; ++i)
        {
            piles_.emplace_back(static_cast<PlyrIdxT>(i));
            piles_.back().DealStartingHand(rng_);
        }
    }

    auto GameImpl::StartNewGame() -> void
    {
        turn_ = 0;
        started_ = true;
        started_at_ = std::chrono::steady_clock::now();
        ended_at_.reset();
        log_->Info("Starting new game: {} players, seed {}", piles_.size(), cfg_.seed);
    }

    auto GameImpl::IsGameOver() const -> bool
    {
        return std::ranges::any_of(piles_, [](PileSet const& p) { return p.Nertz().empty(); });
    }

    auto GameImpl::Elapsed() const -> std::chrono::duration<double>
    {
        if (!started_) return {};
        return ended_at_.value_or(std::chrono::steady_clock::now()) - started_at_;
    }

    auto GameImpl::Piles(PlyrIdxT const seat) const -> PileSet const&
    {
        if (seat >= piles_.size())
            NTZ_THROW(error::Code::State, fmt::format("No player at seat {}", static_cast<int>(seat)));
        return piles_[seat];
    }

    auto GameImpl::FindFoundation(FoundationId const& id) const -> Foundation const*
    {
        auto const it = foundations_.find(id);
        return (it != foundations_.end()) ? &it->second : nullptr;
    }

    auto GameImpl::Winner() const -> std::optional<PlyrIdxT>
    {
        if (!scored_ || scores_.empty()) return std::nullopt;
        // first of equal maxima
        auto const best = std::ranges::max_element(scores_);
        return static_cast<PlyrIdxT>(std::distance(scores_.begin(), best));
    }

    auto GameImpl::CaptureContext() const -> MoveContext
    {
        return MoveContext::FromFoundations(foundations_, opened_);
    }

    auto GameImpl::SelectMove(std::vector<Move> const& moves) -> std::optional<Move>
    {
        // priority + distance, not priority alone: this partly cancels the distance
        // penalty inside priority and decides which move wins each turn
        double highest_total = -1.0;
        std::optional<Move> chosen{};
        for (Move const& move : moves)
        {
            double const combined = move.Priority() + move.Distance();
            if (combined > highest_total)
            {
                highest_total = combined;
                chosen = move;
            }
        }
        return chosen;
    }

    auto GameImpl::PlayTurn() -> TurnReport
    {
        if (!started_)
            NTZ_THROW(error::Code::GameNotStarted, "Game has not been started.");

        if (IsGameOver())
        {
            log_->Info("Game over. Cannot play further turns.");
            if (!ended_at_) ended_at_ = std::chrono::steady_clock::now();
            if (!scored_)
            {
                (void)Scoring::ProcessGameScores(*this, *log_);
                scored_ = true;
            }
            NTZ_THROW(error::Code::GameOver, "Game is over. Cannot play further turns.");
        }

        ++turn_;
        log_->Info("--- Turn {} ---", turn_);

        TurnReport report{.turn = turn_};
        MoveContext const ctx = CaptureContext();

        for (PileSet const& piles : piles_)
        {
            PlyrIdxT const seat = piles.Owner();
            Point const pos = layout_.PlayerPosition(seat);
            std::vector<Move> const legal = generator_.LegalMoves(*this, ctx, seat);

            log_->Info("Player {} at ({:.4f}, {:.4f}) has {} legal moves.", static_cast<int>(seat), pos.x, pos.y,
                       legal.size());
            for (Move const& move : legal)
            {
                log_->Debug("  {}", Describe(move));
            }

            if (std::optional<Move> chosen = SelectMove(legal))
            {
                log_->Info("Chosen Move: {}", Describe(*chosen));
                report.chosen.push_back(std::move(*chosen));
            }
        }

        Resolution resolution = resolver_.Resolve(report.chosen);
        report.conflicts = std::move(resolution.conflicts);

        for (Move const& move : resolution.executable)
        {
            executor_.Execute(*this, move);
            report.executed.push_back(move);
        }

        if (IsGameOver())
        {
            log_->Info("Game over detected after turn {}.", turn_);
            ended_at_ = std::chrono::steady_clock::now();
        }
        return report;
    }

    auto GameImpl::Snapshot() const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->turn = turn_;
        snap->started = started_;
        snap->game_over = IsGameOver();

        snap->players.reserve(piles_.size());
        for (PileSet const& p : piles_)
        {
            PlayerView view{};
            view.seat = p.Owner();
            view.position = layout_.PlayerPosition(p.Owner());
            view.nertz_top = p.TopNertz();
            view.nertz_count = p.Nertz().size();
            view.stream_top = p.TopStream();
            view.stream_count = p.Stream().size();
            view.deck_count = p.CardsLeft();
            for (size_t i{}; i < constants::RiverSlots; ++i)
            {
                RiverSlotT const& slot = p.RiverSlot(i);
                view.river[i] = std::vector<CardWP>(slot.cbegin(), slot.cend());
            }
            view.lake_count = p.Lake().size();
            view.score = scores_[p.Owner()];
            snap->players.push_back(std::move(view));
        }

        snap->foundations.reserve(foundations_.size());
        for (auto const& [id, f] : foundations_)
        {
            snap->foundations.push_back(FoundationView{
                .id = id,
                .owner = f.Owner(),
                .suit = f.SuitOf(),
                .top = f.TopRef(),
                .size = f.Size(),
                .position = layout_.FoundationPosition(id)
            });
        }
        return snap;
    }
}
