//
// Engine.cpp
//

#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Util.hpp"
#include "../core/Game.hpp"
#include "../core/MoveExecutor.hpp"
#include "../core/Scoring.hpp"
#include "../core/Exception.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/AuditLogger.hpp"

using namespace nertz::core;
using nertz::core::debug::Inspector;

namespace
{
    struct Fixture
    {
        explicit Fixture(uint32_t players = 2, uint64_t seed = 2024) :
            log(std::make_shared<Logger>(sink, LogLevel::Warning)),
            game(Config{.n_players = players, .seed = seed}, log),
            executor(*log)
        {
        }

        auto P(PlyrIdxT seat) -> PileSet& { return Inspector::Piles(game, seat); }

        std::ostringstream sink;
        std::shared_ptr<Logger> log;
        GameImpl game;
        MoveExecutor executor;
    };

    auto FromNertz(PlyrIdxT seat, CardSP const& card, MoveContext const& ctx, FoundationId id) -> Move
    {
        return Move(MoveParams{
            .player = seat,
            .source = PileKind::Nertz,
            .destination = PileKind::Foundation,
            .kind = MoveKind::NertzToFoundation,
            .card = card,
            .foundation_id = std::move(id)
        }, ctx);
    }

    auto RiverToRiver(PlyrIdxT seat, CardSP const& card, uint8_t from, uint8_t to) -> Move
    {
        return Move(MoveParams{
            .player = seat,
            .source = PileKind::River,
            .destination = PileKind::River,
            .kind = MoveKind::RiverToRiver,
            .card = card,
            .source_slot = from,
            .destination_slot = to
        }, MoveContext{});
    }
}

// ---------- MoveExecutor ----------

TEST(MoveExecutor, Wrong_Nertz_Card_Reports_And_Leaves_State)
{
    Fixture f;
    PileSet& p0 = f.P(0);
    CardSP const top = p0.Nertz().back();
    CardSP const buried = p0.Deck().front();
    size_t const nertz_before = p0.Nertz().size();
    size_t const river_before = p0.RiverSlot(0).size();

    Move const m(MoveParams{.player = 0, .source = PileKind::Nertz, .destination = PileKind::River,
                            .kind = MoveKind::NertzToRiver, .card = buried, .destination_slot = 0},
                 MoveContext{});
    try
    {
        f.executor.Execute(f.game, m);
        FAIL() << "expected a card mismatch";
    }
    catch (error::CardMismatchError const& e)
    {
        EXPECT_EQ(e.PileName(), "NertzPile");
        EXPECT_EQ(e.Expected(), util::ToString(*buried));
        ASSERT_TRUE(e.Actual().has_value());
        EXPECT_EQ(*e.Actual(), util::ToString(*top));
        EXPECT_EQ(e.Player(), 0);
        EXPECT_EQ(e.data(), error::Code::CardMismatch);
        EXPECT_NE(e.what().find("Card mismatch at NertzPile"), std::string::npos);
    }
    EXPECT_EQ(p0.Nertz().size(), nertz_before);
    EXPECT_EQ(p0.RiverSlot(0).size(), river_before);
    EXPECT_EQ(p0.TopNertz().lock(), top);
}

TEST(MoveExecutor, Empty_Nertz_Mismatch_Says_Empty)
{
    Fixture f;
    PileSet& p1 = f.P(1);
    CardSP const card = p1.Nertz().back();
    Move const m(MoveParams{.player = 1, .source = PileKind::Nertz, .destination = PileKind::River,
                            .kind = MoveKind::NertzToRiver, .card = card, .destination_slot = 1},
                 MoveContext{});
    Inspector::EmptyNertz(p1);

    try
    {
        f.executor.Execute(f.game, m);
        FAIL() << "expected a card mismatch";
    }
    catch (error::CardMismatchError const& e)
    {
        EXPECT_FALSE(e.Actual().has_value());
        EXPECT_NE(e.what().find("<empty>"), std::string::npos);
    }
}

TEST(MoveExecutor, Missing_Foundation_Is_Invalid_Pile)
{
    Fixture f;
    PileSet& p0 = f.P(0);
    CardSP const five = Inspector::PutOnNertz(p0, Suit::Spades, Rank::Five);
    size_t const nertz_before = p0.Nertz().size();

    Move const m = FromNertz(0, five, MoveContext{}, "foundation_1_spades");
    EXPECT_THROW(f.executor.Execute(f.game, m), error::InvalidPileError);
    EXPECT_EQ(p0.Nertz().size(), nertz_before);
    EXPECT_EQ(p0.TopNertz().lock(), five);
    EXPECT_TRUE(p0.Lake().empty());
}

TEST(MoveExecutor, Nertz_Is_Not_A_Destination)
{
    Fixture f;
    PileSet& p0 = f.P(0);
    CardSP const top = p0.Stream().back();
    Move const m(MoveParams{.player = 0, .source = PileKind::Deck, .destination = PileKind::Nertz,
                            .kind = MoveKind::DeckToRiver, .card = top}, MoveContext{});
    EXPECT_THROW(f.executor.Execute(f.game, m), error::InvalidPileError);
    EXPECT_EQ(p0.TopStream().lock(), top);
}

TEST(MoveExecutor, Ace_From_River_Opens_Foundation)
{
    Fixture f;
    PileSet& p0 = f.P(0);
    Inspector::ClearRiver(p0);
    CardSP const ace = Inspector::PutOnRiver(p0, 2, Suit::Clubs, Rank::Ace);

    Move const m(MoveParams{.player = 0, .source = PileKind::River, .destination = PileKind::Foundation,
                            .kind = MoveKind::RiverToFoundation, .card = ace,
                            .foundation_id = "foundation_0_clubs", .source_slot = 2}, MoveContext{});
    f.executor.Execute(f.game, m);

    Foundation const* fnd = f.game.FindFoundation("foundation_0_clubs");
    ASSERT_NE(fnd, nullptr);
    EXPECT_EQ(fnd->Size(), 1u);
    EXPECT_EQ(fnd->Owner(), 0);
    EXPECT_TRUE(p0.RiverSlot(2).empty());
    ASSERT_EQ(p0.Lake().size(), 1u);
    EXPECT_EQ(p0.Lake().front().lock(), ace);
    EXPECT_TRUE(f.game.LayoutRef().HasFoundation("foundation_0_clubs"));
    debug::CheckInvariants(f.game);
}

TEST(MoveExecutor, Stream_To_River_And_Flip)
{
    Fixture f;
    PileSet& p1 = f.P(1);
    Inspector::ClearRiver(p1);
    CardSP const top = p1.Stream().back();
    size_t const stream_before = p1.Stream().size();

    f.executor.Execute(f.game, Move(MoveParams{.player = 1, .source = PileKind::Deck,
                                               .destination = PileKind::River, .kind = MoveKind::DeckToRiver,
                                               .card = top, .destination_slot = 0}, MoveContext{}));
    EXPECT_EQ(p1.RiverTop(0).lock(), top);
    EXPECT_EQ(p1.Stream().size(), stream_before - 1);

    size_t const deck_before = p1.CardsLeft();
    f.executor.Execute(f.game, Move(MoveParams{.player = 1, .source = PileKind::Deck,
                                               .destination = PileKind::Deck, .kind = MoveKind::DeckToDeck},
                                    MoveContext{}));
    EXPECT_EQ(p1.CardsLeft(), deck_before - 3);
    EXPECT_EQ(p1.Stream().size(), stream_before - 1 + 3);
    debug::CheckInvariants(f.game);
}

TEST(MoveExecutor, River_To_River_Moves_The_Whole_Slot)
{
    Fixture f;
    PileSet& p0 = f.P(0);
    Inspector::ClearRiver(p0);
    CardSP const nine = Inspector::PutOnRiver(p0, 0, Suit::Hearts, Rank::Nine);
    CardSP const eight = Inspector::PutOnRiver(p0, 1, Suit::Spades, Rank::Eight);
    CardSP const seven = Inspector::PutOnRiver(p0, 1, Suit::Hearts, Rank::Seven);

    f.executor.Execute(f.game, RiverToRiver(0, eight, 1, 0));

    RiverSlotT const& dest = p0.RiverSlot(0);
    ASSERT_EQ(dest.size(), 3u);
    EXPECT_EQ(dest[0], nine);
    EXPECT_EQ(dest[1], eight);
    EXPECT_EQ(dest[2], seven);
    EXPECT_TRUE(p0.RiverSlot(1).empty());
    debug::CheckInvariants(f.game);
}

TEST(MoveExecutor, River_To_River_Checks_The_Bottom_Card)
{
    Fixture f;
    PileSet& p0 = f.P(0);
    Inspector::ClearRiver(p0);
    (void)Inspector::PutOnRiver(p0, 0, Suit::Hearts, Rank::Nine);
    (void)Inspector::PutOnRiver(p0, 1, Suit::Spades, Rank::Eight);
    CardSP const seven = Inspector::PutOnRiver(p0, 1, Suit::Hearts, Rank::Seven);

    try
    {
        f.executor.Execute(f.game, RiverToRiver(0, seven, 1, 0));
        FAIL() << "expected a card mismatch";
    }
    catch (error::CardMismatchError const& e)
    {
        EXPECT_EQ(e.PileName(), "RiverPile (slot 1, bottom)");
    }
    EXPECT_EQ(p0.RiverSlot(0).size(), 1u);
    EXPECT_EQ(p0.RiverSlot(1).size(), 2u);

    EXPECT_THROW(f.executor.Execute(f.game, RiverToRiver(0, seven, 1, 1)), error::ValidationError);
}

// ---------- GameImpl ----------

TEST(Game, Fresh_Snapshot)
{
    Fixture f(3, 5);
    auto const snap = f.game.Snapshot();
    EXPECT_FALSE(snap->started);
    EXPECT_FALSE(snap->game_over);
    EXPECT_EQ(snap->turn, 0u);
    ASSERT_EQ(snap->players.size(), 3u);
    EXPECT_TRUE(snap->foundations.empty());
    for (PlayerView const& pv : snap->players)
    {
        EXPECT_EQ(pv.nertz_count, 13u);
        EXPECT_EQ(pv.stream_count, 3u);
        EXPECT_EQ(pv.deck_count, 32u);
        EXPECT_EQ(pv.lake_count, 0u);
        EXPECT_EQ(pv.score, 0);
        EXPECT_FALSE(pv.nertz_top.expired());
        for (auto const& slot : pv.river)
        {
            EXPECT_EQ(slot.size(), 1u);
        }
    }
    debug::CheckInvariants(f.game);
}

TEST(Game, Turn_Before_Start_Throws)
{
    Fixture f;
    EXPECT_FALSE(f.game.IsStarted());
    EXPECT_EQ(f.game.Elapsed().count(), 0.0);
    EXPECT_THROW((void)f.game.PlayTurn(), error::GameNotStartedError);
    EXPECT_EQ(f.game.Turn(), 0u);
}

TEST(Game, Turns_Count_Up)
{
    Fixture f;
    f.game.StartNewGame();
    TurnReport const r1 = f.game.PlayTurn();
    TurnReport const r2 = f.game.PlayTurn();
    EXPECT_EQ(r1.turn, 1u);
    EXPECT_EQ(r2.turn, 2u);
    EXPECT_EQ(f.game.Turn(), 2u);
    // every player always has at least the flip
    EXPECT_EQ(r1.chosen.size(), 2u);
    EXPECT_FALSE(r1.executed.empty());
}

TEST(Game, Two_Players_Two_Aces_Of_A_Suit)
{
    Fixture f;
    (void)Inspector::PutOnNertz(f.P(0), Suit::Hearts, Rank::Ace);
    (void)Inspector::PutOnNertz(f.P(1), Suit::Hearts, Rank::Ace);

    f.game.StartNewGame();
    TurnReport const r = f.game.PlayTurn();

    EXPECT_TRUE(r.conflicts.empty());
    EXPECT_EQ(r.executed.size(), 2u);
    EXPECT_NE(f.game.FindFoundation("foundation_0_hearts"), nullptr);
    EXPECT_NE(f.game.FindFoundation("foundation_1_hearts"), nullptr);
    EXPECT_EQ(f.game.Piles(0).Lake().size(), 1u);
    EXPECT_EQ(f.game.Piles(1).Lake().size(), 1u);
    debug::CheckInvariants(f.game);
}

TEST(Game, Contested_Two_Leaves_The_Loser_Untouched)
{
    Fixture f;
    FoundationId const id = Inspector::OpenFoundation(f.game, 0, Suit::Hearts);
    // sitting on the foundation gives player 1 distance 0 and the higher priority
    Inspector::PinFoundation(f.game, id, f.game.LayoutRef().PlayerPosition(1));
    CardSP const two0 = Inspector::PutOnNertz(f.P(0), Suit::Hearts, Rank::Two);
    CardSP const two1 = Inspector::PutOnNertz(f.P(1), Suit::Hearts, Rank::Two);
    size_t const n0 = f.P(0).Nertz().size();
    size_t const n1 = f.P(1).Nertz().size();
    size_t const stream0 = f.P(0).Stream().size();
    size_t const deck0 = f.P(0).CardsLeft();

    f.game.StartNewGame();
    TurnReport const r = f.game.PlayTurn();

    ASSERT_EQ(r.chosen.size(), 2u);
    ASSERT_EQ(r.chosen[0].FoundationTarget(), std::optional<FoundationId>{id});
    ASSERT_EQ(r.chosen[1].FoundationTarget(), std::optional<FoundationId>{id});
    EXPECT_DOUBLE_EQ(r.chosen[1].Distance(), 0.0);
    EXPECT_GT(r.chosen[1].Priority(), r.chosen[0].Priority());

    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].foundation, id);
    EXPECT_EQ(r.conflicts[0].winner, 1);
    EXPECT_EQ(r.conflicts[0].discarded, 1u);
    ASSERT_EQ(r.executed.size(), 1u);
    EXPECT_EQ(r.executed[0].Player(), 1);

    Foundation const* fnd = f.game.FindFoundation(id);
    ASSERT_NE(fnd, nullptr);
    EXPECT_EQ(fnd->Size(), 2u);
    EXPECT_EQ(fnd->TopRef().lock(), two1);
    EXPECT_EQ(f.game.Piles(1).Nertz().size(), n1 - 1);
    EXPECT_EQ(f.game.Piles(1).Lake().size(), 1u);

    // player 0 lost: nothing of theirs moved
    EXPECT_EQ(f.game.Piles(0).Nertz().size(), n0);
    EXPECT_EQ(f.game.Piles(0).TopNertz().lock(), two0);
    EXPECT_EQ(f.game.Piles(0).Stream().size(), stream0);
    EXPECT_EQ(f.game.Piles(0).CardsLeft(), deck0);
    EXPECT_EQ(f.game.Piles(0).Lake().size(), 1u);
    debug::CheckInvariants(f.game);
}

TEST(Game, Game_Over_Scores_Once)
{
    Fixture f;
    Inspector::EmptyNertz(f.P(0));
    EXPECT_TRUE(f.game.IsGameOver());
    EXPECT_FALSE(f.game.Winner().has_value());

    f.game.StartNewGame();
    EXPECT_THROW((void)f.game.PlayTurn(), error::GameOverError);
    EXPECT_TRUE(f.game.ScoresProcessed());
    EXPECT_EQ(f.game.Scores(), (std::vector<int>{0, -26}));
    EXPECT_EQ(f.game.Winner(), std::optional<PlyrIdxT>{0});

    auto const elapsed = f.game.Elapsed();
    EXPECT_GE(elapsed.count(), 0.0);

    EXPECT_THROW((void)f.game.PlayTurn(), error::GameOverError);
    EXPECT_EQ(f.game.Scores(), (std::vector<int>{0, -26}));
    EXPECT_TRUE(f.game.Snapshot()->game_over);
    // the clock stopped at game over
    EXPECT_EQ(f.game.Elapsed(), elapsed);
}

TEST(Game, Tied_Scores_Go_To_Lowest_Seat)
{
    Fixture f(3, 9);
    Inspector::EmptyNertz(f.P(1));
    Inspector::EmptyNertz(f.P(2));
    f.game.StartNewGame();
    EXPECT_THROW((void)f.game.PlayTurn(), error::GameOverError);
    EXPECT_EQ(f.game.Scores(), (std::vector<int>{-26, 0, 0}));
    EXPECT_EQ(f.game.Winner(), std::optional<PlyrIdxT>{1});
}

TEST(Game, Same_Seed_Same_Game)
{
    Fixture a(3, 314);
    Fixture b(3, 314);
    a.game.StartNewGame();
    b.game.StartNewGame();

    for (int i{}; i < 40 && !a.game.IsGameOver(); ++i)
    {
        TurnReport const ra = a.game.PlayTurn();
        TurnReport const rb = b.game.PlayTurn();
        ASSERT_EQ(ra.executed.size(), rb.executed.size());
        for (size_t k{}; k < ra.executed.size(); ++k)
        {
            EXPECT_EQ(ra.executed[k].Player(), rb.executed[k].Player());
            EXPECT_EQ(ra.executed[k].Kind(), rb.executed[k].Kind());
            EXPECT_DOUBLE_EQ(ra.executed[k].Priority(), rb.executed[k].Priority());
        }
    }
    for (PlyrIdxT seat{}; seat < 3; ++seat)
    {
        EXPECT_EQ(a.game.Piles(seat).Nertz().size(), b.game.Piles(seat).Nertz().size());
        EXPECT_EQ(a.game.Piles(seat).Lake().size(), b.game.Piles(seat).Lake().size());
    }
    EXPECT_EQ(a.game.Foundations().size(), b.game.Foundations().size());
}

// ---------- Scoring ----------

TEST(Scoring, Nertz_Costs_Two_Lake_Earns_One)
{
    Fixture f;
    EXPECT_EQ(Scoring::Score(f.game.Piles(0)), -26);

    (void)Inspector::OpenFoundation(f.game, 0, Suit::Spades);
    PileSet const& p0 = f.game.Piles(0);
    int const expected = -2 * static_cast<int>(p0.Nertz().size()) + 1;
    EXPECT_EQ(Scoring::Score(p0), expected);
}

TEST(Scoring, Processing_Accumulates_Every_Call)
{
    Fixture f;
    std::vector<int> const round = Scoring::ProcessGameScores(f.game, *f.log);
    EXPECT_EQ(round, (std::vector<int>{-26, -26}));
    (void)Scoring::ProcessGameScores(f.game, *f.log);
    EXPECT_EQ(f.game.Scores(), (std::vector<int>{-52, -52}));
}

// ---------- Invariants ----------

TEST(Invariants, Catch_A_Card_In_Two_Piles)
{
    Fixture f;
    debug::CheckInvariants(f.game);
    PileSet& p0 = f.P(0);
    Inspector::River(p0, 0).push_back(p0.Nertz().back());
    EXPECT_THROW(debug::CheckInvariants(f.game), error::AssertionError);
}

TEST(Invariants, Catch_A_Card_In_The_Wrong_Hands)
{
    Fixture f;
    CardSP stolen = Inspector::TakeCard(f.P(1), Suit::Clubs, Rank::King);
    Inspector::Deck(f.P(0)).push_back(std::move(stolen));
    EXPECT_THROW(debug::CheckInvariants(f.game), error::AssertionError);
}

// ---------- Errors ----------

TEST(Errors, Each_Code_Raises_Its_Own_Type)
{
    EXPECT_THROW(NTZ_THROW(error::Code::InvalidPile, "x"), error::InvalidPileError);
    EXPECT_THROW(NTZ_THROW(error::Code::GameOver, "x"), error::GameOverError);
    EXPECT_THROW(NTZ_THROW(error::Code::Io, "x"), error::IoError);
    EXPECT_THROW(NTZ_ASSERT(false, "x"), error::AssertionError);
}

TEST(Errors, Mismatch_Without_Details_Is_An_Assertion)
{
    try
    {
        NTZ_THROW(error::Code::CardMismatch, "top differs");
        FAIL() << "expected a throw";
    }
    catch (error::AssertionError const& e)
    {
        EXPECT_EQ(e.data(), error::Code::Assertion);
        EXPECT_NE(e.what().find("top differs"), std::string::npos);
    }
}

TEST(Errors, Audit_Needs_A_Writable_Path)
{
    EXPECT_THROW((void)debug::AuditLogger("/nonexistent-dir/nertz/audit.txt"), error::IoError);
}
