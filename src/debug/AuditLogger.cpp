#include "AuditLogger.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"

using namespace nertz::core;

namespace
{

auto s_suit(Suit const s) -> std::string_view
{
    switch (s)
    {
        case Suit::Spades:   return "S";
        case Suit::Clubs:    return "C";
        case Suit::Hearts:   return "H";
        case Suit::Diamonds: return "D";
    }
    return "?";
}

auto s_rank(Rank const r) -> std::string_view
{
    static constexpr std::array<std::string_view, 13> map{
        "A","2","3","4","5","6","7","8","9","T","J","Q","K"
    };
    return map[static_cast<size_t>(r)];
}

auto s_card(CardWP const& w) -> std::string
{
    if (auto const sp = w.lock())
    {
        return fmt::format("{}{}", s_rank(sp->rank), s_suit(sp->suit));
    }
    return "--";
}

auto s_move(Move const& m) -> std::string
{
    if (m.IsFlip())
    {
        return fmt::format("P{} flip", static_cast<int>(m.Player()));
    }

    std::string where;
    if (m.FoundationTarget())
    {
        where = *m.FoundationTarget();
    }
    else if (m.DestinationSlot())
    {
        where = fmt::format("river{}", static_cast<int>(*m.DestinationSlot()));
    }

    return fmt::format("P{} {} {} -> {} p={:.3f}",
                       static_cast<int>(m.Player()),
                       to_string(m.Kind()),
                       s_card(m.CardRef()),
                       where,
                       m.Priority());
}

auto serialize_river(PileSet const& p) -> std::string
{
    std::string serial;
    for (size_t i{}; i < constants::RiverSlots; ++i)
    {
        serial += (i ? "," : "");
        serial += fmt::format("{}x{}", s_card(p.RiverTop(i)), p.RiverSlot(i).size());
    }
    return serial;
}

} // anonymous namespace

namespace nertz::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(path, std::ios::out | std::ios::trunc)
{
    if (!out_)
        NTZ_THROW(error::Code::Io, fmt::format("Could not open audit transcript {}", path));
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, uint64_t seed) -> void
{
    out_ << fmt::format("Seed={}\n", seed);
    out_ << fmt::format("Players={}\n", game.PlayerCount());
    for (PlyrIdxT i = 0; i < game.PlayerCount(); ++i)
    {
        Point const pos = game.LayoutRef().PlayerPosition(i);
        PileSet const& p = game.Piles(i);
        out_ << fmt::format("Seat {} at ({:.4f},{:.4f}) nertz={} river=[{}]\n",
                            static_cast<int>(i), pos.x, pos.y, s_card(p.TopNertz()), serialize_river(p));
    }
    out_.flush();
}

auto AuditLogger::turn(GameImpl const& game, TurnReport const& report) -> void
{
    out_ << fmt::format("Turn {} chosen={} executed={} conflicts={}\n",
                        report.turn, report.chosen.size(), report.executed.size(), report.conflicts.size());

    for (ConflictRecord const& c : report.conflicts)
    {
        out_ << fmt::format("  Conflict {} winner=P{} p={:.3f} discarded={}\n",
                            c.foundation, static_cast<int>(c.winner), c.winning_priority, c.discarded);
    }

    for (Move const& m : report.executed)
    {
        out_ << fmt::format("  {}\n", s_move(m));
    }

    std::string body;
    for (PlyrIdxT i = 0; i < game.PlayerCount(); ++i)
    {
        PileSet const& p = game.Piles(i);
        body += fmt::format("{}{}:{}/{}/{}",
                            (i ? "," : ""),
                            static_cast<int>(i),
                            p.Nertz().size(),
                            p.Stream().size(),
                            p.CardsLeft());
    }
    out_ << fmt::format("  Piles nertz/stream/deck=[{}] foundations={}\n", body, game.Foundations().size());
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    std::string body;
    for (size_t i{}; i < game.Scores().size(); ++i)
    {
        body += fmt::format("{}{}:{}", (i ? "," : ""), i, game.Scores()[i]);
    }

    std::optional<PlyrIdxT> const winner = game.Winner();
    out_ << fmt::format("Turns={}\n", game.Turn());
    out_ << fmt::format("Duration={:.3f}s\n", game.Elapsed().count());
    out_ << fmt::format("Scores=[{}]\n", body);
    out_ << fmt::format("Winner={}\n", winner ? static_cast<int>(*winner) : -1);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace nertz::core::debug
