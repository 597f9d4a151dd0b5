//
// main.cpp: seeded Nertz simulation driver
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "core/Game.hpp"
#include "core/Exception.hpp"
#include "core/Logger.hpp"
#include "debug/AuditLogger.hpp"

using namespace nertz::core;

namespace
{
    struct RunConfig
    {
        Config game{};
        std::uint32_t max_turns{2000};
        bool verbose{false};
        std::string audit_path{};
    };

    auto ParseArgs(int argc, char** argv) -> RunConfig
    {
        RunConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.game.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.game.seed = v; }
            }
            else if (arg == "--max_turns")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.max_turns = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--verbose")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.verbose = (v != 0); }
            }
            else if (arg == "--audit")
            {
                (void)next_str(cfg.audit_path);
            }
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    RunConfig const rc = ParseArgs(argc, argv);

    try
    {
        auto log = std::make_shared<Logger>(std::clog, rc.verbose ? LogLevel::Debug : LogLevel::Info);
        GameImpl game(rc.game, log);

        std::optional<debug::AuditLogger> audit;
        if (!rc.audit_path.empty())
        {
            audit.emplace(rc.audit_path);
            audit->start(game, rc.game.seed);
        }

        fmt::print("[nertzsim] {} player(s), seed {}\n", game.PlayerCount(), game.Seed());
        game.StartNewGame();

        while (!game.IsGameOver() && game.Turn() < rc.max_turns)
        {
            TurnReport const report = game.PlayTurn();
            if (audit) audit->turn(game, report);
        }

        if (game.IsGameOver())
        {
            // the first PlayTurn after the end processes scores, then reports game over
            try
            {
                (void)game.PlayTurn();
            }
            catch (error::GameOverError const& e)
            {
                log->Debug("{}", e.what());
            }
        }
        else
        {
            fmt::print("[nertzsim] stopped after {} turns without a winner\n", game.Turn());
        }

        for (size_t i{}; i < game.Scores().size(); ++i)
        {
            fmt::print("[nertzsim] player {}: {}\n", i, game.Scores()[i]);
        }
        fmt::print("[nertzsim] {} turns in {:.3f}s\n", game.Turn(), game.Elapsed().count());
        if (std::optional<PlyrIdxT> const w = game.Winner())
        {
            fmt::print("[nertzsim] winner: player {}\n", static_cast<int>(*w));
        }

        if (audit) audit->end(game);
    }
    catch (OmegaException<error::Code> const& e)
    {
        fmt::print(stderr, "{}", e);
        return 1;
    }
    return 0;
}
