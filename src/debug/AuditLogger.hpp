//
// AuditLogger.hpp
//

#ifndef NERTZSIM_AUDITLOGGER_HPP
#define NERTZSIM_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace nertz::core::debug
{
    // Plain-text transcript of one game, one block per turn.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, player count, seat positions, starting tops)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // After PlayTurn: chosen moves, conflicts, executed moves, pile counts
        auto turn(GameImpl const& game, TurnReport const& report) -> void;

        // Game end footer (scores and winner seat; -1 if none)
        auto end(GameImpl const& game) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //NERTZSIM_AUDITLOGGER_HPP
