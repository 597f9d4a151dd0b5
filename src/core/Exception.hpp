//
// Exception.hpp
//

#ifndef NERTZSIM_EXCEPTION_HPP
#define NERTZSIM_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "Types.hpp"

namespace nertz::core::error
{
    enum class Code : unsigned
    {
        Validation, // move constructed with fields missing for its pile kinds
        CardMismatch, // pile top/bottom is not the card the move recorded
        InvalidPile, // move references a foundation that does not exist
        GameNotStarted, // PlayTurn before StartNewGame
        GameOver, // PlayTurn after a nertz pile emptied
        State, // pile/engine misuse (empty deck deal, short stream, ...)
        Io, // transcript file could not be opened or written
        Assertion // internal assertion failed
    };

    inline auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Validation: return "Validation";
        case Code::CardMismatch: return "CardMismatch";
        case Code::InvalidPile: return "InvalidPile";
        case Code::GameNotStarted: return "GameNotStarted";
        case Code::GameOver: return "GameOver";
        case Code::State: return "State";
        case Code::Io: return "Io";
        case Code::Assertion: return "Assertion";
        }
        return "Unknown";
    }

    struct ValidationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidPileError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct GameNotStartedError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct GameOverError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct IoError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    // Carries the pile that was inspected and both card texts for the report.
    class CardMismatchError : public OmegaException<Code>
    {
    public:
        CardMismatchError(std::string pile_name,
                          std::string expected,
                          std::optional<std::string> actual,
                          PlyrIdxT player,
                          std::source_location const& src_loc = std::source_location::current()) :
            OmegaException<Code>(fmt::format("Player {}: Card mismatch at {}: expected {}, got {}",
                                             static_cast<int>(player), pile_name, expected,
                                             actual.value_or("<empty>")),
                                 Code::CardMismatch, src_loc),
            pile_name_{std::move(pile_name)},
            expected_{std::move(expected)},
            actual_{std::move(actual)},
            player_{player}
        {
        }

        auto PileName() const noexcept -> std::string const& { return pile_name_; }
        auto Expected() const noexcept -> std::string const& { return expected_; }
        auto Actual() const noexcept -> std::optional<std::string> const& { return actual_; }
        auto Player() const noexcept -> PlyrIdxT { return player_; }

    private:
        std::string pile_name_;
        std::string expected_;
        std::optional<std::string> actual_;
        PlyrIdxT player_;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Validation: throw ValidationError(std::move(msg), c, loc);
        // a mismatch needs pile and card details: throw CardMismatchError directly
        case Code::CardMismatch:
            throw AssertionError(fmt::format("CardMismatch raised without details: {}", msg), Code::Assertion, loc);
        case Code::InvalidPile: throw InvalidPileError(std::move(msg), c, loc);
        case Code::GameNotStarted: throw GameNotStartedError(std::move(msg), c, loc);
        case Code::GameOver: throw GameOverError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Io: throw IoError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define NTZ_THROW(code_enum, msg) ::nertz::core::error::fail((code_enum), (msg))
#define NTZ_ASSERT(cond, msg) do { if(!(cond)) ::nertz::core::error::fail(::nertz::core::error::Code::Assertion, (msg)); } while(0)
}

#endif //NERTZSIM_EXCEPTION_HPP
