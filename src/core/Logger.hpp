//
// Logger.hpp
//

#ifndef NERTZSIM_LOGGER_HPP
#define NERTZSIM_LOGGER_HPP

#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace nertz::core
{
    enum class LogLevel : uint8_t
    {
        Debug = 0,
        Info,
        Warning
    };

    auto to_string(LogLevel l) -> std::string_view;

    // Leveled line logger handed to every engine component at construction.
    // Writes "[LEVEL] message" to the sink when level >= threshold.
    class Logger
    {
    public:
        explicit Logger(std::ostream& sink, LogLevel threshold = LogLevel::Info);

        Logger(Logger const&) = delete;
        auto operator=(Logger const&) -> Logger& = delete;

        auto SetThreshold(LogLevel l) noexcept -> void { threshold_ = l; }
        auto Threshold() const noexcept -> LogLevel { return threshold_; }
        auto Enabled(LogLevel l) const noexcept -> bool { return l >= threshold_; }

        auto Log(LogLevel l, std::string_view msg) -> void;

        template <typename... Args>
        auto Debug(fmt::format_string<Args...> f, Args&&... args) -> void
        {
            if (Enabled(LogLevel::Debug)) Log(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
        }

        template <typename... Args>
        auto Info(fmt::format_string<Args...> f, Args&&... args) -> void
        {
            if (Enabled(LogLevel::Info)) Log(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
        }

        template <typename... Args>
        auto Warning(fmt::format_string<Args...> f, Args&&... args) -> void
        {
            if (Enabled(LogLevel::Warning)) Log(LogLevel::Warning, fmt::format(f, std::forward<Args>(args)...));
        }

    private:
        std::ostream& sink_;
        LogLevel threshold_;
    };
}

#endif //NERTZSIM_LOGGER_HPP
