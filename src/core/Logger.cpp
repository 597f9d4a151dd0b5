//
// Logger.cpp
//

#include "Logger.hpp"

namespace nertz::core
{
    auto to_string(LogLevel const l) -> std::string_view
    {
        switch (l)
        {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        }
        return "?";
    }

    Logger::Logger(std::ostream& sink, LogLevel const threshold) :
        sink_(sink),
        threshold_(threshold)
    {
    }

    auto Logger::Log(LogLevel const l, std::string_view const msg) -> void
    {
        if (!Enabled(l)) return;
        sink_ << fmt::format("[{}] {}\n", to_string(l), msg);
    }
}
