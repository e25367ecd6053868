//
// Created by Malik T on 03/10/2025.
//

#ifndef SHADOWHUNT_LOG_HPP
#define SHADOWHUNT_LOG_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

// Engine diagnostics go to stderr. Game transcripts live in debug::AuditLogger.
namespace shadow::core::log
{
    enum class Level : uint8_t
    {
        Debug = 0,
        Info,
        Warn,
        Error,
        Off
    };

    inline auto Threshold() -> std::atomic<Level>&
    {
        static std::atomic<Level> level{Level::Info};
        return level;
    }

    inline auto SetLevel(Level l) -> void { Threshold().store(l); }

    inline auto Tag(Level l) -> std::string_view
    {
        switch (l)
        {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
        }
        return "?";
    }

    template <typename... Args>
    auto Write(Level l, std::format_string<Args...> fmt, Args&&... args) -> void
    {
        if (l < Threshold().load()) return;
        std::print(stderr, "[shadow] {}: {}\n", Tag(l), std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    auto Debug(std::format_string<Args...> fmt, Args&&... args) -> void
    {
        Write(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto Info(std::format_string<Args...> fmt, Args&&... args) -> void
    {
        Write(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto Warn(std::format_string<Args...> fmt, Args&&... args) -> void
    {
        Write(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto Error(std::format_string<Args...> fmt, Args&&... args) -> void
    {
        Write(Level::Error, fmt, std::forward<Args>(args)...);
    }
}

#endif //SHADOWHUNT_LOG_HPP
