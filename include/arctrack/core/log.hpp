#pragma once
/**
 * @file   log.hpp
 * @brief  Leveled printf-style logger with a stderr sink and an optional file sink.
 *
 * Messages below the global level are dropped before formatting, so debug and
 * trace statements are cheap to leave in the control path. The control loop
 * may publish its current tick with @ref setTick; lines then carry `@t=<tick>`
 * so controller messages line up with recorded telemetry.
 */

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

namespace arctrack::core::log
{
    /**
     * @enum Level
     * @brief Severity, ordered from most to least verbose.
     */
    enum class Level : int
    {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Off = 5
    };

    /// @brief Upper-case tag printed in front of each message.
    [[nodiscard]] constexpr const char *toString (Level level) noexcept
    {
        switch (level)
        {
            case Level::Trace:
                return "TRACE";
            case Level::Debug:
                return "DEBUG";
            case Level::Info:
                return "INFO";
            case Level::Warn:
                return "WARN";
            case Level::Error:
                return "ERROR";
            case Level::Off:
                break;
        }
        return "OFF";
    }

    /**
     * @brief Parse a lower-case level name (`"trace"`, …, `"off"`).
     * @return The level, or std::nullopt for an unknown name.
     */
    [[nodiscard]] inline std::optional<Level> parseLevel (std::string_view name) noexcept
    {
        if (name == "trace")
            return Level::Trace;
        if (name == "debug")
            return Level::Debug;
        if (name == "info")
            return Level::Info;
        if (name == "warn")
            return Level::Warn;
        if (name == "error")
            return Level::Error;
        if (name == "off")
            return Level::Off;
        return std::nullopt;
    }

    namespace detail
    {
        inline Level &globalLevel () noexcept
        {
            static Level level = Level::Info;
            return level;
        }

        inline std::optional<std::uint32_t> &currentTick () noexcept
        {
            static std::optional<std::uint32_t> tick;
            return tick;
        }

        inline std::ofstream &fileSink ()
        {
            static std::ofstream file;
            return file;
        }
    } // namespace detail

    /// @brief Set the global threshold.
    inline void setLevel (Level level) noexcept { detail::globalLevel () = level; }

    /// @brief Current global threshold.
    [[nodiscard]] inline Level level () noexcept { return detail::globalLevel (); }

    /// @brief Stamp subsequent lines with control tick @p tick.
    inline void setTick (std::uint32_t tick) noexcept { detail::currentTick () = tick; }

    /// @brief Stop stamping lines with a tick.
    inline void clearTick () noexcept { detail::currentTick ().reset (); }

    /// @brief True when a message at @p lvl would be emitted.
    [[nodiscard]] inline bool enabled (Level lvl) noexcept
    {
        const Level threshold = detail::globalLevel ();
        return threshold != Level::Off && lvl >= threshold;
    }

    /**
     * @brief Mirror every emitted line into @p path (truncated on open).
     * @return False if the file could not be opened; stderr logging continues either way.
     */
    inline bool openFile (const std::string &path)
    {
        auto &file = detail::fileSink ();
        if (file.is_open ())
            file.close ();

        file.open (path, std::ios::out | std::ios::trunc);
        if (!file.is_open ())
        {
            std::fprintf (stderr, "[ERROR] cannot open log file: %s\n", path.c_str ());
            return false;
        }
        return true;
    }

    /// @brief Stop mirroring to the log file.
    inline void closeFile ()
    {
        auto &file = detail::fileSink ();
        if (file.is_open ())
            file.close ();
    }

    /**
     * @brief Format and emit one line: `[hh:mm:ss] LEVEL: message`, or
     *        `[hh:mm:ss @t=tick] LEVEL: message` while a tick is set.
     * @param lvl  Severity.
     * @param fmt  printf-style format string.
     * @param args Matching argument list.
     */
    inline void vwrite (Level lvl, const char *fmt, std::va_list args)
    {
        if (!enabled (lvl))
            return;

        const std::time_t now = std::time (nullptr);
        std::tm tm{};
        localtime_r (&now, &tm);

        char message[512];
        std::vsnprintf (message, sizeof (message), fmt, args);

        char stamp[32];
        if (const auto tick = detail::currentTick ())
            std::snprintf (stamp, sizeof (stamp), "%02d:%02d:%02d @t=%u", tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<unsigned> (*tick));
        else
            std::snprintf (stamp, sizeof (stamp), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);

        char line[600];
        std::snprintf (line, sizeof (line), "[%s] %-5s: %s\n", stamp, toString (lvl), message);

        std::fputs (line, stderr);

        auto &file = detail::fileSink ();
        if (file.is_open ())
        {
            file << line;
            file.flush ();
        }
    }

    /// @brief Variadic front end of @ref vwrite.
    inline void write (Level lvl, const char *fmt, ...)
    {
        if (!enabled (lvl))
            return;
        std::va_list args;
        va_start (args, fmt);
        vwrite (lvl, fmt, args);
        va_end (args);
    }

} // namespace arctrack::core::log

#define ARCTRACK_LOG_TRACE(...) ::arctrack::core::log::write (::arctrack::core::log::Level::Trace, __VA_ARGS__)
#define ARCTRACK_LOG_DEBUG(...) ::arctrack::core::log::write (::arctrack::core::log::Level::Debug, __VA_ARGS__)
#define ARCTRACK_LOG_INFO(...) ::arctrack::core::log::write (::arctrack::core::log::Level::Info, __VA_ARGS__)
#define ARCTRACK_LOG_WARN(...) ::arctrack::core::log::write (::arctrack::core::log::Level::Warn, __VA_ARGS__)
#define ARCTRACK_LOG_ERROR(...) ::arctrack::core::log::write (::arctrack::core::log::Level::Error, __VA_ARGS__)
