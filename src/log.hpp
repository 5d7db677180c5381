#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace cmhsim
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept
    {
        if (s == "error")
        {
            return LogLevel::Error;
        }
        if (s == "warn")
        {
            return LogLevel::Warn;
        }
        if (s == "info")
        {
            return LogLevel::Info;
        }
        if (s == "debug")
        {
            return LogLevel::Debug;
        }
        if (s == "trace")
        {
            return LogLevel::Trace;
        }
        if (s == "off")
        {
            return LogLevel::Off;
        }
        return std::nullopt;
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // Write-only narration of the run. Nothing in the simulation reads it back.
    class Logger
    {
    public:
        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        ~Logger() { close_owned_(); }

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        LogLevel level() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_level;
        }

        // Borrowed sink; the caller keeps ownership.
        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            close_owned_();
            m_sink = f;
        }

        // Truncates `path` and logs into it until the sink is replaced.
        // Returns false (and leaves the current sink alone) if the file cannot be opened.
        bool open_file(const char *path)
        {
            FILE *f = std::fopen(path, "w");
            if (!f)
            {
                return false;
            }
            std::lock_guard<std::mutex> lk(m_mu);
            close_owned_();
            m_sink = f;
            m_ownsSink = true;
            return true;
        }

        // Console echo: messages at or above `lvl` are also printed bare to `f`,
        // independently of the sink's level. nullptr or LogLevel::Off disables it.
        void set_echo(FILE *f, LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_echo = f;
            m_echoLevel = lvl;
        }

        void logf(LogLevel lvl, ActorId actor, const char *fmt, ...)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            const bool toSink = m_sink && log_enabled(m_level, lvl);
            const bool toEcho = m_echo && log_enabled(m_echoLevel, lvl);
            if (!toSink && !toEcho)
            {
                return;
            }

            char buf[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);

            if (toSink)
            {
                const auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - m_epoch);
                std::fprintf(m_sink, "[%s][actor=%u][t=%lld] %s\n",
                             log_level_name(lvl),
                             static_cast<unsigned>(actor),
                             static_cast<long long>(elapsed.count()),
                             buf);
                std::fflush(m_sink);
            }
            if (toEcho)
            {
                std::fprintf(m_echo, "%s\n", buf);
                std::fflush(m_echo);
            }
        }

    private:
        Logger() = default;

        void close_owned_()
        {
            if (m_ownsSink && m_sink)
            {
                std::fclose(m_sink);
            }
            m_sink = nullptr;
            m_ownsSink = false;
        }

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
        bool m_ownsSink = false;
        FILE *m_echo = nullptr;
        LogLevel m_echoLevel = LogLevel::Off;
        const TimePoint m_epoch = std::chrono::steady_clock::now();
    };
}
