#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace occsim
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

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    class Logger
    {
    public:
        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        LogLevel level() const noexcept { return m_level; }

        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        // `client` may be NoClient for messages that are not about one client.
        void logf(LogLevel lvl, ClientId client, SimTime t, const char *fmt, ...)
        {
            if (!log_enabled(m_level, lvl))
            {
                return;
            }

            char buf[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);

            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_sink)
            {
                return;
            }
            if (client == NoClient)
            {
                std::fprintf(m_sink, "[%s][t=%.3f] %s\n", log_level_name(lvl), t, buf);
            }
            else
            {
                std::fprintf(m_sink, "[%s][client=%u][t=%.3f] %s\n",
                             log_level_name(lvl),
                             static_cast<unsigned>(client),
                             t,
                             buf);
            }
            std::fflush(m_sink);
        }

    private:
        Logger() = default;

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
    };

    inline bool parse_log_level(std::string_view text, LogLevel &out)
    {
        static constexpr LogLevel all[] = {LogLevel::Error, LogLevel::Warn, LogLevel::Info,
                                           LogLevel::Debug, LogLevel::Trace, LogLevel::Off};
        for (const LogLevel lvl : all)
        {
            if (iequals(text, log_level_name(lvl)))
            {
                out = lvl;
                return true;
            }
        }
        return false;
    }
}
