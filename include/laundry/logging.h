#pragma once
/*
===============================================================================
LOGGING — Leveled line logger
===============================================================================

One line per record:

    [laundry] INFO  Order {peca_variada: 0, camisa: 12, ...} | delivery=lisboa (0.00 EUR)

The sink is any std::ostream; writes are serialized with a mutex so
concurrent optimize() calls sharing a logger do not interleave lines.
Records below the configured level are dropped before formatting.

    Logger log(std::cerr, LogLevel::Debug);
    log.info("resolved fee {:.2f}", fee);

===============================================================================
*/

#include <atomic>
#include <format>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace laundry {

    enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

    inline std::string_view levelName(LogLevel l)
    {
        switch (l) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO ";
            case LogLevel::Warn:  return "WARN ";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Off:   break;
        }
        return "";
    }

    class Logger {
    public:
        explicit Logger(std::ostream& sink, LogLevel level = LogLevel::Info,
            std::string name = "laundry")
            : sink_(&sink), level_(level), name_(std::move(name))
        {
        }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /// @brief Process-wide logger on std::clog at info level
        static Logger& defaultLogger()
        {
            static Logger logger(std::clog);
            return logger;
        }

        LogLevel level() const noexcept { return level_.load(std::memory_order_relaxed); }
        void setLevel(LogLevel l) noexcept { level_.store(l, std::memory_order_relaxed); }

        bool enabled(LogLevel l) const noexcept
        {
            return l != LogLevel::Off && l >= level_.load(std::memory_order_relaxed);
        }

        void write(LogLevel l, std::string_view message)
        {
            if (!enabled(l))
                return;
            std::lock_guard<std::mutex> lock(mutex_);
            (*sink_) << '[' << name_ << "] " << levelName(l) << ' ' << message << '\n';
            sink_->flush();
        }

        template<typename... Args>
        void log(LogLevel l, std::format_string<Args...> fmt, Args&&... args)
        {
            if (!enabled(l))
                return;
            write(l, std::format(fmt, std::forward<Args>(args)...));
        }

        template<typename... Args>
        void debug(std::format_string<Args...> fmt, Args&&... args)
        {
            log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void info(std::format_string<Args...> fmt, Args&&... args)
        {
            log(LogLevel::Info, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warn(std::format_string<Args...> fmt, Args&&... args)
        {
            log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void error(std::format_string<Args...> fmt, Args&&... args)
        {
            log(LogLevel::Error, fmt, std::forward<Args>(args)...);
        }

    private:
        std::ostream* sink_;
        std::atomic<LogLevel> level_;
        std::string name_;
        std::mutex mutex_;
    };

} // namespace laundry
