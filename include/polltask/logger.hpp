#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/std.h>

namespace polltask {

    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    inline const char* to_string(Level level) noexcept {
        switch (level) {
            case Level::Debug: return "DEBUG";
            case Level::Info: return "INFO";
            case Level::Warning: return "WARNING";
            case Level::Error: return "ERROR";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Sink for diagnostics, injected into everything that reports progress
     *
     * Implementations must accept calls from several threads at once.
     */
    class Logger {
        public:
        virtual ~Logger() = default;

        /**
         * @brief Record one already formatted message
         *
         * @param level severity
         * @param message text without trailing newline
         */
        virtual void log(Level level, std::string_view message) = 0;

        template<typename... Args>
        void debug(fmt::format_string<Args...> format, Args&&... args);

        template<typename... Args>
        void info(fmt::format_string<Args...> format, Args&&... args);

        template<typename... Args>
        void warning(fmt::format_string<Args...> format, Args&&... args);

        template<typename... Args>
        void error(fmt::format_string<Args...> format, Args&&... args);
    };

    /**
     * @brief Logger writing timestamped lines to a stdio stream
     */
    class StreamLogger : public Logger {
        public:
        /**
         * @brief Construct a new Stream Logger object
         *
         * @param out destination, not owned
         * @param min_level messages below this level are dropped
         */
        explicit StreamLogger(std::FILE* out = stdout, Level min_level = Level::Info);

        StreamLogger(const StreamLogger& other) = delete;
        StreamLogger& operator=(const StreamLogger& other) = delete;

        void log(Level level, std::string_view message) override;

        private:
        std::FILE* out;
        Level min_level;
        std::mutex mutex;
    };

    /**
     * @brief Logger that discards everything
     */
    class NullLogger : public Logger {
        public:
        void log(Level, std::string_view) override {}
    };

    // Logger definitions
    template<typename... Args>
    void Logger::debug(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Logger::info(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Logger::warning(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Logger::error(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    // StreamLogger definitions
    inline StreamLogger::StreamLogger(std::FILE* out, Level min_level) : out(out), min_level(min_level) {}

    inline void StreamLogger::log(Level level, std::string_view message) {
        if (level < min_level) {
            return;
        }
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        std::string stamp = localtime_r(&now, &local) ? fmt::format("{:%F %T}", local) : "unknown time";
        std::lock_guard<std::mutex> lock(mutex);
        fmt::print(out, "[{}] [{}] {}\n", stamp, to_string(level), message);
        std::fflush(out);
    }

}
