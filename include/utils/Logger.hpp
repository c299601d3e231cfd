#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>

namespace ErrorWatch
{
    namespace Utils
    {
        /**
         * Log severity levels used across the system.
         *
         *  - TRACE: per-record detail (rule hits, skipped lines)
         *  - DEBUG: per-stage detail for developers
         *  - INFO: run flow (records in, groups out, history saved)
         *  - WARN: recovered problems (corrupt history, malformed input)
         *  - ERROR: failures surfaced to the caller (history not saved)
         *  - CRITICAL: unrecoverable failures
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /// Parse "info", "WARN", "warning", ... into a LogLevel (case-insensitive).
        std::optional<LogLevel> parseLogLevel(std::string_view text);

        /**
         * Logger
         *
         * Thread-safe, minimal logging facility. Every line has the form
         *   [YYYY-MM-DD HH:MM:SS] [LEVEL] message
         * and goes to the console sink (stderr by default) and, when opened,
         * to an append-mode log file.
         *
         * The engine never prints results itself; everything diagnostic goes
         * through here so stdout stays reserved for reports.
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only, at INFO.
            Logger();

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            /// Get the currently configured minimum severity.
            LogLevel level() const noexcept;

            /// Check quickly whether this level would be logged.
            bool isEnabled(LogLevel level) const noexcept;

            /**
             * Also write to a file (append mode). Returns false if the file
             * cannot be opened; console logging continues either way.
             */
            bool openFile(const std::string &filePath);

            /// Replace the console sink; nullptr silences console output.
            void setConsole(std::ostream *console) noexcept;

            /// Log a message with a given severity.
            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

        private:
            static const char *toString(LogLevel level) noexcept;

            /// Write a fully formatted line to the active sinks. Caller holds m_mutex.
            void writeLineUnlocked(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;       // RAII-managed file handle
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all state and writes
        };

        /**
         * Process-wide logger (stderr, INFO until configured).
         *
         *   Logger &log = getLogger();
         *   log.info("History loaded");
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace ErrorWatch
