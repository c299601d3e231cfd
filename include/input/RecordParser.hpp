#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "core/LogRecord.hpp"

namespace ErrorWatch
{
    namespace Input
    {
        /**
         * RecordParser
         *
         * Turns one raw input line into a LogRecord.
         *
         * Accepted shapes:
         *  - JSON object lines (CloudWatch Insights export and similar):
         *      timestamp from "@timestamp" | "timestamp" | "time"
         *      message   from "@message"   | "message"   | "msg"
         *      source    from "log_group"  | "source"    | "@logStream" | "service"
         *  - Plain text, optionally led by an ISO-8601 timestamp
         *    ("2024-05-01 12:00:00.123 ..." or "[2024-05-01T12:00:00Z] ...").
         *
         * Records without a source get the parser's default source.
         * Stateless apart from that default; copyable.
         */
        class RecordParser
        {
        public:
            struct ParseResult
            {
                std::optional<core::LogRecord> record;
                bool wasJson = false;
                bool malformed = false;
                std::string error;
            };

            explicit RecordParser(std::string defaultSource = {});

            /// Empty lines yield neither a record nor a malformed flag.
            ParseResult parseLineDetailed(std::string_view rawLine) const;

            std::optional<core::LogRecord> parseLine(std::string_view rawLine) const
            {
                return parseLineDetailed(rawLine).record;
            }

            const std::string& defaultSource() const noexcept { return m_defaultSource; }
            void setDefaultSource(std::string source) { m_defaultSource = std::move(source); }

        private:
            std::optional<core::LogRecord> tryParseJsonLine(std::string_view line, std::string* errOut) const;
            core::LogRecord parseTextLine(std::string_view line) const;

        private:
            std::string m_defaultSource;
        };

    } // namespace Input
} // namespace ErrorWatch
