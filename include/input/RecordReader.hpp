#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "core/LogRecord.hpp"

namespace ErrorWatch
{
    namespace Input
    {
        /**
         * ErrorFilter
         *
         * Coarse prefilter that keeps only records whose message contains a
         * match for one of the patterns (case-sensitive search). An empty
         * pattern list lets everything through.
         */
        class ErrorFilter
        {
        public:
            static std::vector<std::string> defaultPatterns();

            /// Throws core::PatternError for a pattern that does not compile.
            explicit ErrorFilter(const std::vector<std::string>& patterns = defaultPatterns());

            bool accepts(const std::string& message) const;
            bool enabled() const noexcept { return !m_patterns.empty(); }

        private:
            std::vector<std::regex> m_patterns;
        };

        /**
         * RecordReader
         *
         * Reads log files into LogRecords: FileReader for the lines,
         * RecordParser for each line, ErrorFilter on the result.
         * Statistics accumulate across files until resetStats().
         */
        class RecordReader
        {
        public:
            struct ReadStats
            {
                std::size_t files = 0;
                std::size_t linesRead = 0;
                std::size_t records = 0;     ///< Records kept after filtering.
                std::size_t malformed = 0;
                std::size_t filteredOut = 0;
            };

            /**
             * @param sourceOverride  Source for records that carry none. When
             *                        unset, the file stem is used.
             */
            explicit RecordReader(ErrorFilter filter = ErrorFilter(),
                                  std::optional<std::string> sourceOverride = std::nullopt);

            /**
             * Append the records of one file to out.
             * Returns false (with errOut set) when the file cannot be read;
             * records read before a mid-file failure are kept.
             */
            bool readFile(const std::string& path,
                          std::vector<core::LogRecord>& out,
                          std::string* errOut = nullptr);

            const ReadStats& stats() const noexcept { return m_stats; }
            void resetStats() noexcept { m_stats = ReadStats{}; }

        private:
            ErrorFilter m_filter;
            std::optional<std::string> m_sourceOverride;
            ReadStats m_stats;
        };

    } // namespace Input
} // namespace ErrorWatch
