#pragma once

#include <cstddef>
#include <iostream>
#include <string>

#include "core/Report.hpp"

namespace ErrorWatch
{
    namespace Report
    {
        /**
         * ConsoleReporter
         *
         * Responsibilities:
         *  - Human-readable summary of one run
         *  - Attention list with [NEW] marks, counts, sources, last-seen time
         *  - One-line noise digest
         *
         * Design notes:
         *  - Writes to the stream it was given (std::cout by default)
         *  - ANSI colors only when writing to a terminal
         */
        class ConsoleReporter
        {
        public:
            explicit ConsoleReporter(std::ostream& output = std::cout);

            void generateReport(const core::RunReport& report);

            void printSummary(const core::RunReport& report);

            void setEnableColors(bool enable) noexcept { m_colorsEnabled = enable; }
            void setNoiseDigestSize(std::size_t count) noexcept { m_noiseDigestSize = count; }

            /// "Class(count), Class(count), ...+N more" over the first noise groups.
            static std::string noiseDigest(const core::RunReport& report, std::size_t limit = 5);

            /// "HH:MM" taken from an ISO timestamp, empty when too short.
            static std::string clockOf(const std::string& timestamp);

        private:
            const char* color(const char* code) const noexcept;

        private:
            std::ostream* m_output;
            bool m_colorsEnabled;
            std::size_t m_noiseDigestSize = 5;
        };

    } // namespace Report
} // namespace ErrorWatch
