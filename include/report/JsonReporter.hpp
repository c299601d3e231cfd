#pragma once

#include <ostream>
#include <string>

#include "core/Report.hpp"

namespace ErrorWatch
{
    namespace Report
    {
        /**
         * JsonReporter
         *
         * Responsibilities:
         *  - Machine-readable form of a RunReport for dashboards and notifiers
         *  - RFC 8259 escaping for every string field
         *
         * Design notes:
         *  - Hand-written output, no JSON library on this path
         *  - Compact and pretty modes share the same field order
         *
         * Layout:
         *   { "generated", "runDate", "summary": {...},
         *     "attention": [group...], "noise": [group...] }
         */
        class JsonReporter
        {
        public:
            enum class PrettyPrint
            {
                COMPACT,  // Single line, minimal whitespace
                PRETTY    // Indented, human-readable JSON
            };

            explicit JsonReporter(PrettyPrint pretty = PrettyPrint::COMPACT);

            /// Keep a copy of the report to write later.
            void generateReport(const core::RunReport& report);

            void writeJson(std::ostream& output) const;

            std::string getJsonString() const;

            /// Write to a file, replacing it. Returns false with errOut set on failure.
            bool writeFile(const std::string& path, std::string* errOut = nullptr) const;

            std::string groupToJson(const core::ClassifiedGroup& group, bool isNew) const;

            std::string summaryToJson(const core::RunReport& report) const;

            void setPrettyPrint(PrettyPrint mode) noexcept { m_prettyPrint = mode; }
            void setIncludeSamples(bool include) noexcept { m_includeSamples = include; }

        private:
            static std::string quoted(const std::string& s);

            void writeGroups(std::ostream& output, const std::vector<core::ClassifiedGroup>& groups,
                             const char* indent) const;

        private:
            core::RunReport m_report;
            PrettyPrint m_prettyPrint;
            bool m_includeSamples = true;
        };

    } // namespace Report
} // namespace ErrorWatch
