#include "report/ConsoleReporter.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

#if defined(_WIN32)
  #include <io.h>      // _isatty, _fileno
#else
  #include <unistd.h>  // isatty, fileno
#endif

#include "utils/StringUtils.hpp"

namespace ErrorWatch
{
namespace Report
{
    namespace
    {
        const char* const kReset  = "\033[0m";
        const char* const kRed    = "\033[31m";
        const char* const kGreen  = "\033[32m";
        const char* const kYellow = "\033[33m";
        const char* const kDim    = "\033[2m";

        const std::string kRule(50, '=');

        bool stdoutIsTty() noexcept
        {
        #if defined(_WIN32)
            return _isatty(_fileno(stdout)) != 0;
        #else
            return ::isatty(::fileno(stdout)) != 0;
        #endif
        }

        std::string joinSources(const core::SignatureAggregate& agg)
        {
            std::string out;
            for (const auto& src : agg.sources)
            {
                if (!out.empty())
                    out += ", ";
                out += Utils::lastPathSegment(src);
            }
            return out;
        }
    } // namespace

    ConsoleReporter::ConsoleReporter(std::ostream& output)
        : m_output(&output),
          m_colorsEnabled(&output == &std::cout && stdoutIsTty())
    {
    }

    const char* ConsoleReporter::color(const char* code) const noexcept
    {
        return m_colorsEnabled ? code : "";
    }

    std::string ConsoleReporter::clockOf(const std::string& timestamp)
    {
        if (timestamp.size() <= 11)
            return {};
        return timestamp.substr(11, 5);
    }

    std::string ConsoleReporter::noiseDigest(const core::RunReport& report, std::size_t limit)
    {
        const auto& noise = report.noise();
        std::string digest;

        const std::size_t shown = std::min(limit, noise.size());
        for (std::size_t i = 0; i < shown; ++i)
        {
            const auto& sig = noise[i].signature();
            if (!digest.empty())
                digest += ", ";
            digest += sig.substr(0, sig.find(':'));
            digest += "(" + std::to_string(noise[i].count()) + ")";
        }

        if (noise.size() > shown)
        {
            digest += ", ...+" + std::to_string(noise.size() - shown) + " more";
        }
        return digest;
    }

    void ConsoleReporter::printSummary(const core::RunReport& report)
    {
        *m_output << report.totalRecords() << " records -> "
                  << report.patternCount() << " patterns ("
                  << report.attention().size() << " attention, "
                  << report.noise().size() << " noise)\n";

        if (report.skippedRecords() > 0 || report.expiredSignatures() > 0)
        {
            *m_output << color(kDim) << "skipped " << report.skippedRecords()
                      << " lines without a signature, expired "
                      << report.expiredSignatures() << " signatures" << color(kReset) << "\n";
        }
    }

    void ConsoleReporter::generateReport(const core::RunReport& report)
    {
        *m_output << "\n" << kRule << "\n";
        *m_output << "Error analysis " << report.runDate() << "\n";
        *m_output << kRule << "\n";
        printSummary(report);

        const auto& attention = report.attention();
        if (attention.empty())
        {
            *m_output << "\n" << color(kGreen) << "No errors need attention" << color(kReset) << "\n";
        }
        else
        {
            *m_output << "\n" << color(kRed) << "Needs attention (" << attention.size() << ")"
                      << color(kReset) << "\n";

            for (const auto& g : attention)
            {
                *m_output << "  ";
                if (report.isNew(g.signature()))
                    *m_output << color(kYellow) << "[NEW] " << color(kReset);
                *m_output << g.signature() << " (" << g.count() << ")\n";

                *m_output << "     " << joinSources(g.aggregate)
                          << " | last: " << clockOf(g.aggregate.lastSeenTimestamp) << "\n\n";
            }
        }

        if (!report.noise().empty())
        {
            *m_output << color(kDim) << "Ignored (" << report.noise().size() << ", "
                      << report.noiseRecordCount() << " records)" << color(kReset) << "\n";
            *m_output << "  " << noiseDigest(report, m_noiseDigestSize) << "\n";
        }

        *m_output << kRule << "\n";
        m_output->flush();
    }

} // namespace Report
} // namespace ErrorWatch
