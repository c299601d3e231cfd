#include "report/JsonReporter.hpp"

#include <fstream>
#include <sstream>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace ErrorWatch
{
namespace Report
{
    JsonReporter::JsonReporter(PrettyPrint pretty)
        : m_prettyPrint(pretty)
    {
    }

    void JsonReporter::generateReport(const core::RunReport& report)
    {
        m_report = report;
        Utils::getLogger().debug("Json report prepared: " + std::to_string(report.patternCount()) + " groups");
    }

    std::string JsonReporter::quoted(const std::string& s)
    {
        // Output stays valid UTF-8 whatever bytes the report holds.
        return "\"" + Utils::escapeJson(Utils::sanitizeUtf8(s)) + "\"";
    }

    std::string JsonReporter::groupToJson(const core::ClassifiedGroup& group, bool isNew) const
    {
        const auto& agg = group.aggregate;

        std::ostringstream oss;
        oss << "{";
        oss << "\"signature\":" << quoted(agg.signature) << ",";
        oss << "\"count\":" << agg.count << ",";
        oss << "\"isNew\":" << (isNew ? "true" : "false") << ",";
        oss << "\"isNoise\":" << (group.isNoise ? "true" : "false") << ",";

        oss << "\"sources\":[";
        bool first = true;
        for (const auto& src : agg.sources)
        {
            if (!first) oss << ",";
            oss << quoted(src);
            first = false;
        }
        oss << "],";

        oss << "\"firstSeen\":" << quoted(agg.firstSeenTimestamp) << ",";
        oss << "\"lastSeen\":" << quoted(agg.lastSeenTimestamp);
        if (m_includeSamples)
            oss << ",\"sample\":" << quoted(agg.sampleMessage);
        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::summaryToJson(const core::RunReport& report) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"totalRecords\":" << report.totalRecords() << ",";
        oss << "\"groupedRecords\":" << report.groupedRecords() << ",";
        oss << "\"skippedRecords\":" << report.skippedRecords() << ",";
        oss << "\"patterns\":" << report.patternCount() << ",";
        oss << "\"attention\":" << report.attention().size() << ",";
        oss << "\"noise\":" << report.noise().size() << ",";
        oss << "\"noiseRecords\":" << report.noiseRecordCount() << ",";
        oss << "\"newSignatures\":" << report.newSignatures().size() << ",";
        oss << "\"expiredSignatures\":" << report.expiredSignatures();
        oss << "}";
        return oss.str();
    }

    void JsonReporter::writeGroups(std::ostream& output,
                                   const std::vector<core::ClassifiedGroup>& groups,
                                   const char* indent) const
    {
        const bool pretty = (m_prettyPrint == PrettyPrint::PRETTY);

        output << "[";
        for (std::size_t i = 0; i < groups.size(); ++i)
        {
            if (i) output << ",";
            if (pretty) output << "\n" << indent << "  ";
            output << groupToJson(groups[i], m_report.isNew(groups[i].signature()));
        }
        if (pretty && !groups.empty()) output << "\n" << indent;
        output << "]";
    }

    void JsonReporter::writeJson(std::ostream& output) const
    {
        const bool pretty = (m_prettyPrint == PrettyPrint::PRETTY);
        const char* nl    = pretty ? "\n" : "";
        const char* ind   = pretty ? "  " : "";
        const char* sep   = pretty ? ": " : ":";

        output << "{" << nl;
        output << ind << "\"generated\"" << sep << quoted(Utils::toIso8601(Utils::now())) << "," << nl;
        output << ind << "\"runDate\"" << sep << quoted(m_report.runDate()) << "," << nl;
        output << ind << "\"summary\"" << sep << summaryToJson(m_report) << "," << nl;

        output << ind << "\"attention\"" << sep;
        writeGroups(output, m_report.attention(), ind);
        output << "," << nl;

        output << ind << "\"noise\"" << sep;
        writeGroups(output, m_report.noise(), ind);
        output << nl << "}" << nl;
    }

    std::string JsonReporter::getJsonString() const
    {
        std::ostringstream oss;
        writeJson(oss);
        return oss.str();
    }

    bool JsonReporter::writeFile(const std::string& path, std::string* errOut) const
    {
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open())
        {
            if (errOut)
                *errOut = "cannot open " + path + " for writing";
            return false;
        }

        writeJson(out);
        out.flush();
        if (out.fail())
        {
            if (errOut)
                *errOut = "write failed for " + path;
            return false;
        }
        return true;
    }

} // namespace Report
} // namespace ErrorWatch
