#include "analysis/SignatureGrouper.hpp"

#include <utility>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace ErrorWatch
{
    namespace Analysis
    {
        SignatureGrouper::SignatureGrouper(Signature::SignatureExtractor extractor,
                                           std::size_t sampleMaxChars)
            : m_extractor(std::move(extractor)),
              m_sampleMaxChars(sampleMaxChars)
        {
        }

        bool SignatureGrouper::add(core::AggregateMap& groups, const core::LogRecord& record) const
        {
            auto signature = m_extractor.extract(record.message());
            if (!signature)
            {
                return false;
            }

            auto [it, inserted] = groups.try_emplace(*signature);
            core::SignatureAggregate& agg = it->second;

            if (inserted)
            {
                agg.signature          = *signature;
                agg.sampleMessage      = Utils::sanitizeUtf8(Utils::truncateUtf8(record.message(), m_sampleMaxChars));
                agg.firstSeenTimestamp = record.timestamp();
                agg.lastSeenTimestamp  = record.timestamp();
            }
            else
            {
                const std::string& ts = record.timestamp();
                if (!ts.empty())
                {
                    if (agg.firstSeenTimestamp.empty() || ts < agg.firstSeenTimestamp)
                        agg.firstSeenTimestamp = ts;
                    if (ts > agg.lastSeenTimestamp)
                        agg.lastSeenTimestamp = ts;
                }
            }

            ++agg.count;
            if (!record.source().empty())
            {
                agg.sources.insert(Utils::sanitizeUtf8(record.source()));
            }
            return true;
        }

        core::AggregateMap SignatureGrouper::group(const std::vector<core::LogRecord>& records,
                                                   Stats* statsOut) const
        {
            core::AggregateMap groups;
            Stats stats;
            stats.records = records.size();

            for (const auto& record : records)
            {
                if (add(groups, record))
                    ++stats.grouped;
                else
                    ++stats.skipped;
            }

            Utils::getLogger().debug("Grouped " + std::to_string(stats.grouped) + " of " +
                                     std::to_string(stats.records) + " records into " +
                                     std::to_string(groups.size()) + " signatures (" +
                                     std::to_string(stats.skipped) + " skipped)");

            if (statsOut)
            {
                *statsOut = stats;
            }
            return groups;
        }

    } // namespace Analysis
} // namespace ErrorWatch
