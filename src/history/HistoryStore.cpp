#include "history/HistoryStore.hpp"

#include <stdexcept>

#include "utils/Logger.hpp"

namespace ErrorWatch
{
    namespace History
    {
        std::set<core::Signature> HistoryStore::update(HistoryMap& history,
                                                       const core::AggregateMap& groups,
                                                       const Utils::CivilDate& today)
        {
            const std::string day = today.toString();
            std::set<core::Signature> newSignatures;

            for (const auto& [signature, aggregate] : groups)
            {
                auto [it, inserted] = history.try_emplace(signature);
                if (inserted)
                {
                    it->second.firstSeenDate = day;
                    it->second.totalCount    = 0;
                    newSignatures.insert(signature);
                }

                it->second.lastSeenDate = day;
                it->second.totalCount += aggregate.count;
            }

            return newSignatures;
        }

        std::size_t HistoryStore::expire(HistoryMap& history,
                                         const Utils::CivilDate& today,
                                         int retentionDays)
        {
            if (retentionDays < 0)
            {
                throw std::invalid_argument("retention days must not be negative: " +
                                            std::to_string(retentionDays));
            }

            const Utils::CivilDate cutoff = today.addDays(-static_cast<std::int64_t>(retentionDays));
            std::size_t removed = 0;

            for (auto it = history.begin(); it != history.end();)
            {
                const auto lastSeen = Utils::CivilDate::parse(it->second.lastSeenDate);
                if (!lastSeen)
                {
                    Utils::getLogger().warn("Dropping history entry with unreadable last_seen '" +
                                            it->second.lastSeenDate + "': " + it->first);
                    it = history.erase(it);
                    ++removed;
                }
                else if (*lastSeen < cutoff)
                {
                    it = history.erase(it);
                    ++removed;
                }
                else
                {
                    ++it;
                }
            }

            if (removed > 0)
            {
                Utils::getLogger().info("Expired " + std::to_string(removed) +
                                        " signatures last seen before " + cutoff.toString());
            }
            return removed;
        }

    } // namespace History
} // namespace ErrorWatch
