#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>

#include "core/ErrorGroup.hpp"
#include "utils/TimeUtils.hpp"

namespace ErrorWatch
{
    namespace History
    {
        /// Lifecycle of one signature across runs. Dates are "YYYY-MM-DD".
        struct HistoryEntry
        {
            std::string   firstSeenDate;
            std::string   lastSeenDate;
            std::uint64_t totalCount = 0;

            friend bool operator==(const HistoryEntry& a, const HistoryEntry& b)
            {
                return a.firstSeenDate == b.firstSeenDate &&
                       a.lastSeenDate == b.lastSeenDate &&
                       a.totalCount == b.totalCount;
            }
        };

        using HistoryMap = std::map<core::Signature, HistoryEntry>;

        /// Outcome of a save; error is empty on success.
        struct SaveResult
        {
            bool        ok = false;
            std::string error;
        };

        /**
         * HistoryStore
         *
         * Persistent signature -> HistoryEntry map. Backends only implement
         * load() and save(); the lifecycle rules (update, expire) are shared
         * and operate on the in-memory map between the two.
         *
         * A run is: load, update, expire, save. Saves replace the whole
         * persisted state.
         */
        class HistoryStore
        {
        public:
            virtual ~HistoryStore() = default;

            /**
             * Read the persisted map.
             * Missing or corrupt state yields an empty map (logged, never thrown).
             */
            virtual HistoryMap load() = 0;

            /// Replace the persisted map. Never throws for I/O problems.
            virtual SaveResult save(const HistoryMap& history) = 0;

            /// Short description of where state lives, for log lines.
            virtual std::string describe() const = 0;

            /**
             * Record today's observations.
             *
             * Signatures absent from history are created (first = last = today,
             * total = 0) and returned as new. Every signature in groups then
             * gets last = today and total += count.
             */
            static std::set<core::Signature> update(HistoryMap& history,
                                                    const core::AggregateMap& groups,
                                                    const Utils::CivilDate& today);

            /**
             * Drop entries whose last-seen date is strictly before
             * today - retentionDays. Entries with an unreadable date are
             * dropped as well. Returns the number removed.
             * Throws std::invalid_argument for a negative retention.
             */
            static std::size_t expire(HistoryMap& history,
                                      const Utils::CivilDate& today,
                                      int retentionDays);
        };

    } // namespace History
} // namespace ErrorWatch
