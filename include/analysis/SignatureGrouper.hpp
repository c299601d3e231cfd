#pragma once

#include <cstddef>
#include <vector>

#include "core/ErrorGroup.hpp"
#include "core/LogRecord.hpp"
#include "signature/SignatureExtractor.hpp"

namespace ErrorWatch
{
    namespace Analysis
    {
        /**
         * SignatureGrouper
         *
         * Responsibilities:
         *  - Map every record of a batch to its signature
         *  - Fold records with equal signatures into one SignatureAggregate
         *
         * Design notes:
         *  - Records without a signature (blank, stack-trace continuation)
         *    are skipped and counted, never an error
         *  - The sample message is the first record seen, capped at
         *    sampleMaxChars code points (0 keeps it whole)
         *  - first/last seen use plain string comparison of timestamps;
         *    empty timestamps never win either comparison
         */
        class SignatureGrouper
        {
        public:
            struct Stats
            {
                std::size_t records = 0;
                std::size_t grouped = 0;
                std::size_t skipped = 0;
            };

            explicit SignatureGrouper(Signature::SignatureExtractor extractor,
                                      std::size_t sampleMaxChars = 200);

            /// Group a whole batch. Stats are written to statsOut when given.
            core::AggregateMap group(const std::vector<core::LogRecord>& records,
                                     Stats* statsOut = nullptr) const;

            /**
             * Fold one record into an existing map.
             * Returns false when the record produced no signature.
             */
            bool add(core::AggregateMap& groups, const core::LogRecord& record) const;

            const Signature::SignatureExtractor& extractor() const noexcept { return m_extractor; }
            std::size_t sampleMaxChars() const noexcept { return m_sampleMaxChars; }

        private:
            Signature::SignatureExtractor m_extractor;
            std::size_t m_sampleMaxChars;
        };

    } // namespace Analysis
} // namespace ErrorWatch
