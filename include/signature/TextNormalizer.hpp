#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace ErrorWatch
{
    namespace Signature
    {
        /// Field names whose values are replaced by "{val}" in signatures.
        std::vector<std::string> defaultFieldNames();

        /**
         * Data describing how variable content is scrubbed out of a message.
         *
         * Scrub order is fixed: inputMaxChars truncation, hex ids, timestamps,
         * long numbers, URLs, field values, brace payloads, bracket payloads,
         * outputMaxChars truncation. Any step can be switched off.
         */
        struct NormalizerConfig
        {
            std::size_t inputMaxChars = 0;    ///< Truncate before scrubbing (0 = off).
            bool scrubHexIds = true;          ///< [0-9a-f]{8,} -> {id}
            bool scrubTimestamps = false;     ///< ISO date-time -> {ts}
            bool scrubNumbers = true;         ///< 5+ digit numbers -> {num}
            bool scrubUrls = true;            ///< http(s)://... -> {url}
            std::vector<std::string> fieldNames;
            std::size_t braceMinChars = 20;   ///< {...} collapse threshold (0 = off).
            std::size_t bracketMinChars = 30; ///< [...] collapse threshold (0 = off).
            std::size_t outputMaxChars = 0;   ///< Truncate after scrubbing (0 = off).
        };

        /// Normalizer used for exception and leveled-line messages.
        NormalizerConfig messageNormalizer(std::size_t maxChars = 80);

        /// Normalizer used for the fallback rule.
        NormalizerConfig fallbackNormalizer(std::size_t maxChars = 100);

        /**
         * TextNormalizer
         *
         * Compiled form of a NormalizerConfig. Immutable after construction and
         * safe to share between threads. Truncation counts UTF-8 code points.
         */
        class TextNormalizer
        {
        public:
            explicit TextNormalizer(NormalizerConfig config);

            std::string apply(std::string_view text) const;

            const NormalizerConfig& config() const noexcept { return m_config; }

        private:
            struct Scrubber
            {
                std::regex  pattern;
                std::string replacement;
            };

            NormalizerConfig      m_config;
            std::vector<Scrubber> m_scrubbers;
        };

    } // namespace Signature
} // namespace ErrorWatch
