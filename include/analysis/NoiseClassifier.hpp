#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "core/ErrorGroup.hpp"

namespace ErrorWatch
{
    namespace Analysis
    {
        /// One caller-supplied noise pattern. Literal patterns match as plain substrings.
        struct NoisePattern
        {
            std::string text;
            bool literal = false;
        };

        /**
         * NoiseClassifier
         *
         * Responsibilities:
         *  - Partition signature aggregates into "attention" and "noise"
         *  - Own the built-in list of known-benign error shapes
         *    (network/transport failures, client disconnects, throttling)
         *
         * Design notes:
         *  - Effective pattern list = built-ins followed by custom patterns
         *  - A signature is noise if ANY pattern is found in it
         *    (case-insensitive search); there is no override in the
         *    other direction
         *  - All patterns are compiled in the constructor; a bad one throws
         *    core::PatternError and no classifier is created
         *  - Immutable after construction, classify() is const
         */
        class NoiseClassifier
        {
        public:
            struct Result
            {
                std::vector<core::ClassifiedGroup> attention;
                std::vector<core::ClassifiedGroup> noise;
            };

            static const std::vector<std::string>& builtinPatterns();

            explicit NoiseClassifier(const std::vector<NoisePattern>& customPatterns = {});

            bool isNoise(const core::Signature& signature) const;

            /// First pattern (as written) matching the signature, if any.
            std::optional<std::string> matchingPattern(const core::Signature& signature) const;

            /// Both lists come back in report order.
            Result classify(const core::AggregateMap& groups) const;

            std::size_t patternCount() const noexcept { return m_patterns.size(); }

        private:
            struct CompiledPattern
            {
                std::string source;
                std::regex  regex;
            };

            void addPattern(const std::string& text, bool literal);

            std::vector<CompiledPattern> m_patterns;
        };

    } // namespace Analysis
} // namespace ErrorWatch
