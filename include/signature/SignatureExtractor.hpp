#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "core/ErrorGroup.hpp"
#include "signature/TextNormalizer.hpp"

namespace ErrorWatch
{
    namespace Signature
    {
        /**
         * SignatureExtractor
         *
         * Turns one raw log message into a stable grouping key.
         *
         * Evaluation:
         *  - The message is trimmed. Empty text and stack-trace continuation
         *    lines (skip prefixes) produce no signature.
         *  - Rules are tried in table order; the first rule that produces a
         *    signature wins.
         *  - When no rule matches, the fallback normalizer is applied to the
         *    whole line.
         *
         * Rules are data (RuleConfig) compiled once into callables, so new log
         * dialects are added by appending or inserting a rule.
         */
        class SignatureExtractor
        {
        public:
            enum class RuleKind
            {
                EXCEPTION_WITH_MESSAGE, // group 1 = class, group 2 = message
                EXCEPTION_CLASS_ONLY,   // group 1 = class
                LEVELED_LINE,           // group 1 = level, group 2 = message
                CUSTOM                  // regex format string, then normalized
            };

            struct RuleConfig
            {
                std::string name;
                RuleKind kind = RuleKind::CUSTOM;
                std::string pattern;                ///< ECMAScript, searched anywhere.
                NormalizerConfig normalizer;
                std::vector<std::string> levels;    ///< LEVELED_LINE: accepted levels.
                std::string format;                 ///< CUSTOM: e.g. "$1: $2".
            };

            struct Config
            {
                std::vector<std::string> skipPrefixes;
                std::vector<RuleConfig> rules;
                NormalizerConfig fallback;
                /// Lines longer than this are cut before matching (0 = off).
                std::size_t matchMaxChars = 1000;
            };

            /// Outcome of one extraction, with the rule that produced it.
            struct Extraction
            {
                std::optional<core::Signature> signature;
                std::string rule;   ///< Rule name, "fallback", or empty when skipped.
            };

            /**
             * Built-in table: exception with message, exception class only,
             * leveled line (ERROR, WARN, FATAL), then fallback.
             */
            static Config defaultConfig(std::vector<std::string> fieldNames = defaultFieldNames(),
                                        std::size_t messageMaxChars = 80,
                                        std::size_t fallbackMaxChars = 100);

            /// Throws core::PatternError when a rule pattern does not compile.
            explicit SignatureExtractor(Config config = defaultConfig());

            std::optional<core::Signature> extract(std::string_view message) const;

            Extraction explain(std::string_view message) const;

            /// Append a rule after the existing ones (before the fallback).
            void addRule(const RuleConfig& rule);

            /// Insert a rule at position (clamped to the table size).
            void insertRule(std::size_t position, const RuleConfig& rule);

            std::vector<std::string> ruleNames() const;

        private:
            using RuleFunction = std::function<std::optional<core::Signature>(const std::smatch&)>;

            struct CompiledRule
            {
                RuleConfig config;
                std::regex matcher;
                RuleFunction function;
            };

            CompiledRule compileRule(const RuleConfig& rule) const;

            bool isSkipped(std::string_view line) const;

        private:
            std::vector<std::string>  m_skipPrefixes;
            std::vector<CompiledRule> m_rules;
            TextNormalizer            m_fallback;
            std::size_t               m_matchMaxChars;
        };

        /// "com.example.FooException" -> "FooException"
        std::string shortClassName(std::string_view qualified);

    } // namespace Signature
} // namespace ErrorWatch
