#include "pipeline/EngineSettings.hpp"

#include <stdexcept>

#include "utils/Logger.hpp"

namespace ErrorWatch
{
    namespace Pipeline
    {
        namespace
        {
            int requireInt(const Utils::ConfigLoader& config, const char* key, int fallback)
            {
                if (!config.hasKey(key))
                {
                    return fallback;
                }
                auto value = config.getInt(key);
                if (!value)
                {
                    throw std::invalid_argument(std::string(key) + " must be an integer, got '" +
                                                config.getStringOr(key, "") + "'");
                }
                return *value;
            }

            bool requireBool(const Utils::ConfigLoader& config, const char* key, bool fallback)
            {
                if (!config.hasKey(key))
                {
                    return fallback;
                }
                auto value = config.getBool(key);
                if (!value)
                {
                    throw std::invalid_argument(std::string(key) + " must be true or false, got '" +
                                                config.getStringOr(key, "") + "'");
                }
                return *value;
            }

            std::size_t requireCount(const Utils::ConfigLoader& config, const char* key, std::size_t fallback)
            {
                const int value = requireInt(config, key, static_cast<int>(fallback));
                if (value < 0)
                {
                    throw std::invalid_argument(std::string(key) + " must not be negative");
                }
                return static_cast<std::size_t>(value);
            }
        }

        EngineSettings EngineSettings::fromConfig(const Utils::ConfigLoader& config)
        {
            EngineSettings s;

            s.logLevel    = config.getStringOr("log_level", s.logLevel);
            s.logFile     = config.getStringOr("log_file", s.logFile);
            s.historyPath = config.getStringOr("history_path", s.historyPath);

            s.retentionDays       = requireInt(config, "retention_days", s.retentionDays);
            s.timezoneOffsetHours = requireInt(config, "timezone_offset_hours", s.timezoneOffsetHours);
            s.sampleMaxChars      = requireCount(config, "sample_max_chars", s.sampleMaxChars);
            s.persistHistory      = requireBool(config, "persist_history", s.persistHistory);

            if (auto names = config.getList("signature.field_names"))
            {
                s.fieldNames = *names;
            }
            s.messageMaxChars  = requireCount(config, "signature.message_max_chars", s.messageMaxChars);
            s.fallbackMaxChars = requireCount(config, "signature.fallback_max_chars", s.fallbackMaxChars);

            for (const auto& [key, value] : config.entriesWithPrefix("ignore."))
            {
                if (value.empty())
                {
                    Utils::getLogger().warn("Ignoring empty noise pattern " + key);
                    continue;
                }
                s.customNoisePatterns.push_back({value, false});
            }
            for (const auto& [key, value] : config.entriesWithPrefix("ignore_literal."))
            {
                if (value.empty())
                {
                    Utils::getLogger().warn("Ignoring empty noise pattern " + key);
                    continue;
                }
                s.customNoisePatterns.push_back({value, true});
            }

            // Any error_pattern.* key replaces the defaults; only empty values turn the filter off.
            const auto errorEntries = config.entriesWithPrefix("error_pattern.");
            if (!errorEntries.empty())
            {
                s.errorPatterns.clear();
                for (const auto& [key, value] : errorEntries)
                {
                    if (!value.empty())
                        s.errorPatterns.push_back(value);
                }
            }

            s.validate();
            return s;
        }

        void EngineSettings::validate() const
        {
            if (retentionDays < 0)
                throw std::invalid_argument("retention_days must not be negative");
            if (messageMaxChars == 0)
                throw std::invalid_argument("signature.message_max_chars must be positive");
            if (fallbackMaxChars == 0)
                throw std::invalid_argument("signature.fallback_max_chars must be positive");
            if (timezoneOffsetHours < -14 || timezoneOffsetHours > 14)
                throw std::invalid_argument("timezone_offset_hours must be within -14..14");
            if (!Utils::parseLogLevel(logLevel))
                throw std::invalid_argument("unknown log_level '" + logLevel + "'");
        }

        Signature::SignatureExtractor::Config EngineSettings::extractorConfig() const
        {
            return Signature::SignatureExtractor::defaultConfig(fieldNames, messageMaxChars, fallbackMaxChars);
        }

    } // namespace Pipeline
} // namespace ErrorWatch
