#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "analysis/NoiseClassifier.hpp"
#include "signature/SignatureExtractor.hpp"
#include "utils/ConfigLoader.hpp"

namespace ErrorWatch
{
    namespace Pipeline
    {
        /**
         * EngineSettings
         *
         * Typed view of the configuration. The engine part (noise patterns,
         * retention, extraction limits, persist flag) is consumed by the
         * RunCoordinator; the rest is read by the CLI.
         *
         * Nothing here is global: settings are built once and passed in.
         */
        struct EngineSettings
        {
            // ---------- engine ----------
            std::vector<Analysis::NoisePattern> customNoisePatterns;
            int retentionDays = 30;
            std::size_t sampleMaxChars = 200;
            bool persistHistory = true;
            std::vector<std::string> fieldNames = Signature::defaultFieldNames();
            std::size_t messageMaxChars = 80;
            std::size_t fallbackMaxChars = 100;

            // ---------- tool ----------
            std::string historyPath = "data/error-history.json";
            int timezoneOffsetHours = 9;
            std::vector<std::string> errorPatterns{"ERROR", "Exception", "FATAL"};
            std::string logLevel = "INFO";
            std::string logFile;

            /**
             * Build from a loaded config. Missing keys keep their defaults;
             * present but unusable values throw std::invalid_argument.
             */
            static EngineSettings fromConfig(const Utils::ConfigLoader& config);

            /// Throws std::invalid_argument naming the first bad setting.
            void validate() const;

            Signature::SignatureExtractor::Config extractorConfig() const;
        };

    } // namespace Pipeline
} // namespace ErrorWatch
