#pragma once

#include <string>
#include <vector>

#include "analysis/NoiseClassifier.hpp"
#include "analysis/SignatureGrouper.hpp"
#include "core/LogRecord.hpp"
#include "core/Report.hpp"
#include "history/HistoryStore.hpp"
#include "pipeline/EngineSettings.hpp"
#include "utils/TimeUtils.hpp"

namespace ErrorWatch
{
    namespace Pipeline
    {
        /// Report plus the fate of the history save. A failed save still carries a full report.
        struct RunOutcome
        {
            core::RunReport report;
            bool historySaved = false;
            std::string historyError;   ///< Empty when saved or when persistence is off.
        };

        /**
         * RunCoordinator
         *
         * Drives one batch through the engine:
         *   load history -> group -> classify -> update -> expire -> save
         *
         * The constructor compiles every pattern and validates settings, so
         * configuration errors surface before any record is touched. The
         * history store is borrowed and must outlive the coordinator.
         */
        class RunCoordinator
        {
        public:
            RunCoordinator(EngineSettings settings, History::HistoryStore& store);

            RunCoordinator(const RunCoordinator&) = delete;
            RunCoordinator& operator=(const RunCoordinator&) = delete;

            RunOutcome run(const std::vector<core::LogRecord>& records, const Utils::CivilDate& today);

            const EngineSettings& settings() const noexcept { return m_settings; }

        private:
            EngineSettings m_settings;
            History::HistoryStore& m_store;
            Analysis::SignatureGrouper m_grouper;
            Analysis::NoiseClassifier m_classifier;
        };

    } // namespace Pipeline
} // namespace ErrorWatch
