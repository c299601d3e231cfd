#include "pipeline/RunCoordinator.hpp"

#include <utility>

#include "utils/Logger.hpp"

namespace ErrorWatch
{
    namespace Pipeline
    {
        namespace
        {
            // Validate before any member that compiles patterns is built.
            const EngineSettings& validated(const EngineSettings& settings)
            {
                settings.validate();
                return settings;
            }
        }

        RunCoordinator::RunCoordinator(EngineSettings settings, History::HistoryStore& store)
            : m_settings(std::move(settings)),
              m_store(store),
              m_grouper(Signature::SignatureExtractor(validated(m_settings).extractorConfig()),
                        m_settings.sampleMaxChars),
              m_classifier(m_settings.customNoisePatterns)
        {
        }

        RunOutcome RunCoordinator::run(const std::vector<core::LogRecord>& records,
                                       const Utils::CivilDate& today)
        {
            auto& logger = Utils::getLogger();
            RunOutcome outcome;
            core::RunReport& report = outcome.report;

            logger.info("Run " + today.toString() + ": " + std::to_string(records.size()) + " records");

            History::HistoryMap history = m_store.load();
            logger.debug("History " + m_store.describe() + " holds " +
                         std::to_string(history.size()) + " signatures");

            Analysis::SignatureGrouper::Stats stats;
            const core::AggregateMap groups = m_grouper.group(records, &stats);

            Analysis::NoiseClassifier::Result classified = m_classifier.classify(groups);

            std::set<core::Signature> newSignatures = History::HistoryStore::update(history, groups, today);
            const std::size_t expired =
                History::HistoryStore::expire(history, today, m_settings.retentionDays);

            report.setRunDate(today.toString());
            report.setTotalRecords(stats.records);
            report.setGroupedRecords(stats.grouped);
            report.setExpiredSignatures(expired);
            report.setAttention(std::move(classified.attention));
            report.setNoise(std::move(classified.noise));
            report.setNewSignatures(std::move(newSignatures));

            logger.info(std::to_string(report.patternCount()) + " patterns (" +
                        std::to_string(report.attention().size()) + " attention, " +
                        std::to_string(report.noise().size()) + " noise), " +
                        std::to_string(report.newSignatures().size()) + " new");

            if (!m_settings.persistHistory)
            {
                logger.info("History persistence disabled, not saving");
                return outcome;
            }

            const History::SaveResult saved = m_store.save(history);
            outcome.historySaved = saved.ok;
            if (!saved.ok)
            {
                outcome.historyError = saved.error;
                logger.error("History save to " + m_store.describe() + " failed: " + saved.error);
            }
            return outcome;
        }

    } // namespace Pipeline
} // namespace ErrorWatch
