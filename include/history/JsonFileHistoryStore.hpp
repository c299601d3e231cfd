#pragma once

#include <filesystem>
#include <string>

#include "history/HistoryStore.hpp"

namespace ErrorWatch
{
    namespace History
    {
        /**
         * JsonFileHistoryStore
         *
         * Keeps the history as one JSON object on disk:
         *
         *   { "<signature>": { "first_seen": "2024-05-01",
         *                      "last_seen":  "2024-05-03",
         *                      "total_count": 42 }, ... }
         *
         * Saves write a sibling temp file and rename it over the target, so
         * a crash mid-write leaves the previous file intact. Missing parent
         * directories are created on save.
         */
        class JsonFileHistoryStore : public HistoryStore
        {
        public:
            explicit JsonFileHistoryStore(std::filesystem::path path);

            HistoryMap load() override;
            SaveResult save(const HistoryMap& history) override;
            std::string describe() const override;

            const std::filesystem::path& path() const noexcept { return m_path; }

        private:
            std::filesystem::path m_path;
        };

    } // namespace History
} // namespace ErrorWatch
