#pragma once

#include <cstddef>
#include <string>

#include "history/HistoryStore.hpp"

namespace ErrorWatch
{
    namespace History
    {
        /**
         * InMemoryHistoryStore
         *
         * Process-local backend for tests and dry runs. Can be seeded with an
         * initial map and told to fail saves to exercise error paths.
         */
        class InMemoryHistoryStore : public HistoryStore
        {
        public:
            InMemoryHistoryStore() = default;
            explicit InMemoryHistoryStore(HistoryMap initial);

            HistoryMap load() override;
            SaveResult save(const HistoryMap& history) override;
            std::string describe() const override;

            /// When set, save() reports failure and keeps the previous state.
            void setFailSaves(bool fail, std::string message = "simulated save failure");

            const HistoryMap& stored() const noexcept { return m_stored; }
            std::size_t saveCount() const noexcept { return m_saveCount; }

        private:
            HistoryMap  m_stored;
            bool        m_failSaves = false;
            std::string m_failMessage;
            std::size_t m_saveCount = 0;
        };

    } // namespace History
} // namespace ErrorWatch
