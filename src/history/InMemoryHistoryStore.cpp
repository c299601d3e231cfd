#include "history/InMemoryHistoryStore.hpp"

#include <utility>

namespace ErrorWatch::History
{
    InMemoryHistoryStore::InMemoryHistoryStore(HistoryMap initial)
        : m_stored(std::move(initial))
    {
    }

    HistoryMap InMemoryHistoryStore::load()
    {
        return m_stored;
    }

    SaveResult InMemoryHistoryStore::save(const HistoryMap& history)
    {
        SaveResult result;
        if (m_failSaves)
        {
            result.error = m_failMessage;
            return result;
        }

        m_stored = history;
        ++m_saveCount;
        result.ok = true;
        return result;
    }

    std::string InMemoryHistoryStore::describe() const
    {
        return "memory";
    }

    void InMemoryHistoryStore::setFailSaves(bool fail, std::string message)
    {
        m_failSaves   = fail;
        m_failMessage = std::move(message);
    }

} // namespace ErrorWatch::History
