#include "history/JsonFileHistoryStore.hpp"

#include <chrono>
#include <fstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils/Logger.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ErrorWatch::History
{
    namespace
    {
        const char* const kFirstSeen  = "first_seen";
        const char* const kLastSeen   = "last_seen";
        const char* const kTotalCount = "total_count";

        // Returns false (and leaves entry untouched) when the value is not a usable entry.
        bool readEntry(const json& value, HistoryEntry& entry, std::string& why)
        {
            if (!value.is_object())
            {
                why = "not an object";
                return false;
            }

            auto first = value.find(kFirstSeen);
            auto last  = value.find(kLastSeen);
            if (first == value.end() || !first->is_string() ||
                last == value.end() || !last->is_string())
            {
                why = "missing first_seen/last_seen";
                return false;
            }

            std::uint64_t total = 0;
            auto count = value.find(kTotalCount);
            if (count != value.end())
            {
                if (!count->is_number_integer() || count->get<std::int64_t>() < 0)
                {
                    why = "total_count is not a non-negative integer";
                    return false;
                }
                total = count->get<std::uint64_t>();
            }

            entry.firstSeenDate = first->get<std::string>();
            entry.lastSeenDate  = last->get<std::string>();
            entry.totalCount    = total;
            return true;
        }
    }

    JsonFileHistoryStore::JsonFileHistoryStore(fs::path path)
        : m_path(std::move(path))
    {
    }

    std::string JsonFileHistoryStore::describe() const
    {
        return m_path.string();
    }

    HistoryMap JsonFileHistoryStore::load()
    {
        auto& logger = Utils::getLogger();
        HistoryMap history;

        std::error_code ec;
        if (!fs::exists(m_path, ec))
        {
            logger.info("No history at " + m_path.string() + ", starting empty");
            return history;
        }

        std::ifstream in(m_path);
        if (!in.is_open())
        {
            logger.warn("Cannot open history file " + m_path.string() + ", starting empty");
            return history;
        }

        json root;
        try
        {
            root = json::parse(in);
        }
        catch (const json::parse_error& ex)
        {
            logger.warn("Corrupt history file " + m_path.string() + " (" + ex.what() + "), starting empty");
            return history;
        }

        if (!root.is_object())
        {
            logger.warn("History file " + m_path.string() + " is not a JSON object, starting empty");
            return history;
        }

        std::size_t skipped = 0;
        for (auto it = root.begin(); it != root.end(); ++it)
        {
            HistoryEntry entry;
            std::string why;
            if (!readEntry(it.value(), entry, why))
            {
                logger.warn("Skipping history entry '" + it.key() + "': " + why);
                ++skipped;
                continue;
            }
            history.emplace(it.key(), std::move(entry));
        }

        logger.debug("Loaded " + std::to_string(history.size()) + " history entries from " +
                     m_path.string() + (skipped ? " (" + std::to_string(skipped) + " skipped)" : ""));
        return history;
    }

    SaveResult JsonFileHistoryStore::save(const HistoryMap& history)
    {
        SaveResult result;

        json root = json::object();
        for (const auto& [signature, entry] : history)
        {
            root[signature] = {
                {kFirstSeen, entry.firstSeenDate},
                {kLastSeen, entry.lastSeenDate},
                {kTotalCount, entry.totalCount},
            };
        }

        std::string content;
        try
        {
            // Invalid UTF-8 in a signature is replaced rather than failing the whole save.
            content = root.dump(2, ' ', false, json::error_handler_t::replace);
        }
        catch (const json::exception& ex)
        {
            result.error = std::string("cannot serialize history: ") + ex.what();
            return result;
        }
        content += '\n';

        std::error_code ec;
        if (m_path.has_parent_path())
        {
            fs::create_directories(m_path.parent_path(), ec);
            if (ec)
            {
                result.error = "cannot create directory " + m_path.parent_path().string() + ": " + ec.message();
                return result;
            }
        }

        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        fs::path tempPath = m_path;
        tempPath += "." + std::to_string(stamp) + ".tmp";

        {
            std::ofstream out(tempPath, std::ios::out | std::ios::trunc);
            if (!out.is_open())
            {
                result.error = "cannot open temp file " + tempPath.string();
                return result;
            }
            out << content;
            out.flush();
            if (out.fail())
            {
                out.close();
                fs::remove(tempPath, ec);
                result.error = "write failed for " + tempPath.string();
                return result;
            }
        }

        fs::rename(tempPath, m_path, ec);
        if (ec)
        {
            result.error = "cannot replace " + m_path.string() + ": " + ec.message();
            std::error_code cleanup;
            fs::remove(tempPath, cleanup);
            return result;
        }

        result.ok = true;
        Utils::getLogger().debug("Saved " + std::to_string(history.size()) + " history entries to " +
                                 m_path.string());
        return result;
    }

} // namespace ErrorWatch::History
