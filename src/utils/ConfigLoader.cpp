#include "utils/ConfigLoader.hpp"

#include <fstream>
#include <algorithm>
#include <stdexcept>

#include "utils/StringUtils.hpp"

namespace ErrorWatch
{
    namespace Utils
    {
        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                return false;
            }

            std::unordered_map<std::string, std::string> newValues;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view content = trim(line);
                if (content.empty())
                {
                    continue;
                }
                if (content.front() == '#' || content.front() == ';')
                {
                    continue;
                }

                const auto pos = content.find('=');
                if (pos == std::string_view::npos)
                {
                    continue;
                }

                const std::string_view key   = trim(content.substr(0, pos));
                const std::string_view value = trim(content.substr(pos + 1));
                if (key.empty())
                {
                    continue;
                }

                newValues[std::string(key)] = std::string(value);
            }

            // Commit under the mutex so readers never see a half-loaded file.
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_values = std::move(newValues);
            }

            return true;
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            auto v = getString(key);
            return v ? *v : std::string(defaultValue);
        }

        std::optional<int> ConfigLoader::getInt(std::string_view key) const
        {
            auto v = getString(key);
            if (!v || v->empty())
            {
                return std::nullopt;
            }

            try
            {
                std::size_t idx = 0;
                int value       = std::stoi(*v, &idx);
                if (idx != v->size())
                {
                    // Trailing characters make this invalid.
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::logic_error &)
            {
                // std::invalid_argument / std::out_of_range
                return std::nullopt;
            }
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            const std::string_view s = trim(*v);
            if (iequals(s, "1") || iequals(s, "true") ||
                iequals(s, "yes") || iequals(s, "on"))
            {
                return true;
            }
            if (iequals(s, "0") || iequals(s, "false") ||
                iequals(s, "no") || iequals(s, "off"))
            {
                return false;
            }

            return std::nullopt;
        }

        std::optional<std::vector<std::string>> ConfigLoader::getList(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }
            return splitAndTrim(*v, ',');
        }

        std::vector<std::pair<std::string, std::string>>
        ConfigLoader::entriesWithPrefix(std::string_view prefix) const
        {
            std::vector<std::pair<std::string, std::string>> out;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (const auto &kv : m_values)
                {
                    if (startsWith(kv.first, prefix) && kv.first.size() > prefix.size())
                    {
                        out.emplace_back(kv.first, kv.second);
                    }
                }
            }

            std::sort(out.begin(), out.end(),
                      [](const auto &a, const auto &b) { return a.first < b.first; });
            return out;
        }

        std::size_t ConfigLoader::size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.size();
        }

    } // namespace Utils
} // namespace ErrorWatch
