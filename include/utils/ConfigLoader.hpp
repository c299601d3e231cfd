#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <utility>
#include <vector>

namespace ErrorWatch
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration file (key = value format).
         *  - Expose read-only access to configuration values.
         *  - Provide typed getters with defaults.
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines are ignored, malformed lines are skipped.
         *  - Whitespace around key and value is trimmed.
         *  - Last occurrence wins when a key repeats.
         *
         * Example:
         *   log_level            = INFO
         *   history_path         = data/error-history.json
         *   retention_days       = 30
         *   ignore.vendor_api    = VendorApiTimeout
         *
         * There is deliberately no process-wide instance: callers load a
         * ConfigLoader and turn it into typed settings explicitly.
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            ~ConfigLoader() = default;

            /**
             * Load configuration from a file path, replacing current values.
             *
             * Returns true on success, false if the file cannot be opened
             * (existing values are kept in that case).
             */
            bool loadFromFile(const std::string &filePath);

            /// Manually set a configuration key-value pair (tests, CLI overrides).
            void set(std::string key, std::string value);

            /// Check if a key exists in the loaded configuration.
            bool hasKey(std::string_view key) const;

            /// Get raw string value for a key; returns std::nullopt if missing.
            std::optional<std::string> getString(std::string_view key) const;

            /// Get string value or a default if the key is missing.
            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /// Get integer value; returns std::nullopt if missing or invalid.
            std::optional<int> getInt(std::string_view key) const;

            /**
             * Get boolean value; returns std::nullopt if missing or invalid.
             *
             * Accepted true values (case-insensitive): "1", "true", "yes", "on"
             * Accepted false values (case-insensitive): "0", "false", "no", "off"
             */
            std::optional<bool> getBool(std::string_view key) const;

            /// Comma-separated list value, each item trimmed, empty items dropped.
            std::optional<std::vector<std::string>> getList(std::string_view key) const;

            /**
             * All entries whose key starts with prefix, sorted by key.
             *
             * Used for "one item per key" settings such as ignore.<name> where
             * the value itself may contain commas (regular expressions).
             */
            std::vector<std::pair<std::string, std::string>>
            entriesWithPrefix(std::string_view prefix) const;

            /// Number of loaded keys.
            std::size_t size() const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::unordered_map<std::string, std::string> m_values;
            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace ErrorWatch
