#pragma once

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>

namespace ErrorWatch
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Line-at-a-time reader over one log file.
         *
         * Design notes:
         *  - Owns its std::ifstream (RAII); movable, not copyable.
         *  - Strips a trailing '\r' and a leading UTF-8 byte order mark.
         *  - Counts the lines handed out so callers can report positions.
         */
        class FileReader
        {
        public:
            FileReader() = default;

            /// Opens immediately; check isOpen().
            explicit FileReader(const std::string &filePath);

            FileReader(const FileReader &)            = delete;
            FileReader &operator=(const FileReader &) = delete;

            FileReader(FileReader &&other) noexcept;
            FileReader &operator=(FileReader &&other) noexcept;

            ~FileReader() = default;

            /// Closes any previous file first.
            bool open(const std::string &filePath);

            void close() noexcept;

            bool isOpen() const noexcept { return m_stream.is_open(); }

            const std::string &filePath() const noexcept { return m_filePath; }

            /// Number of lines returned by nextLine() since open().
            std::size_t lineNumber() const noexcept { return m_lineNumber; }

            /// Next line without its terminator, or std::nullopt at EOF / on error.
            std::optional<std::string> nextLine();

            /// True once reading stopped for a reason other than EOF.
            bool failed() const noexcept { return m_stream.bad(); }

        private:
            std::ifstream m_stream;
            std::string   m_filePath;
            std::size_t   m_lineNumber = 0;
        };

    } // namespace Input
} // namespace ErrorWatch
