#include "input/FileReader.hpp"

#include <utility>

namespace ErrorWatch
{
    namespace Input
    {
        namespace
        {
            constexpr const char kUtf8Bom[] = "\xEF\xBB\xBF";
        }

        FileReader::FileReader(const std::string &filePath)
        {
            open(filePath);
        }

        FileReader::FileReader(FileReader &&other) noexcept
            : m_stream(std::move(other.m_stream)),
              m_filePath(std::move(other.m_filePath)),
              m_lineNumber(other.m_lineNumber)
        {
            other.m_lineNumber = 0;
        }

        FileReader &FileReader::operator=(FileReader &&other) noexcept
        {
            if (this != &other)
            {
                close();
                m_stream     = std::move(other.m_stream);
                m_filePath   = std::move(other.m_filePath);
                m_lineNumber = other.m_lineNumber;
                other.m_lineNumber = 0;
            }
            return *this;
        }

        bool FileReader::open(const std::string &filePath)
        {
            close();

            // Binary mode: line endings are handled in nextLine().
            m_stream.open(filePath, std::ios::in | std::ios::binary);
            if (!m_stream.is_open())
            {
                return false;
            }

            m_filePath = filePath;
            return true;
        }

        void FileReader::close() noexcept
        {
            if (m_stream.is_open())
            {
                m_stream.close();
            }
            m_stream.clear();
            m_filePath.clear();
            m_lineNumber = 0;
        }

        std::optional<std::string> FileReader::nextLine()
        {
            if (!m_stream.is_open())
            {
                return std::nullopt;
            }

            std::string line;
            if (!std::getline(m_stream, line))
            {
                return std::nullopt;
            }

            if (m_lineNumber == 0 && line.compare(0, 3, kUtf8Bom) == 0)
            {
                line.erase(0, 3);
            }
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }

            ++m_lineNumber;
            return line;
        }

    } // namespace Input
} // namespace ErrorWatch
