#include "input/RecordReader.hpp"

#include <filesystem>
#include <utility>

#include "core/PatternError.hpp"
#include "input/FileReader.hpp"
#include "input/RecordParser.hpp"
#include "utils/Logger.hpp"

namespace ErrorWatch
{
    namespace Input
    {
        std::vector<std::string> ErrorFilter::defaultPatterns()
        {
            return {"ERROR", "Exception", "FATAL"};
        }

        ErrorFilter::ErrorFilter(const std::vector<std::string>& patterns)
        {
            m_patterns.reserve(patterns.size());
            for (const auto& p : patterns)
            {
                try
                {
                    m_patterns.emplace_back(p, std::regex::ECMAScript);
                }
                catch (const std::regex_error& ex)
                {
                    throw core::PatternError(p, ex.what());
                }
            }
        }

        bool ErrorFilter::accepts(const std::string& message) const
        {
            if (m_patterns.empty())
            {
                return true;
            }
            for (const auto& re : m_patterns)
            {
                try
                {
                    if (std::regex_search(message, re))
                        return true;
                }
                catch (const std::regex_error& ex)
                {
                    Utils::getLogger().warn(std::string("Error filter pattern failed on a line: ") + ex.what());
                }
            }
            return false;
        }

        RecordReader::RecordReader(ErrorFilter filter, std::optional<std::string> sourceOverride)
            : m_filter(std::move(filter)),
              m_sourceOverride(std::move(sourceOverride))
        {
        }

        bool RecordReader::readFile(const std::string& path,
                                    std::vector<core::LogRecord>& out,
                                    std::string* errOut)
        {
            auto& logger = Utils::getLogger();

            FileReader reader(path);
            if (!reader.isOpen())
            {
                if (errOut)
                    *errOut = "cannot open " + path;
                return false;
            }

            const std::string source = m_sourceOverride
                                           ? *m_sourceOverride
                                           : std::filesystem::path(path).stem().string();
            RecordParser parser(source);

            std::size_t kept = 0;
            std::size_t malformed = 0;
            while (auto line = reader.nextLine())
            {
                auto result = parser.parseLineDetailed(*line);
                if (result.malformed)
                {
                    ++malformed;
                    logger.debug(path + ":" + std::to_string(reader.lineNumber()) + ": " + result.error);
                    continue;
                }
                if (!result.record)
                {
                    continue;
                }
                if (!m_filter.accepts(result.record->message()))
                {
                    ++m_stats.filteredOut;
                    continue;
                }

                out.push_back(std::move(*result.record));
                ++kept;
            }

            ++m_stats.files;
            m_stats.linesRead += reader.lineNumber();
            m_stats.records += kept;
            m_stats.malformed += malformed;

            if (malformed > 0)
            {
                logger.warn(path + ": skipped " + std::to_string(malformed) + " malformed lines");
            }
            logger.info("Read " + std::to_string(kept) + " records from " + path + " (" +
                        std::to_string(reader.lineNumber()) + " lines)");

            if (reader.failed())
            {
                if (errOut)
                    *errOut = "read error in " + path + " after line " + std::to_string(reader.lineNumber());
                return false;
            }
            return true;
        }

    } // namespace Input
} // namespace ErrorWatch
