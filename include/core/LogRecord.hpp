// Core data model representing a single raw log line handed to the engine.
// Value type, cheap to store in std::vector and pass between stages.

#ifndef ERRORWATCH_CORE_LOG_RECORD_HPP
#define ERRORWATCH_CORE_LOG_RECORD_HPP

#include <string>
#include <utility>

namespace ErrorWatch
{
namespace core
{

/**
 * @brief One raw log line as fetched by an external record source.
 *
 * Responsibilities:
 *  - Carry the three fields the engine needs: when, what, where.
 *  - Stay immutable after construction; the engine only reads records.
 *
 * Design notes:
 *  - The timestamp is kept as the source's own comparable string
 *    (ISO-8601 in practice). The engine never parses it; "latest" is
 *    decided by string comparison, which is exact as long as the source
 *    formats timestamps consistently.
 *  - The source names the stream the line came from (a log group,
 *    a file, a service) and may be empty.
 */
class LogRecord
{
public:
    LogRecord() = default;

    LogRecord(std::string timestamp,
              std::string message,
              std::string source)
        : m_timestamp(std::move(timestamp)),
          m_message(std::move(message)),
          m_source(std::move(source))
    {
    }

    /// Source timestamp, e.g. "2024-05-01 12:34:56.789".
    const std::string& timestamp() const noexcept
    {
        return m_timestamp;
    }

    /// Full raw message text.
    const std::string& message() const noexcept
    {
        return m_message;
    }

    /// Originating stream (log group, file, service).
    const std::string& source() const noexcept
    {
        return m_source;
    }

private:
    std::string m_timestamp;
    std::string m_message;
    std::string m_source;
};

} // namespace core
} // namespace ErrorWatch

#endif // ERRORWATCH_CORE_LOG_RECORD_HPP
