#include "input/RecordParser.hpp"

#include <initializer_list>
#include <regex>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils/StringUtils.hpp"

using json = nlohmann::json;

namespace ErrorWatch
{
    namespace Input
    {
        namespace
        {
            // Leading "2024-05-01 12:00:00", optional fraction and zone, optionally bracketed.
            const std::regex &leadingTimestamp()
            {
                static const std::regex re(
                    R"(^\[?(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2}(?:[.,]\d+)?(?:Z|[+-]\d{2}:?\d{2})?)\]?\s+)");
                return re;
            }

            // Scalars are rendered as text; null, arrays and objects count as absent.
            std::optional<std::string> scalarText(const json &value)
            {
                if (value.is_string())
                    return value.get<std::string>();
                if (value.is_number_integer() || value.is_number_float() || value.is_boolean())
                    return value.dump();
                return std::nullopt;
            }

            std::optional<std::string> firstField(const json &object, std::initializer_list<const char *> keys)
            {
                for (const char *key : keys)
                {
                    auto it = object.find(key);
                    if (it == object.end())
                        continue;
                    if (auto text = scalarText(*it))
                        return text;
                }
                return std::nullopt;
            }
        }

        RecordParser::RecordParser(std::string defaultSource)
            : m_defaultSource(std::move(defaultSource))
        {
        }

        RecordParser::ParseResult RecordParser::parseLineDetailed(std::string_view rawLine) const
        {
            ParseResult r;

            const std::string_view line = Utils::trim(rawLine);
            if (line.empty())
            {
                return r;
            }

            if (line.front() == '{')
            {
                r.wasJson = true;
                std::string err;
                auto record = tryParseJsonLine(line, &err);
                if (!record)
                {
                    r.malformed = true;
                    r.error     = err;
                    return r;
                }
                r.record = std::move(record);
                return r;
            }

            r.record = parseTextLine(line);
            return r;
        }

        std::optional<core::LogRecord> RecordParser::tryParseJsonLine(std::string_view line,
                                                                      std::string *errOut) const
        {
            json object = json::parse(line.begin(), line.end(), nullptr, false);
            if (object.is_discarded())
            {
                if (errOut)
                    *errOut = "invalid JSON";
                return std::nullopt;
            }
            if (!object.is_object())
            {
                if (errOut)
                    *errOut = "JSON line is not an object";
                return std::nullopt;
            }

            auto message = firstField(object, {"@message", "message", "msg"});
            if (!message)
            {
                if (errOut)
                    *errOut = "no message field";
                return std::nullopt;
            }

            std::string timestamp = firstField(object, {"@timestamp", "timestamp", "time"}).value_or("");
            std::string source    = firstField(object, {"log_group", "source", "@logStream", "service"})
                                     .value_or(m_defaultSource);

            return core::LogRecord(std::move(timestamp), std::move(*message), std::move(source));
        }

        core::LogRecord RecordParser::parseTextLine(std::string_view line) const
        {
            const std::string text(line);
            std::smatch m;
            if (std::regex_search(text, m, leadingTimestamp()))
            {
                std::string message = m.suffix().str();
                if (!message.empty())
                {
                    return core::LogRecord(m.str(1), std::move(message), m_defaultSource);
                }
            }
            return core::LogRecord("", text, m_defaultSource);
        }

    } // namespace Input
} // namespace ErrorWatch
