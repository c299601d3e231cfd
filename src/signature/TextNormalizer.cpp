#include "signature/TextNormalizer.hpp"

#include <utility>

#include "core/PatternError.hpp"
#include "utils/StringUtils.hpp"

namespace ErrorWatch::Signature
{
    namespace
    {
        std::regex compileScrubber(const std::string& pattern)
        {
            try
            {
                return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
            }
            catch (const std::regex_error& ex)
            {
                throw core::PatternError(pattern, ex.what());
            }
        }
    }

    std::vector<std::string> defaultFieldNames()
    {
        return {"preset", "langCode", "consumer", "name", "desc", "image_file", "prompt"};
    }

    NormalizerConfig messageNormalizer(std::size_t maxChars)
    {
        NormalizerConfig cfg;
        cfg.fieldNames     = defaultFieldNames();
        cfg.outputMaxChars = maxChars;
        return cfg;
    }

    NormalizerConfig fallbackNormalizer(std::size_t maxChars)
    {
        NormalizerConfig cfg;
        cfg.inputMaxChars   = maxChars;
        cfg.scrubTimestamps = true;
        cfg.scrubUrls       = false;
        cfg.braceMinChars   = 0;
        cfg.bracketMinChars = 0;
        return cfg;
    }

    TextNormalizer::TextNormalizer(NormalizerConfig config)
        : m_config(std::move(config))
    {
        if (m_config.scrubHexIds)
            m_scrubbers.push_back({compileScrubber(R"(\b[0-9a-f]{8,}\b)"), "{id}"});

        if (m_config.scrubTimestamps)
            m_scrubbers.push_back({compileScrubber(R"(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2}[\d.]*)"), "{ts}"});

        if (m_config.scrubNumbers)
            m_scrubbers.push_back({compileScrubber(R"(\b\d{5,}\b)"), "{num}"});

        if (m_config.scrubUrls)
            m_scrubbers.push_back({compileScrubber(R"(https?://\S+)"), "{url}"});

        if (!m_config.fieldNames.empty())
        {
            std::string alternation;
            for (const auto& name : m_config.fieldNames)
            {
                if (name.empty())
                    continue;
                if (!alternation.empty())
                    alternation += '|';
                alternation += Utils::regexEscape(name);
            }
            if (!alternation.empty())
                m_scrubbers.push_back({compileScrubber("(" + alternation + R"()[=:]\s*\S+)"), "$1={val}"});
        }

        if (m_config.braceMinChars > 0)
        {
            const std::string n = std::to_string(m_config.braceMinChars);
            m_scrubbers.push_back({compileScrubber(R"(\{[^}]{)" + n + R"(,}\})"), "{...}"});
        }

        if (m_config.bracketMinChars > 0)
        {
            const std::string n = std::to_string(m_config.bracketMinChars);
            m_scrubbers.push_back({compileScrubber(R"(\[[^\]]{)" + n + R"(,}\])"), "[...]"});
        }
    }

    std::string TextNormalizer::apply(std::string_view text) const
    {
        std::string out = m_config.inputMaxChars > 0
                              ? Utils::truncateUtf8(text, m_config.inputMaxChars)
                              : std::string(text);

        for (const auto& s : m_scrubbers)
            out = std::regex_replace(out, s.pattern, s.replacement);

        if (m_config.outputMaxChars > 0)
            out = Utils::truncateUtf8(out, m_config.outputMaxChars);

        return out;
    }

} // namespace ErrorWatch::Signature
