#include "signature/SignatureExtractor.hpp"

#include <algorithm>
#include <utility>

#include "core/PatternError.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace ErrorWatch::Signature
{
    namespace
    {
        // The class name must start the line or follow a non-name character, so a
        // search never restarts inside a long word.
        const char* const kExceptionClass =
            R"((?:^|[^\w$.])([\w$.]+(?:Exception|Error|Failure|Fault|Throwable)))";

        std::string joinClassAndMessage(const std::string& shortClass, const std::string& message)
        {
            if (message.empty())
                return shortClass;
            return shortClass + ": " + message;
        }
    }

    std::string shortClassName(std::string_view qualified)
    {
        const auto pos = qualified.rfind('.');
        if (pos == std::string_view::npos)
            return std::string(qualified);
        return std::string(qualified.substr(pos + 1));
    }

    SignatureExtractor::Config SignatureExtractor::defaultConfig(std::vector<std::string> fieldNames,
                                                                 std::size_t messageMaxChars,
                                                                 std::size_t fallbackMaxChars)
    {
        Config cfg;
        cfg.skipPrefixes = {"at ", "Caused by:", "..."};

        NormalizerConfig msg = messageNormalizer(messageMaxChars);
        msg.fieldNames = std::move(fieldNames);

        RuleConfig withMessage;
        withMessage.name       = "exception_with_message";
        withMessage.kind       = RuleKind::EXCEPTION_WITH_MESSAGE;
        withMessage.pattern    = std::string(kExceptionClass) + R"(\s*:\s*(.*))";
        withMessage.normalizer = msg;
        cfg.rules.push_back(withMessage);

        RuleConfig classOnly;
        classOnly.name    = "exception_class_only";
        classOnly.kind    = RuleKind::EXCEPTION_CLASS_ONLY;
        classOnly.pattern = std::string(kExceptionClass) + R"(\s*$)";
        cfg.rules.push_back(classOnly);

        RuleConfig leveled;
        leveled.name       = "leveled_line";
        leveled.kind       = RuleKind::LEVELED_LINE;
        leveled.pattern    = R"(\[(\w+)\s*\]\s+\[[\w$.]+\]\s+(.*))";
        leveled.normalizer = msg;
        leveled.levels     = {"ERROR", "WARN", "FATAL"};
        cfg.rules.push_back(leveled);

        cfg.fallback = fallbackNormalizer(fallbackMaxChars);
        return cfg;
    }

    SignatureExtractor::SignatureExtractor(Config config)
        : m_skipPrefixes(std::move(config.skipPrefixes)),
          m_fallback(std::move(config.fallback)),
          m_matchMaxChars(config.matchMaxChars)
    {
        m_rules.reserve(config.rules.size());
        for (const auto& rule : config.rules)
            m_rules.push_back(compileRule(rule));

        Utils::getLogger().debug("SignatureExtractor initialized with " +
                                 std::to_string(m_rules.size()) + " rules");
    }

    SignatureExtractor::CompiledRule SignatureExtractor::compileRule(const RuleConfig& rule) const
    {
        CompiledRule compiled;
        compiled.config = rule;

        try
        {
            compiled.matcher = std::regex(rule.pattern, std::regex::ECMAScript);
        }
        catch (const std::regex_error& ex)
        {
            throw core::PatternError(rule.pattern, ex.what());
        }

        TextNormalizer normalizer(rule.normalizer);

        switch (rule.kind)
        {
            case RuleKind::EXCEPTION_WITH_MESSAGE:
                compiled.function = [normalizer](const std::smatch& m) -> std::optional<core::Signature> {
                    const std::string message = normalizer.apply(Utils::trim(m.str(2)));
                    return joinClassAndMessage(shortClassName(m.str(1)), message);
                };
                break;

            case RuleKind::EXCEPTION_CLASS_ONLY:
                compiled.function = [](const std::smatch& m) -> std::optional<core::Signature> {
                    return shortClassName(m.str(1));
                };
                break;

            case RuleKind::LEVELED_LINE:
                compiled.function = [normalizer, levels = rule.levels](const std::smatch& m)
                    -> std::optional<core::Signature> {
                    const std::string level(Utils::trim(m.str(1)));
                    if (std::find(levels.begin(), levels.end(), level) == levels.end())
                        return std::nullopt;

                    const std::string message = normalizer.apply(Utils::trim(m.str(2)));
                    if (message.empty())
                        return "[" + level + "]";
                    return "[" + level + "] " + message;
                };
                break;

            case RuleKind::CUSTOM:
                compiled.function = [normalizer, format = rule.format](const std::smatch& m)
                    -> std::optional<core::Signature> {
                    const std::string raw = format.empty() ? m.str(0) : m.format(format);
                    std::string signature = normalizer.apply(Utils::trim(raw));
                    if (signature.empty())
                        return std::nullopt;
                    return signature;
                };
                break;
        }

        return compiled;
    }

    bool SignatureExtractor::isSkipped(std::string_view line) const
    {
        return std::any_of(m_skipPrefixes.begin(), m_skipPrefixes.end(),
                           [line](const std::string& prefix) { return Utils::startsWith(line, prefix); });
    }

    SignatureExtractor::Extraction SignatureExtractor::explain(std::string_view message) const
    {
        Extraction result;

        const std::string_view trimmed = Utils::trim(message);
        if (trimmed.empty() || isSkipped(trimmed))
            return result;

        // Signatures are persisted as JSON keys, so they must be valid UTF-8.
        const std::string clean = Utils::sanitizeUtf8(trimmed);
        const std::string line  = m_matchMaxChars > 0
                                      ? Utils::truncateUtf8(clean, m_matchMaxChars)
                                      : clean;

        for (const auto& rule : m_rules)
        {
            std::optional<core::Signature> signature;
            try
            {
                std::smatch match;
                if (!std::regex_search(line, match, rule.matcher))
                    continue;
                signature = rule.function(match);
            }
            catch (const std::regex_error& ex)
            {
                Utils::getLogger().warn("Rule '" + rule.config.name + "' failed on a line: " + ex.what());
                continue;
            }

            if (signature)
            {
                result.signature = std::move(signature);
                result.rule      = rule.config.name;
                return result;
            }
        }

        result.rule = "fallback";
        try
        {
            result.signature = m_fallback.apply(line);
        }
        catch (const std::regex_error& ex)
        {
            Utils::getLogger().warn(std::string("Fallback normalization failed: ") + ex.what());
            result.signature = m_fallback.config().inputMaxChars > 0
                                   ? Utils::truncateUtf8(line, m_fallback.config().inputMaxChars)
                                   : line;
        }
        return result;
    }

    std::optional<core::Signature> SignatureExtractor::extract(std::string_view message) const
    {
        return explain(message).signature;
    }

    void SignatureExtractor::addRule(const RuleConfig& rule)
    {
        m_rules.push_back(compileRule(rule));
    }

    void SignatureExtractor::insertRule(std::size_t position, const RuleConfig& rule)
    {
        CompiledRule compiled = compileRule(rule);
        position = std::min(position, m_rules.size());
        m_rules.insert(m_rules.begin() + static_cast<std::ptrdiff_t>(position), std::move(compiled));
    }

    std::vector<std::string> SignatureExtractor::ruleNames() const
    {
        std::vector<std::string> names;
        names.reserve(m_rules.size());
        for (const auto& rule : m_rules)
            names.push_back(rule.config.name);
        return names;
    }

} // namespace ErrorWatch::Signature
