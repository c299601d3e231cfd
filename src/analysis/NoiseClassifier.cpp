#include "analysis/NoiseClassifier.hpp"

#include <algorithm>
#include <utility>

#include "core/PatternError.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace ErrorWatch
{
    namespace Analysis
    {
        const std::vector<std::string>& NoiseClassifier::builtinPatterns()
        {
            static const std::vector<std::string> patterns = {
                // network / transport
                "SocketTimeoutException",
                "ConnectTimeoutException",
                "HttpHostConnectException",
                "ConnectionRefused",
                "UnknownHostException",
                "NoRouteToHostException",
                "SSLHandshakeException",
                "SocketException",
                // client went away
                "ClientAbortException",
                "Broken pipe",
                "Connection reset by peer",
                "EOFException",
                // throttling
                "TooManyRequestsException",
                "ThrottlingException",
                "RateLimitException",
            };
            return patterns;
        }

        NoiseClassifier::NoiseClassifier(const std::vector<NoisePattern>& customPatterns)
        {
            m_patterns.reserve(builtinPatterns().size() + customPatterns.size());

            for (const auto& p : builtinPatterns())
                addPattern(p, false);

            for (const auto& p : customPatterns)
                addPattern(p.text, p.literal);

            Utils::getLogger().debug("NoiseClassifier initialized with " +
                                     std::to_string(m_patterns.size()) + " patterns (" +
                                     std::to_string(customPatterns.size()) + " custom)");
        }

        void NoiseClassifier::addPattern(const std::string& text, bool literal)
        {
            const std::string expression = literal ? Utils::regexEscape(text) : text;
            try
            {
                m_patterns.push_back({text, std::regex(expression, std::regex::ECMAScript | std::regex::icase)});
            }
            catch (const std::regex_error& ex)
            {
                throw core::PatternError(text, ex.what());
            }
        }

        std::optional<std::string> NoiseClassifier::matchingPattern(const core::Signature& signature) const
        {
            for (const auto& p : m_patterns)
            {
                try
                {
                    if (std::regex_search(signature, p.regex))
                        return p.source;
                }
                catch (const std::regex_error& ex)
                {
                    Utils::getLogger().warn("Noise pattern '" + p.source + "' failed on '" +
                                            signature + "': " + ex.what());
                }
            }
            return std::nullopt;
        }

        bool NoiseClassifier::isNoise(const core::Signature& signature) const
        {
            return matchingPattern(signature).has_value();
        }

        NoiseClassifier::Result NoiseClassifier::classify(const core::AggregateMap& groups) const
        {
            Result result;

            for (const auto& [signature, aggregate] : groups)
            {
                core::ClassifiedGroup g;
                g.aggregate = aggregate;
                g.isNoise   = isNoise(signature);

                if (g.isNoise)
                    result.noise.push_back(std::move(g));
                else
                    result.attention.push_back(std::move(g));
            }

            std::sort(result.attention.begin(), result.attention.end(), core::reportOrder);
            std::sort(result.noise.begin(), result.noise.end(), core::reportOrder);

            Utils::getLogger().debug("Classified " + std::to_string(groups.size()) + " signatures: " +
                                     std::to_string(result.attention.size()) + " attention, " +
                                     std::to_string(result.noise.size()) + " noise");
            return result;
        }

    } // namespace Analysis
} // namespace ErrorWatch
