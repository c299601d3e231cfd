#ifndef ERRORWATCH_CORE_PATTERN_ERROR_HPP
#define ERRORWATCH_CORE_PATTERN_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace ErrorWatch
{
namespace core
{

/**
 * @brief Raised when a configured regular expression does not compile.
 *
 * Thrown from constructors (classifier, extractor rules, record filter)
 * so a bad configuration is rejected before any record is processed.
 */
class PatternError : public std::invalid_argument
{
public:
    PatternError(std::string pattern, const std::string& reason)
        : std::invalid_argument("invalid pattern '" + pattern + "': " + reason),
          m_pattern(std::move(pattern))
    {
    }

    const std::string& pattern() const noexcept { return m_pattern; }

private:
    std::string m_pattern;
};

} // namespace core
} // namespace ErrorWatch

#endif // ERRORWATCH_CORE_PATTERN_ERROR_HPP
