#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <iterator>

namespace ErrorWatch
{
    namespace Utils
    {
        /**
         * String utility helpers for parsing and normalizing log text.
         *
         * All functions are stateless and thread-safe. The inline helpers work
         * on std::string_view to avoid copies; the UTF-8 aware helpers are
         * implemented in StringUtils.cpp.
         */

        /// Trim whitespace (space, tab, CR, LF) from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.begin(),
                sv.end(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(static_cast<std::size_t>(it - sv.begin()));
        }

        /// Trim whitespace (space, tab, CR, LF) from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.rbegin(),
                sv.rend(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(0, static_cast<std::size_t>(sv.rend() - it));
        }

        /// Trim whitespace from both ends of the string view.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        /// Convert a string to uppercase (returns a new std::string).
        inline std::string toUpper(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); }
            );
            return result;
        }

        /// Check if a string_view starts with a given prefix (case-sensitive).
        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.size() >= prefix.size()
                   && sv.compare(0, prefix.size(), prefix) == 0;
        }

        /// Case-insensitive equality comparison without allocations.
        inline bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                unsigned char ca = static_cast<unsigned char>(a[i]);
                unsigned char cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb))
                {
                    return false;
                }
            }
            return true;
        }

        /**
         * Split a string_view by a single-character delimiter,
         * trimming whitespace around each token. Empty tokens are dropped.
         */
        inline std::vector<std::string> splitAndTrim(std::string_view sv, char delimiter)
        {
            std::vector<std::string> result;
            std::size_t start = 0;

            while (start <= sv.size())
            {
                const std::size_t pos = sv.find(delimiter, start);
                const bool found = (pos != std::string_view::npos);
                const std::size_t end = found ? pos : sv.size();

                const std::string_view token = trim(sv.substr(start, end - start));
                if (!token.empty())
                {
                    result.emplace_back(token);
                }

                if (!found)
                {
                    break;
                }
                start = end + 1;
            }

            return result;
        }

        /// Escape a string for embedding inside a JSON string literal (RFC 8259).
        std::string escapeJson(std::string_view s);

        /// Number of UTF-8 code points in the string (invalid bytes count as one each).
        std::size_t utf8Length(std::string_view s) noexcept;

        /**
         * Keep at most maxChars UTF-8 code points of the input.
         *
         * Never splits a multi-byte sequence. maxChars == 0 means "no limit".
         */
        std::string truncateUtf8(std::string_view s, std::size_t maxChars);

        /**
         * Replace every byte that is not part of a well-formed UTF-8 sequence
         * (RFC 3629: no overlongs, no surrogates, nothing above U+10FFFF)
         * with U+FFFD. Valid input is returned unchanged.
         */
        std::string sanitizeUtf8(std::string_view s);

        /// Escape ECMAScript regex metacharacters so the text matches literally.
        std::string regexEscape(std::string_view text);

        /**
         * Last non-empty '/'-separated segment of a path-like name.
         *   "/ecs/my-app/production/web/" -> "web"
         */
        std::string lastPathSegment(std::string_view name);

    } // namespace Utils
} // namespace ErrorWatch
