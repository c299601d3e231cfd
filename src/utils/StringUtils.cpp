// File: src/utils/StringUtils.cpp

#include "utils/StringUtils.hpp"

#include <iomanip>
#include <sstream>

namespace {
    // Length of the UTF-8 sequence introduced by lead byte c (1 for invalid leads).
    std::size_t sequenceLength(unsigned char c) noexcept {
        if (c < 0x80) return 1;
        if ((c >> 5) == 0x06) return 2;
        if ((c >> 4) == 0x0E) return 3;
        if ((c >> 3) == 0x1E) return 4;
        return 1;
    }

    bool isContinuation(unsigned char c) noexcept {
        return (c & 0xC0) == 0x80;
    }

    // Byte length of the code point starting at pos, clamped to the input and
    // to well-formed continuation bytes.
    std::size_t codePointBytes(std::string_view s, std::size_t pos) noexcept {
        const std::size_t want = sequenceLength(static_cast<unsigned char>(s[pos]));
        std::size_t len = 1;
        while (len < want && pos + len < s.size() &&
               isContinuation(static_cast<unsigned char>(s[pos + len])))
            ++len;
        return len;
    }

    bool inRange(unsigned char c, unsigned char lo, unsigned char hi) noexcept {
        return c >= lo && c <= hi;
    }

    // Length of the well-formed sequence starting at pos, or 0 when it is not one.
    std::size_t validSequenceBytes(std::string_view s, std::size_t pos) noexcept {
        const auto at = [&](std::size_t i) { return static_cast<unsigned char>(s[pos + i]); };
        const std::size_t left = s.size() - pos;
        const unsigned char c = at(0);

        if (c < 0x80) return 1;
        if (inRange(c, 0xC2, 0xDF))
            return (left >= 2 && isContinuation(at(1))) ? 2 : 0;

        if (inRange(c, 0xE0, 0xEF))
        {
            if (left < 3) return 0;
            const unsigned char lo = (c == 0xE0) ? 0xA0 : 0x80;
            const unsigned char hi = (c == 0xED) ? 0x9F : 0xBF;
            return (inRange(at(1), lo, hi) && isContinuation(at(2))) ? 3 : 0;
        }

        if (inRange(c, 0xF0, 0xF4))
        {
            if (left < 4) return 0;
            const unsigned char lo = (c == 0xF0) ? 0x90 : 0x80;
            const unsigned char hi = (c == 0xF4) ? 0x8F : 0xBF;
            return (inRange(at(1), lo, hi) && isContinuation(at(2)) && isContinuation(at(3))) ? 4 : 0;
        }

        return 0;
    }
}

namespace ErrorWatch::Utils {

std::string escapeJson(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char uc : s)
    {
        const char c = static_cast<char>(uc);
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (uc < 0x20)
                {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase
                        << std::setfill('0') << std::setw(4) << static_cast<unsigned int>(uc);
                    out += oss.str();
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::size_t utf8Length(std::string_view s) noexcept
{
    std::size_t count = 0;
    for (std::size_t pos = 0; pos < s.size(); pos += codePointBytes(s, pos))
        ++count;
    return count;
}

std::string truncateUtf8(std::string_view s, std::size_t maxChars)
{
    if (maxChars == 0) return std::string(s);

    std::size_t pos = 0;
    std::size_t count = 0;
    while (pos < s.size() && count < maxChars)
    {
        pos += codePointBytes(s, pos);
        ++count;
    }
    return std::string(s.substr(0, pos));
}

std::string sanitizeUtf8(std::string_view s)
{
    static constexpr std::string_view replacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(s.size());
    std::size_t pos = 0;
    while (pos < s.size())
    {
        const std::size_t len = validSequenceBytes(s, pos);
        if (len == 0)
        {
            out += replacement;
            ++pos;
            continue;
        }
        out.append(s.data() + pos, len);
        pos += len;
    }
    return out;
}

std::string regexEscape(std::string_view text)
{
    static constexpr std::string_view special = R"(\^$.|?*+()[]{})";

    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text)
    {
        if (special.find(c) != std::string_view::npos)
            out += '\\';
        out += c;
    }
    return out;
}

std::string lastPathSegment(std::string_view name)
{
    while (!name.empty() && name.back() == '/')
        name.remove_suffix(1);

    const auto pos = name.rfind('/');
    if (pos == std::string_view::npos)
        return std::string(name);
    return std::string(name.substr(pos + 1));
}

} // namespace ErrorWatch::Utils
