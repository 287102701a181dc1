#pragma once

// =============================================================================
// Core scalar types and text helpers shared by the lexer and the runtime
// =============================================================================

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace rill
{

    /// Script integer type.
    using INT = int64_t;

    /// Script floating-point type.
    using FLOAT = double;

    /// Floats always print with a fractional part: 42.0, 0.5, 1e+20.
    inline std::string formatFloat(double v)
    {
        if (std::isnan(v))
            return "NaN";
        if (std::isinf(v))
            return v > 0 ? "inf" : "-inf";

        std::ostringstream os;
        os << std::setprecision(15) << v;
        std::string s = os.str();
        if (s.find_first_of(".e") == std::string::npos)
            s += ".0";
        return s;
    }

    /// Append the UTF-8 encoding of a code point.
    inline void appendUtf8(std::string &out, char32_t c)
    {
        if (c < 0x80)
        {
            out += static_cast<char>(c);
        }
        else if (c < 0x800)
        {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
        else if (c < 0x10000)
        {
            out += static_cast<char>(0xE0 | (c >> 12));
            out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (c >> 18));
            out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }

    inline std::string toUtf8(char32_t c)
    {
        std::string s;
        appendUtf8(s, c);
        return s;
    }

    /// Decode one code point starting at `i`, advancing `i` past it.
    /// Invalid bytes decode as U+FFFD.
    inline char32_t decodeUtf8(const std::string &s, size_t &i)
    {
        unsigned char b = static_cast<unsigned char>(s[i++]);
        if (b < 0x80)
            return b;

        int extra = 0;
        char32_t cp = 0;
        if ((b & 0xE0) == 0xC0)
        {
            extra = 1;
            cp = b & 0x1F;
        }
        else if ((b & 0xF0) == 0xE0)
        {
            extra = 2;
            cp = b & 0x0F;
        }
        else if ((b & 0xF8) == 0xF0)
        {
            extra = 3;
            cp = b & 0x07;
        }
        else
        {
            return 0xFFFD;
        }

        for (int k = 0; k < extra; k++)
        {
            if (i >= s.size() || (static_cast<unsigned char>(s[i]) & 0xC0) != 0x80)
                return 0xFFFD;
            cp = (cp << 6) | (static_cast<unsigned char>(s[i++]) & 0x3F);
        }
        return cp;
    }

    /// Number of code points in a UTF-8 string.
    inline size_t utf8Length(const std::string &s)
    {
        size_t n = 0;
        for (unsigned char c : s)
            if ((c & 0xC0) != 0x80)
                n++;
        return n;
    }

} // namespace rill
