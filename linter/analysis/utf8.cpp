#include "utf8.hpp"

namespace tagcheck::analysis
{
    namespace
    {
        constexpr bool inRange(std::uint32_t codePoint, std::uint32_t first, std::uint32_t last)
        {
            return codePoint >= first && codePoint <= last;
        }

        // Latin Extended-A blocks where the even code point is the capital.
        constexpr bool isEvenCapitalPair(std::uint32_t codePoint)
        {
            return inRange(codePoint, 0x0100, 0x012F) || inRange(codePoint, 0x0132, 0x0137)
                   || inRange(codePoint, 0x014A, 0x0177);
        }

        // Latin Extended-A blocks where the odd code point is the capital.
        constexpr bool isOddCapitalPair(std::uint32_t codePoint)
        {
            return inRange(codePoint, 0x0139, 0x0148) || inRange(codePoint, 0x0179, 0x017E);
        }
    } // namespace

    DecodedRune decodeRune(std::string_view text, std::size_t offset)
    {
        const auto lead = static_cast<unsigned char>(text[offset]);
        if (lead < 0x80)
        {
            return {lead, 1};
        }

        std::size_t length = 0;
        std::uint32_t value = 0;
        std::uint32_t minimum = 0;
        if (inRange(lead, 0xC2, 0xDF))
        {
            length = 2;
            value = lead & 0x1Fu;
            minimum = 0x80;
        }
        else if (inRange(lead, 0xE0, 0xEF))
        {
            length = 3;
            value = lead & 0x0Fu;
            minimum = 0x800;
        }
        else if (inRange(lead, 0xF0, 0xF4))
        {
            length = 4;
            value = lead & 0x07u;
            minimum = 0x10000;
        }
        else
        {
            return {};
        }

        if (offset + length > text.size())
        {
            return {};
        }

        for (std::size_t index = 1; index < length; ++index)
        {
            const auto byte = static_cast<unsigned char>(text[offset + index]);
            if ((byte & 0xC0u) != 0x80u)
            {
                return {};
            }
            value = (value << 6) | (byte & 0x3Fu);
        }

        if (value < minimum || value > 0x10FFFF || inRange(value, 0xD800, 0xDFFF))
        {
            return {};
        }
        return {value, length};
    }

    bool appendUtf8(std::string& out, std::uint32_t codePoint)
    {
        if (codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
        {
            return false;
        }

        if (codePoint < 0x80)
        {
            out.push_back(static_cast<char>(codePoint));
        }
        else if (codePoint < 0x800)
        {
            out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        }
        else if (codePoint < 0x10000)
        {
            out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        }
        return true;
    }

    std::uint32_t toUpperRune(std::uint32_t codePoint)
    {
        if (inRange(codePoint, 'a', 'z'))
        {
            return codePoint - 0x20;
        }
        if (codePoint < 0x80)
        {
            return codePoint;
        }

        if (inRange(codePoint, 0x00E0, 0x00FE) && codePoint != 0x00F7)
        {
            return codePoint - 0x20;
        }
        if (isEvenCapitalPair(codePoint) && (codePoint & 1u) != 0)
        {
            return codePoint - 1;
        }
        if (isOddCapitalPair(codePoint) && (codePoint & 1u) == 0)
        {
            return codePoint - 1;
        }
        if (inRange(codePoint, 0x03B1, 0x03C9))
        {
            // Final sigma shares the capital of the medial form.
            return codePoint == 0x03C2 ? 0x03A3 : codePoint - 0x20;
        }
        if (inRange(codePoint, 0x0430, 0x044F))
        {
            return codePoint - 0x20;
        }
        if (inRange(codePoint, 0x0450, 0x045F))
        {
            return codePoint - 0x50;
        }

        switch (codePoint)
        {
        case 0x00B5: return 0x039C;
        case 0x00FF: return 0x0178;
        case 0x0131: return 'I';
        case 0x017F: return 'S';
        default: return codePoint;
        }
    }

    std::uint32_t toLowerRune(std::uint32_t codePoint)
    {
        if (inRange(codePoint, 'A', 'Z'))
        {
            return codePoint + 0x20;
        }
        if (codePoint < 0x80)
        {
            return codePoint;
        }

        if (inRange(codePoint, 0x00C0, 0x00DE) && codePoint != 0x00D7)
        {
            return codePoint + 0x20;
        }
        if (isEvenCapitalPair(codePoint) && (codePoint & 1u) == 0)
        {
            return codePoint + 1;
        }
        if (isOddCapitalPair(codePoint) && (codePoint & 1u) != 0)
        {
            return codePoint + 1;
        }
        if (inRange(codePoint, 0x0391, 0x03A9) && codePoint != 0x03A2)
        {
            return codePoint + 0x20;
        }
        if (inRange(codePoint, 0x0400, 0x040F))
        {
            return codePoint + 0x50;
        }
        if (inRange(codePoint, 0x0410, 0x042F))
        {
            return codePoint + 0x20;
        }

        switch (codePoint)
        {
        case 0x0130: return 'i';
        case 0x0178: return 0x00FF;
        default: return codePoint;
        }
    }

    bool isUpperRune(std::uint32_t codePoint)
    {
        return toLowerRune(codePoint) != codePoint;
    }

    bool isLowerRune(std::uint32_t codePoint)
    {
        // ß has no single code point capital.
        return toUpperRune(codePoint) != codePoint || codePoint == 0x00DF;
    }

    bool isDigitRune(std::uint32_t codePoint)
    {
        return inRange(codePoint, '0', '9');
    }
} // namespace tagcheck::analysis
