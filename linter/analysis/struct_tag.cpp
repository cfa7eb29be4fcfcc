#include "struct_tag.hpp"

#include "utf8.hpp"

#include <cstdint>
#include <utility>

namespace tagcheck::analysis
{
    namespace
    {
        struct RawEntry
        {
            std::string_view key;
            std::string_view quotedValue;
        };

        enum class ScanStatus
        {
            Entry,
            End,
            SyntaxError
        };

        // Reads the next `key:"value"` pair from rest using the conventional struct tag grammar.
        ScanStatus scanEntry(std::string_view& rest, RawEntry& entry)
        {
            std::size_t index = 0;
            while (index < rest.size() && rest[index] == ' ')
            {
                ++index;
            }
            rest.remove_prefix(index);
            if (rest.empty())
            {
                return ScanStatus::End;
            }

            // A space, a quote or a control character ends the key.
            index = 0;
            while (index < rest.size()
                   && static_cast<unsigned char>(rest[index]) > ' '
                   && rest[index] != ':'
                   && rest[index] != '"'
                   && rest[index] != 0x7f)
            {
                ++index;
            }
            if (index == 0 || index + 1 >= rest.size() || rest[index] != ':' || rest[index + 1] != '"')
            {
                return ScanStatus::SyntaxError;
            }
            entry.key = rest.substr(0, index);
            rest.remove_prefix(index + 1);

            index = 1;
            while (index < rest.size() && rest[index] != '"')
            {
                if (rest[index] == '\\')
                {
                    ++index;
                }
                ++index;
            }
            if (index >= rest.size())
            {
                return ScanStatus::SyntaxError;
            }
            entry.quotedValue = rest.substr(0, index + 1);
            rest.remove_prefix(index + 1);
            return ScanStatus::Entry;
        }

        int hexValue(char ch)
        {
            if (ch >= '0' && ch <= '9') return ch - '0';
            if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
            if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
            return -1;
        }

        std::string_view trimBackticks(std::string_view text)
        {
            while (!text.empty() && text.front() == '`')
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && text.back() == '`')
            {
                text.remove_suffix(1);
            }
            return text;
        }
    } // namespace

    std::optional<std::string> unquote(std::string_view quoted)
    {
        if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"')
        {
            return std::nullopt;
        }

        const std::string_view body = quoted.substr(1, quoted.size() - 2);
        std::string result;
        result.reserve(body.size());

        for (std::size_t index = 0; index < body.size(); ++index)
        {
            const char ch = body[index];
            if (ch == '"' || ch == '\n')
            {
                return std::nullopt;
            }

            if (ch != '\\')
            {
                result.push_back(ch);
                continue;
            }

            if (++index >= body.size())
            {
                return std::nullopt;
            }

            const char escape = body[index];
            switch (escape)
            {
            case 'a': result.push_back('\a'); break;
            case 'b': result.push_back('\b'); break;
            case 'f': result.push_back('\f'); break;
            case 'n': result.push_back('\n'); break;
            case 'r': result.push_back('\r'); break;
            case 't': result.push_back('\t'); break;
            case 'v': result.push_back('\v'); break;
            case '\\': result.push_back('\\'); break;
            case '"': result.push_back('"'); break;
            case 'x':
            case 'u':
            case 'U':
            {
                const std::size_t digits = escape == 'x' ? 2 : (escape == 'u' ? 4 : 8);
                if (index + digits >= body.size())
                {
                    return std::nullopt;
                }

                std::uint32_t value = 0;
                for (std::size_t offset = 1; offset <= digits; ++offset)
                {
                    const int digit = hexValue(body[index + offset]);
                    if (digit < 0)
                    {
                        return std::nullopt;
                    }
                    value = (value << 4) | static_cast<std::uint32_t>(digit);
                }
                index += digits;

                if (escape == 'x')
                {
                    result.push_back(static_cast<char>(value));
                }
                else if (!appendUtf8(result, value))
                {
                    return std::nullopt;
                }
                break;
            }
            default:
            {
                // Three octal digits.
                if (escape < '0' || escape > '7' || index + 2 >= body.size())
                {
                    return std::nullopt;
                }

                std::uint32_t value = 0;
                for (std::size_t offset = 0; offset < 3; ++offset)
                {
                    const char digit = body[index + offset];
                    if (digit < '0' || digit > '7')
                    {
                        return std::nullopt;
                    }
                    value = (value << 3) | static_cast<std::uint32_t>(digit - '0');
                }
                if (value > 0xFF)
                {
                    return std::nullopt;
                }
                index += 2;
                result.push_back(static_cast<char>(value));
                break;
            }
            }
        }

        return result;
    }

    std::optional<std::string> tagText(std::string_view literal)
    {
        if (!literal.empty() && literal.front() == '"')
        {
            return unquote(literal);
        }
        return std::string{trimBackticks(literal)};
    }

    StructTag parseStructTag(std::string_view literal)
    {
        StructTag tag;

        const auto text = tagText(literal);
        if (!text.has_value())
        {
            tag.error = "invalid escape in tag literal";
            return tag;
        }

        std::string_view rest = *text;
        RawEntry entry;
        for (;;)
        {
            const ScanStatus status = scanEntry(rest, entry);
            if (status == ScanStatus::End)
            {
                break;
            }

            if (status == ScanStatus::SyntaxError)
            {
                tag.error = "bad syntax for struct tag pair";
                break;
            }

            auto value = unquote(entry.quotedValue);
            if (!value.has_value())
            {
                tag.error = "bad syntax for struct tag value of key '" + std::string{entry.key} + "'";
                break;
            }
            tag.entries.push_back(TagEntry{std::string{entry.key}, std::move(*value)});
        }

        return tag;
    }

    std::optional<std::string> lookupTagValue(std::string_view literal, std::string_view key)
    {
        const auto text = tagText(literal);
        if (!text.has_value())
        {
            return std::nullopt;
        }

        std::string_view rest = *text;
        RawEntry entry;
        while (scanEntry(rest, entry) == ScanStatus::Entry)
        {
            if (entry.key != key)
            {
                continue;
            }

            auto value = unquote(entry.quotedValue);
            if (!value.has_value())
            {
                return std::nullopt;
            }

            const std::size_t comma = value->find(',');
            if (comma != std::string::npos)
            {
                value->erase(comma);
            }
            return value;
        }

        return std::nullopt;
    }
} // namespace tagcheck::analysis
