#include "naming_case.hpp"

#include "utf8.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace tagcheck::analysis
{
    namespace
    {
        // Sorted for binary search.
        constexpr std::array<std::string_view, 38> kGoInitialisms{
            "ACL", "API", "ASCII", "CPU", "CSS", "DNS", "EOF", "GUID", "HTML", "HTTP", "HTTPS",
            "ID", "IP", "JSON", "LHS", "QPS", "RAM", "RHS", "RPC", "SLA", "SMTP", "SQL", "SSH",
            "TCP", "TLS", "TTL", "UDP", "UI", "UID", "URI", "URL", "UTF8", "UUID", "VM", "XML",
            "XMPP", "XSRF", "XSS"};

        enum class WordCase
        {
            Lower,
            Title,
            Camel
        };

        // Multi-byte sequences and non-ASCII runes stay inside words.
        bool isWordRune(std::uint32_t codePoint)
        {
            return codePoint >= 0x80 || std::isalnum(static_cast<unsigned char>(codePoint)) != 0;
        }

        // Copies the raw bytes of runes the mapping leaves alone, malformed ones included.
        void appendMapped(std::string& out, std::string_view bytes, DecodedRune rune, bool upper)
        {
            const std::uint32_t mapped = upper ? toUpperRune(rune.value) : toLowerRune(rune.value);
            if (mapped == rune.value || !appendUtf8(out, mapped))
            {
                out.append(bytes);
            }
        }

        std::string mapCharacters(std::string_view text, bool upper)
        {
            std::string result;
            result.reserve(text.size());
            for (std::size_t index = 0; index < text.size();)
            {
                const DecodedRune rune = decodeRune(text, index);
                appendMapped(result, text.substr(index, rune.length), rune, upper);
                index += rune.length;
            }
            return result;
        }

        std::string capitalize(std::string_view word)
        {
            if (word.empty())
            {
                return {};
            }

            const DecodedRune first = decodeRune(word, 0);
            std::string result;
            result.reserve(word.size());
            appendMapped(result, word.substr(0, first.length), first, true);
            result.append(word.substr(first.length));
            return result;
        }

        std::string convert(std::string_view text, char delimiter, WordCase wordCase, bool goInitialisms)
        {
            const std::vector<std::string> words = splitWords(text);

            std::string result;
            result.reserve(text.size() + words.size());

            for (std::size_t index = 0; index < words.size(); ++index)
            {
                if (index > 0 && delimiter != '\0')
                {
                    result.push_back(delimiter);
                }

                const bool leading = index == 0;
                std::string word = toLower(words[index]);

                if (goInitialisms && !(wordCase == WordCase::Camel && leading))
                {
                    std::string upper = toUpper(word);
                    if (isGoInitialism(upper))
                    {
                        result.append(upper);
                        continue;
                    }
                }

                if (wordCase == WordCase::Title || (wordCase == WordCase::Camel && !leading))
                {
                    word = capitalize(word);
                }
                result.append(word);
            }

            return result;
        }
    } // namespace

    std::optional<NamingCase> parseNamingCase(std::string_view identifier)
    {
        if (identifier == "camel") return NamingCase::Camel;
        if (identifier == "pascal") return NamingCase::Pascal;
        if (identifier == "kebab") return NamingCase::Kebab;
        if (identifier == "snake") return NamingCase::Snake;
        if (identifier == "goCamel") return NamingCase::GoCamel;
        if (identifier == "goPascal") return NamingCase::GoPascal;
        if (identifier == "goKebab") return NamingCase::GoKebab;
        if (identifier == "goSnake") return NamingCase::GoSnake;
        if (identifier == "upper") return NamingCase::Upper;
        if (identifier == "lower") return NamingCase::Lower;
        return std::nullopt;
    }

    std::string_view toString(NamingCase namingCase)
    {
        switch (namingCase)
        {
        case NamingCase::Camel: return "camel";
        case NamingCase::Pascal: return "pascal";
        case NamingCase::Kebab: return "kebab";
        case NamingCase::Snake: return "snake";
        case NamingCase::GoCamel: return "goCamel";
        case NamingCase::GoPascal: return "goPascal";
        case NamingCase::GoKebab: return "goKebab";
        case NamingCase::GoSnake: return "goSnake";
        case NamingCase::Upper: return "upper";
        case NamingCase::Lower: return "lower";
        }

        return "unknown";
    }

    CaseConverter converterFor(NamingCase namingCase)
    {
        switch (namingCase)
        {
        case NamingCase::Camel: return &toCamel;
        case NamingCase::Pascal: return &toPascal;
        case NamingCase::Kebab: return &toKebab;
        case NamingCase::Snake: return &toSnake;
        case NamingCase::GoCamel: return &toGoCamel;
        case NamingCase::GoPascal: return &toGoPascal;
        case NamingCase::GoKebab: return &toGoKebab;
        case NamingCase::GoSnake: return &toGoSnake;
        case NamingCase::Upper: return &toUpper;
        case NamingCase::Lower: return &toLower;
        }

        return &toLower;
    }

    std::optional<CaseConverter> findConverter(std::string_view identifier, std::string& errorMessage)
    {
        const auto namingCase = parseNamingCase(identifier);
        if (!namingCase.has_value())
        {
            errorMessage = "unsupported case: " + std::string{identifier};
            return std::nullopt;
        }
        return converterFor(*namingCase);
    }

    std::vector<std::string> splitWords(std::string_view text)
    {
        std::vector<std::string> words;
        std::string current;

        auto flush = [&words, &current]() {
            if (!current.empty())
            {
                words.emplace_back(std::move(current));
                current.clear();
            }
        };

        std::uint32_t previous = 0;
        for (std::size_t index = 0; index < text.size();)
        {
            const DecodedRune rune = decodeRune(text, index);
            const std::string_view bytes = text.substr(index, rune.length);
            index += rune.length;

            if (!isWordRune(rune.value))
            {
                flush();
                continue;
            }

            if (!current.empty() && isUpperRune(rune.value))
            {
                const std::uint32_t next = index < text.size() ? decodeRune(text, index).value : 0;
                if (isLowerRune(previous) || isDigitRune(previous) || (isUpperRune(previous) && isLowerRune(next)))
                {
                    flush();
                }
            }

            current.append(bytes);
            previous = rune.value;
        }

        flush();
        return words;
    }

    bool isGoInitialism(std::string_view word)
    {
        return std::binary_search(kGoInitialisms.begin(), kGoInitialisms.end(), word);
    }

    std::string toCamel(std::string_view text)
    {
        return convert(text, '\0', WordCase::Camel, false);
    }

    std::string toPascal(std::string_view text)
    {
        return convert(text, '\0', WordCase::Title, false);
    }

    std::string toKebab(std::string_view text)
    {
        return convert(text, '-', WordCase::Lower, false);
    }

    std::string toSnake(std::string_view text)
    {
        return convert(text, '_', WordCase::Lower, false);
    }

    std::string toGoCamel(std::string_view text)
    {
        return convert(text, '\0', WordCase::Camel, true);
    }

    std::string toGoPascal(std::string_view text)
    {
        return convert(text, '\0', WordCase::Title, true);
    }

    std::string toGoKebab(std::string_view text)
    {
        return convert(text, '-', WordCase::Lower, true);
    }

    std::string toGoSnake(std::string_view text)
    {
        return convert(text, '_', WordCase::Lower, true);
    }

    std::string toUpper(std::string_view text)
    {
        return mapCharacters(text, true);
    }

    std::string toLower(std::string_view text)
    {
        return mapCharacters(text, false);
    }
} // namespace tagcheck::analysis
