#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagcheck::analysis
{
    enum class NamingCase : std::uint8_t
    {
        Camel,
        Pascal,
        Kebab,
        Snake,
        GoCamel,
        GoPascal,
        GoKebab,
        GoSnake,
        Upper,
        Lower
    };

    using CaseConverter = std::string (*)(std::string_view);

    [[nodiscard]] std::optional<NamingCase> parseNamingCase(std::string_view identifier);
    [[nodiscard]] std::string_view toString(NamingCase namingCase);
    [[nodiscard]] CaseConverter converterFor(NamingCase namingCase);

    // Converter for a configured identifier such as "camel" or "goSnake".
    // Returns nullopt and fills errorMessage when the identifier is not recognized.
    [[nodiscard]] std::optional<CaseConverter> findConverter(std::string_view identifier, std::string& errorMessage);

    // Words of an identifier. Every ASCII character other than a letter or digit separates
    // words; so does a case change, e.g. "userID" and "HTTPServer" both split in two.
    // Input is UTF-8; Latin, Greek and Cyrillic capitals also start a new word.
    [[nodiscard]] std::vector<std::string> splitWords(std::string_view text);

    // Common initialisms Go names keep upper-case, e.g. "ID" or "URL". Expects upper-case input.
    [[nodiscard]] bool isGoInitialism(std::string_view word);

    [[nodiscard]] std::string toCamel(std::string_view text);
    [[nodiscard]] std::string toPascal(std::string_view text);
    [[nodiscard]] std::string toKebab(std::string_view text);
    [[nodiscard]] std::string toSnake(std::string_view text);
    [[nodiscard]] std::string toGoCamel(std::string_view text);
    [[nodiscard]] std::string toGoPascal(std::string_view text);
    [[nodiscard]] std::string toGoKebab(std::string_view text);
    [[nodiscard]] std::string toGoSnake(std::string_view text);
    [[nodiscard]] std::string toUpper(std::string_view text);
    [[nodiscard]] std::string toLower(std::string_view text);
} // namespace tagcheck::analysis
