#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tagcheck::analysis
{
    inline constexpr std::uint32_t kReplacementCharacter = 0xFFFD;

    struct DecodedRune
    {
        std::uint32_t value{kReplacementCharacter};
        std::size_t length{1};
    };

    /// Decodes the code point starting at `offset`. A malformed sequence yields
    /// U+FFFD with a length of one byte so callers can copy the raw byte through.
    [[nodiscard]] DecodedRune decodeRune(std::string_view text, std::size_t offset);

    /// Returns false for surrogates and values beyond U+10FFFF.
    bool appendUtf8(std::string& out, std::uint32_t codePoint);

    // Simple one-to-one case mapping for ASCII, Latin-1, Latin Extended-A,
    // basic Greek and Cyrillic. Other code points map to themselves.
    [[nodiscard]] std::uint32_t toUpperRune(std::uint32_t codePoint);
    [[nodiscard]] std::uint32_t toLowerRune(std::uint32_t codePoint);
    [[nodiscard]] bool isUpperRune(std::uint32_t codePoint);
    [[nodiscard]] bool isLowerRune(std::uint32_t codePoint);
    [[nodiscard]] bool isDigitRune(std::uint32_t codePoint);
} // namespace tagcheck::analysis
