#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tagcheck::frontend
{
    enum class TokenKind : std::uint16_t
    {
        EndOfFile,
        Identifier,
        NumberLiteral,
        RuneLiteral,
        StringLiteral,
        RawStringLiteral,

        // Keywords
        KeywordBreak,
        KeywordCase,
        KeywordChan,
        KeywordConst,
        KeywordContinue,
        KeywordDefault,
        KeywordDefer,
        KeywordElse,
        KeywordFallthrough,
        KeywordFor,
        KeywordFunc,
        KeywordGo,
        KeywordGoto,
        KeywordIf,
        KeywordImport,
        KeywordInterface,
        KeywordMap,
        KeywordPackage,
        KeywordRange,
        KeywordReturn,
        KeywordSelect,
        KeywordStruct,
        KeywordSwitch,
        KeywordType,
        KeywordVar,

        // Punctuation
        LeftBrace,
        RightBrace,
        LeftParen,
        RightParen,
        LeftBracket,
        RightBracket,
        Comma,
        Colon,
        Semicolon,
        Dot,
        Ellipsis,
        Equals,
        Asterisk,
        Arrow,
        PlusPlus,
        MinusMinus,

        // Any other operator, kept verbatim in the token text.
        Operator
    };

    struct SourceLocation
    {
        std::uint32_t line{1};
        std::uint32_t column{1};
    };

    struct SourceSpan
    {
        SourceLocation begin{};
        SourceLocation end{};
    };

    struct Token
    {
        TokenKind kind{TokenKind::EndOfFile};
        SourceSpan span{};
        std::string text{};
    };

    [[nodiscard]] std::string_view toString(TokenKind kind);
    [[nodiscard]] bool isKeyword(TokenKind kind) noexcept;
} // namespace tagcheck::frontend
