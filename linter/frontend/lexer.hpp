#pragma once

#include "token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tagcheck::frontend
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        SourceSpan span;
    };

    class Lexer
    {
    public:
        explicit Lexer(std::string_view source);

        [[nodiscard]] const std::vector<Token>& tokens() const noexcept;
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

        void lex();

    private:
        void pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text);
        void insertSemicolon(SourceLocation location);
        void lexIdentifierOrKeyword();
        void lexNumber();
        void lexQuoted(char delimiter, TokenKind kind, std::string_view code, std::string_view message);
        void lexRawString();
        void lexSlashOrComment();
        void lexOperator();
        void emitError(std::string_view code, std::string_view message, SourceLocation start);
        char peek() const;
        char peekNext() const;
        char advance();
        bool isAtEnd() const;
        void advanceLine();

    private:
        std::string_view m_source;
        std::vector<Token> m_tokens;
        std::vector<Diagnostic> m_diagnostics;
        std::size_t m_current{0};
        SourceLocation m_location{};
        bool m_semicolonPending{false};
    };
} // namespace tagcheck::frontend
