#include "lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace
{
    using namespace tagcheck::frontend;

    constexpr std::array<std::string_view, 4> kThreeCharOperators{"<<=", ">>=", "&^=", "..."};
    constexpr std::array<std::string_view, 21> kTwoCharOperators{
        "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=",
        "<<", ">>", "&^", "&&", "||", "<-", "++", "--",
        "==", "!=", "<=", ">=", ":="};
    constexpr std::string_view kSingleCharOperators{"+-*/%&|^<>=!()[]{},;.:~"};

    bool isIdentifierStart(char ch)
    {
        const auto byte = static_cast<unsigned char>(ch);
        return std::isalpha(byte) || ch == '_' || byte >= 0x80;
    }

    bool isIdentifierPart(char ch)
    {
        return isIdentifierStart(ch) || std::isdigit(static_cast<unsigned char>(ch));
    }

    TokenKind keywordLookup(std::string_view text)
    {
        if (text == "break") return TokenKind::KeywordBreak;
        if (text == "case") return TokenKind::KeywordCase;
        if (text == "chan") return TokenKind::KeywordChan;
        if (text == "const") return TokenKind::KeywordConst;
        if (text == "continue") return TokenKind::KeywordContinue;
        if (text == "default") return TokenKind::KeywordDefault;
        if (text == "defer") return TokenKind::KeywordDefer;
        if (text == "else") return TokenKind::KeywordElse;
        if (text == "fallthrough") return TokenKind::KeywordFallthrough;
        if (text == "for") return TokenKind::KeywordFor;
        if (text == "func") return TokenKind::KeywordFunc;
        if (text == "go") return TokenKind::KeywordGo;
        if (text == "goto") return TokenKind::KeywordGoto;
        if (text == "if") return TokenKind::KeywordIf;
        if (text == "import") return TokenKind::KeywordImport;
        if (text == "interface") return TokenKind::KeywordInterface;
        if (text == "map") return TokenKind::KeywordMap;
        if (text == "package") return TokenKind::KeywordPackage;
        if (text == "range") return TokenKind::KeywordRange;
        if (text == "return") return TokenKind::KeywordReturn;
        if (text == "select") return TokenKind::KeywordSelect;
        if (text == "struct") return TokenKind::KeywordStruct;
        if (text == "switch") return TokenKind::KeywordSwitch;
        if (text == "type") return TokenKind::KeywordType;
        if (text == "var") return TokenKind::KeywordVar;
        return TokenKind::Identifier;
    }

    TokenKind operatorKind(std::string_view text)
    {
        if (text == "{") return TokenKind::LeftBrace;
        if (text == "}") return TokenKind::RightBrace;
        if (text == "(") return TokenKind::LeftParen;
        if (text == ")") return TokenKind::RightParen;
        if (text == "[") return TokenKind::LeftBracket;
        if (text == "]") return TokenKind::RightBracket;
        if (text == ",") return TokenKind::Comma;
        if (text == ":") return TokenKind::Colon;
        if (text == ";") return TokenKind::Semicolon;
        if (text == ".") return TokenKind::Dot;
        if (text == "...") return TokenKind::Ellipsis;
        if (text == "=") return TokenKind::Equals;
        if (text == "*") return TokenKind::Asterisk;
        if (text == "<-") return TokenKind::Arrow;
        if (text == "++") return TokenKind::PlusPlus;
        if (text == "--") return TokenKind::MinusMinus;
        return TokenKind::Operator;
    }

    // Tokens after which a newline terminates the statement.
    bool endsStatement(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::Identifier:
        case TokenKind::NumberLiteral:
        case TokenKind::RuneLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::RawStringLiteral:
        case TokenKind::KeywordBreak:
        case TokenKind::KeywordContinue:
        case TokenKind::KeywordFallthrough:
        case TokenKind::KeywordReturn:
        case TokenKind::PlusPlus:
        case TokenKind::MinusMinus:
        case TokenKind::RightParen:
        case TokenKind::RightBracket:
        case TokenKind::RightBrace:
            return true;
        default:
            return false;
        }
    }
} // namespace

namespace tagcheck::frontend
{
    Lexer::Lexer(std::string_view source)
        : m_source(source)
        , m_location{1, 1}
    {
    }

    const std::vector<Token>& Lexer::tokens() const noexcept
    {
        return m_tokens;
    }

    const std::vector<Diagnostic>& Lexer::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    void Lexer::lex()
    {
        m_tokens.clear();
        m_diagnostics.clear();
        m_current = 0;
        m_location = {1, 1};
        m_semicolonPending = false;

        while (!isAtEnd())
        {
            const char ch = peek();
            if (ch == '\n')
            {
                if (m_semicolonPending)
                {
                    insertSemicolon(m_location);
                }
                advance();
                advanceLine();
                continue;
            }

            if (std::isspace(static_cast<unsigned char>(ch)))
            {
                advance();
                continue;
            }

            if (isIdentifierStart(ch))
            {
                lexIdentifierOrKeyword();
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(ch))
                || (ch == '.' && std::isdigit(static_cast<unsigned char>(peekNext()))))
            {
                lexNumber();
                continue;
            }

            switch (ch)
            {
            case '"':
                lexQuoted('"', TokenKind::StringLiteral, "TAGC-E2001", "Unterminated string literal.");
                break;
            case '\'':
                lexQuoted('\'', TokenKind::RuneLiteral, "TAGC-E2004", "Unterminated rune literal.");
                break;
            case '`':
                lexRawString();
                break;
            case '/':
                lexSlashOrComment();
                break;
            default:
                lexOperator();
                break;
            }
        }

        if (m_semicolonPending)
        {
            insertSemicolon(m_location);
        }

        SourceLocation eofLocation = m_location;
        pushToken(TokenKind::EndOfFile, eofLocation, eofLocation, "");
    }

    void Lexer::pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text)
    {
        Token token;
        token.kind = kind;
        token.span = {start, end};
        token.text = std::string{text};
        m_tokens.emplace_back(std::move(token));
        m_semicolonPending = endsStatement(kind);
    }

    void Lexer::insertSemicolon(SourceLocation location)
    {
        pushToken(TokenKind::Semicolon, location, location, "\n");
    }

    void Lexer::lexIdentifierOrKeyword()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume first character
        while (!isAtEnd() && isIdentifierPart(peek()))
        {
            advance();
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(keywordLookup(text), startLocation, m_location, text);
    }

    void Lexer::lexNumber()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        const bool hexadecimal = peek() == '0' && (peekNext() == 'x' || peekNext() == 'X');

        advance(); // consume first digit

        while (!isAtEnd())
        {
            const char ch = peek();
            if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '.')
            {
                advance();
                continue;
            }

            if (ch == '+' || ch == '-')
            {
                const char previous = m_source[m_current - 1];
                const bool exponent = hexadecimal ? (previous == 'p' || previous == 'P')
                                                  : (previous == 'e' || previous == 'E');
                if (exponent)
                {
                    advance();
                    continue;
                }
            }

            break;
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(TokenKind::NumberLiteral, startLocation, m_location, text);
    }

    void Lexer::lexQuoted(char delimiter, TokenKind kind, std::string_view code, std::string_view message)
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume opening quote
        bool closed = false;
        while (!isAtEnd())
        {
            const char ch = peek();
            if (ch == '\n')
            {
                break;
            }

            advance();
            if (ch == '\\' && !isAtEnd() && peek() != '\n')
            {
                advance(); // skip escaped char
                continue;
            }

            if (ch == delimiter)
            {
                closed = true;
                break;
            }
        }

        if (!closed)
        {
            emitError(code, message, startLocation);
            return;
        }

        pushToken(kind, startLocation, m_location, m_source.substr(startIndex, m_current - startIndex));
    }

    void Lexer::lexRawString()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume opening backtick
        while (!isAtEnd())
        {
            const char ch = advance();
            if (ch == '`')
            {
                pushToken(TokenKind::RawStringLiteral, startLocation, m_location,
                    m_source.substr(startIndex, m_current - startIndex));
                return;
            }
            if (ch == '\n')
            {
                advanceLine();
            }
        }

        emitError("TAGC-E2002", "Unterminated raw string literal.", startLocation);
    }

    void Lexer::lexSlashOrComment()
    {
        const SourceLocation startLocation = m_location;

        if (peekNext() == '/')
        {
            while (!isAtEnd() && peek() != '\n')
            {
                advance();
            }
            return;
        }

        if (peekNext() == '*')
        {
            advance();
            advance();
            bool sawNewline = false;
            while (!isAtEnd())
            {
                if (peek() == '\n')
                {
                    advance();
                    advanceLine();
                    sawNewline = true;
                    continue;
                }

                if (peek() == '*' && peekNext() == '/')
                {
                    advance();
                    advance();
                    // A comment spanning lines acts like a newline.
                    if (sawNewline && m_semicolonPending)
                    {
                        insertSemicolon(startLocation);
                    }
                    return;
                }

                advance();
            }

            emitError("TAGC-E2003", "Unterminated block comment.", startLocation);
            return;
        }

        lexOperator();
    }

    void Lexer::lexOperator()
    {
        const SourceLocation startLocation = m_location;
        const std::string_view rest = m_source.substr(m_current);

        std::string_view text;
        for (std::string_view candidate : kThreeCharOperators)
        {
            if (rest.compare(0, candidate.size(), candidate) == 0)
            {
                text = candidate;
                break;
            }
        }

        if (text.empty())
        {
            for (std::string_view candidate : kTwoCharOperators)
            {
                if (rest.compare(0, candidate.size(), candidate) == 0)
                {
                    text = candidate;
                    break;
                }
            }
        }

        if (text.empty() && kSingleCharOperators.find(rest.front()) != std::string_view::npos)
        {
            text = rest.substr(0, 1);
        }

        if (text.empty())
        {
            advance();
            emitError("TAGC-E2000", "Unexpected character in source.", startLocation);
            return;
        }

        for (std::size_t index = 0; index < text.size(); ++index)
        {
            advance();
        }
        pushToken(operatorKind(text), startLocation, m_location, text);
    }

    void Lexer::emitError(std::string_view code, std::string_view message, SourceLocation start)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = {start, m_location};
        m_diagnostics.emplace_back(std::move(diag));
    }

    char Lexer::peek() const
    {
        if (isAtEnd()) return '\0';
        return m_source[m_current];
    }

    char Lexer::peekNext() const
    {
        if (m_current + 1 >= m_source.size()) return '\0';
        return m_source[m_current + 1];
    }

    char Lexer::advance()
    {
        const char ch = m_source[m_current++];
        if (ch != '\n')
        {
            ++m_location.column;
        }
        return ch;
    }

    bool Lexer::isAtEnd() const
    {
        return m_current >= m_source.size();
    }

    void Lexer::advanceLine()
    {
        ++m_location.line;
        m_location.column = 1;
    }
} // namespace tagcheck::frontend
