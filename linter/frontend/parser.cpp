#include "parser.hpp"

#include <cstddef>
#include <utility>

namespace
{
    using namespace tagcheck::frontend;

    bool isOpening(TokenKind kind)
    {
        return kind == TokenKind::LeftParen || kind == TokenKind::LeftBracket || kind == TokenKind::LeftBrace;
    }

    bool isClosing(TokenKind kind)
    {
        return kind == TokenKind::RightParen || kind == TokenKind::RightBracket || kind == TokenKind::RightBrace;
    }

    bool isWord(const Token& token)
    {
        switch (token.kind)
        {
        case TokenKind::Identifier:
        case TokenKind::NumberLiteral:
        case TokenKind::RuneLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::RawStringLiteral:
            return true;
        default:
            return isKeyword(token.kind);
        }
    }
} // namespace

namespace tagcheck::frontend
{
    Parser::Parser(const std::vector<Token>& tokens)
        : m_tokens(tokens)
    {
    }

    CompilationUnit Parser::parse()
    {
        m_current = 0;
        m_diagnostics.clear();

        CompilationUnit unit{};
        unit.package = parsePackage();

        while (!isAtEnd())
        {
            if (check(TokenKind::KeywordImport))
            {
                parseImports(unit);
                continue;
            }

            // `x.(type)` in a type switch is not a declaration.
            if (check(TokenKind::KeywordType)
                && (lookAhead(1).kind == TokenKind::Identifier || lookAhead(1).kind == TokenKind::LeftParen))
            {
                parseTypeDeclarations(unit);
                continue;
            }

            if (check(TokenKind::KeywordStruct) && lookAhead(1).kind == TokenKind::LeftBrace)
            {
                TypeDeclaration declaration{};
                declaration.type = parseType();
                declaration.span = declaration.type.span;
                unit.types.emplace_back(std::move(declaration));
                continue;
            }

            advance();
        }

        return unit;
    }

    const std::vector<Diagnostic>& Parser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const Token& Parser::peek() const
    {
        return m_tokens[m_current];
    }

    const Token& Parser::previous() const
    {
        return m_tokens[m_current == 0 ? 0 : m_current - 1];
    }

    const Token& Parser::lookAhead(std::size_t offset) const
    {
        const std::size_t index = m_current + offset;
        if (index >= m_tokens.size())
        {
            return m_tokens.back();
        }
        return m_tokens[index];
    }

    const Token& Parser::advance()
    {
        if (!isAtEnd())
        {
            ++m_current;
        }

        return previous();
    }

    bool Parser::isAtEnd() const
    {
        return peek().kind == TokenKind::EndOfFile;
    }

    bool Parser::check(TokenKind kind) const
    {
        if (isAtEnd()) return false;
        return peek().kind == kind;
    }

    bool Parser::match(TokenKind kind)
    {
        if (check(kind))
        {
            advance();
            return true;
        }
        return false;
    }

    const Token& Parser::consume(TokenKind kind, std::string_view messageCode, std::string_view messageText)
    {
        if (check(kind))
        {
            return advance();
        }

        report(messageCode, messageText, peek().span);
        return peek();
    }

    void Parser::report(std::string_view code, std::string_view message, SourceSpan span)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = span;
        m_diagnostics.emplace_back(std::move(diag));
    }

    PackageClause Parser::parsePackage()
    {
        PackageClause clause{};

        if (!match(TokenKind::KeywordPackage))
        {
            report("TAGC-E2100", "Missing 'package' clause at file start.", peek().span);
            return clause;
        }

        const Token& keyword = previous();
        const Token& name = consume(TokenKind::Identifier, "TAGC-E2101", "Expected package name after 'package'.");
        if (name.kind == TokenKind::Identifier)
        {
            clause.name = name.text;
        }
        clause.span = {keyword.span.begin, previous().span.end};
        return clause;
    }

    void Parser::parseImports(CompilationUnit& unit)
    {
        advance(); // consume 'import'

        if (match(TokenKind::LeftParen))
        {
            while (!check(TokenKind::RightParen) && !isAtEnd())
            {
                if (match(TokenKind::Semicolon))
                {
                    continue;
                }

                const std::size_t before = m_current;
                parseImportSpec(unit);
                if (m_current == before)
                {
                    advance(); // stray closing token
                }
            }
            consume(TokenKind::RightParen, "TAGC-E2106", "Expected ')' to close import group.");
            return;
        }

        parseImportSpec(unit);
    }

    void Parser::parseImportSpec(CompilationUnit& unit)
    {
        ImportDeclaration declaration{};
        declaration.span.begin = peek().span.begin;

        if (check(TokenKind::Identifier) || check(TokenKind::Dot))
        {
            declaration.alias = advance().text;
        }

        if (!check(TokenKind::StringLiteral) && !check(TokenKind::RawStringLiteral))
        {
            report("TAGC-E2105", "Expected import path.", peek().span);
            skipToDeclarationEnd();
            return;
        }

        const Token& path = advance();
        declaration.path = path.text.substr(1, path.text.size() - 2);
        declaration.span.end = path.span.end;
        unit.imports.emplace_back(std::move(declaration));
    }

    void Parser::parseTypeDeclarations(CompilationUnit& unit)
    {
        advance(); // consume 'type'

        if (match(TokenKind::LeftParen))
        {
            while (!check(TokenKind::RightParen) && !isAtEnd())
            {
                if (match(TokenKind::Semicolon))
                {
                    continue;
                }

                const std::size_t before = m_current;
                parseTypeSpec(unit);
                if (m_current == before)
                {
                    advance(); // stray closing token
                }
            }
            consume(TokenKind::RightParen, "TAGC-E2104", "Expected ')' to close type group.");
            return;
        }

        parseTypeSpec(unit);
    }

    void Parser::parseTypeSpec(CompilationUnit& unit)
    {
        if (!check(TokenKind::Identifier))
        {
            report("TAGC-E2102", "Expected type name.", peek().span);
            skipToDeclarationEnd();
            return;
        }

        const Token& nameToken = advance();
        TypeDeclaration declaration{};
        declaration.name = nameToken.text;

        if (check(TokenKind::LeftBracket) && startsTypeParameterList())
        {
            skipBalanced(nullptr);
        }

        declaration.isAlias = match(TokenKind::Equals);
        declaration.type = parseType();
        declaration.span = {nameToken.span.begin, previous().span.end};

        const bool wellFormed = declaration.type.kind != TypeExpressionKind::Bad;
        unit.types.emplace_back(std::move(declaration));

        if (!check(TokenKind::Semicolon) && !check(TokenKind::RightParen) && !isAtEnd())
        {
            if (wellFormed)
            {
                report("TAGC-E2103", "Expected ';' after type declaration.", peek().span);
            }
            skipToDeclarationEnd();
        }
    }

    // `type List[T any]` versus the array type in `type Buffer [N]byte`.
    bool Parser::startsTypeParameterList() const
    {
        if (lookAhead(1).kind != TokenKind::Identifier)
        {
            return false;
        }

        const Token& next = lookAhead(2);
        switch (next.kind)
        {
        case TokenKind::Identifier:
        case TokenKind::Comma:
        case TokenKind::LeftBracket:
        case TokenKind::KeywordInterface:
        case TokenKind::KeywordMap:
        case TokenKind::KeywordChan:
        case TokenKind::KeywordFunc:
        case TokenKind::KeywordStruct:
            return true;
        case TokenKind::Operator:
            return next.text == "~";
        default:
            return false;
        }
    }

    TypeExpression Parser::parseType()
    {
        const std::size_t start = m_current;

        TypeExpression type{};
        parseTypeBody(type);

        if (m_current == start)
        {
            type.span = peek().span;
            return type;
        }

        type.span = {m_tokens[start].span.begin, previous().span.end};
        type.text = textBetween(start, m_current);
        return type;
    }

    void Parser::parseTypeBody(TypeExpression& type)
    {
        switch (peek().kind)
        {
        case TokenKind::Identifier:
            parseTypeName(type);
            break;
        case TokenKind::Asterisk:
            advance();
            type.kind = TypeExpressionKind::Pointer;
            type.elements.push_back(parseType());
            break;
        case TokenKind::LeftBracket:
            parseArrayOrSlice(type);
            break;
        case TokenKind::KeywordMap:
            parseMap(type);
            break;
        case TokenKind::KeywordChan:
        case TokenKind::Arrow:
            parseChannel(type);
            break;
        case TokenKind::KeywordFunc:
            parseFunction(type);
            break;
        case TokenKind::KeywordInterface:
            advance();
            type.kind = TypeExpressionKind::Interface;
            if (check(TokenKind::LeftBrace))
            {
                skipBalanced(&type.elements);
            }
            else
            {
                report("TAGC-E2113", "Expected '{' after 'interface'.", peek().span);
            }
            break;
        case TokenKind::KeywordStruct:
            parseStruct(type);
            break;
        case TokenKind::LeftParen:
            advance();
            type.kind = TypeExpressionKind::Parenthesized;
            type.elements.push_back(parseType());
            consume(TokenKind::RightParen, "TAGC-E2114", "Expected ')' after parenthesized type.");
            break;
        case TokenKind::Ellipsis:
            advance();
            type.kind = TypeExpressionKind::Ellipsis;
            type.elements.push_back(parseType());
            break;
        default:
            report("TAGC-E2110", "Expected type.", peek().span);
            break;
        }
    }

    void Parser::parseTypeName(TypeExpression& type)
    {
        const std::size_t start = m_current;
        const Token& first = advance();
        type.kind = TypeExpressionKind::Identifier;
        type.name = first.text;

        if (match(TokenKind::Dot))
        {
            const Token& selected = consume(TokenKind::Identifier, "TAGC-E2111", "Expected type name after '.'.");
            if (selected.kind != TokenKind::Identifier)
            {
                type.kind = TypeExpressionKind::Bad;
                return;
            }
            type.kind = TypeExpressionKind::Selector;
            type.qualifier = first.text;
            type.name = selected.text;
        }

        if (!check(TokenKind::LeftBracket))
        {
            return;
        }

        TypeExpression generic = std::move(type);
        generic.span = {m_tokens[start].span.begin, previous().span.end};
        generic.text = textBetween(start, m_current);

        type = TypeExpression{};
        type.kind = TypeExpressionKind::Instantiation;
        type.elements.push_back(std::move(generic));

        advance(); // consume '['
        while (!check(TokenKind::RightBracket) && !isAtEnd())
        {
            type.elements.push_back(parseType());
            if (!match(TokenKind::Comma))
            {
                break;
            }
        }
        consume(TokenKind::RightBracket, "TAGC-E2112", "Expected ']' after type arguments.");
    }

    void Parser::parseArrayOrSlice(TypeExpression& type)
    {
        advance(); // consume '['

        if (match(TokenKind::RightBracket))
        {
            type.kind = TypeExpressionKind::Slice;
            type.elements.push_back(parseType());
            return;
        }

        type.kind = TypeExpressionKind::Array;

        // The length is an arbitrary constant expression; only its extent matters.
        int depth = 1;
        while (!isAtEnd())
        {
            const TokenKind kind = peek().kind;
            if (isOpening(kind))
            {
                ++depth;
            }
            else if (isClosing(kind) && --depth == 0)
            {
                break;
            }
            advance();
        }

        consume(TokenKind::RightBracket, "TAGC-E2115", "Expected ']' after array length.");
        type.elements.push_back(parseType());
    }

    void Parser::parseMap(TypeExpression& type)
    {
        advance(); // consume 'map'
        type.kind = TypeExpressionKind::Map;

        consume(TokenKind::LeftBracket, "TAGC-E2116", "Expected '[' after 'map'.");
        type.elements.push_back(parseType());
        consume(TokenKind::RightBracket, "TAGC-E2117", "Expected ']' after map key type.");
        type.elements.push_back(parseType());
    }

    void Parser::parseChannel(TypeExpression& type)
    {
        type.kind = TypeExpressionKind::Channel;

        if (match(TokenKind::Arrow))
        {
            consume(TokenKind::KeywordChan, "TAGC-E2118", "Expected 'chan' after '<-'.");
        }
        else
        {
            advance(); // consume 'chan'
            match(TokenKind::Arrow);
        }

        type.elements.push_back(parseType());
    }

    void Parser::parseFunction(TypeExpression& type)
    {
        advance(); // consume 'func'
        type.kind = TypeExpressionKind::Function;

        if (!check(TokenKind::LeftParen))
        {
            report("TAGC-E2119", "Expected '(' after 'func'.", peek().span);
            return;
        }

        skipBalanced(&type.elements);

        if (check(TokenKind::LeftParen))
        {
            skipBalanced(&type.elements);
        }
        else if (!isAtEnd() && canStartType(peek().kind))
        {
            type.elements.push_back(parseType());
        }
    }

    void Parser::parseStruct(TypeExpression& type)
    {
        advance(); // consume 'struct'
        type.kind = TypeExpressionKind::Struct;

        if (!match(TokenKind::LeftBrace))
        {
            report("TAGC-E2120", "Expected '{' after 'struct'.", peek().span);
            return;
        }

        while (!check(TokenKind::RightBrace) && !isAtEnd())
        {
            if (match(TokenKind::Semicolon))
            {
                continue;
            }

            StructField field = parseStructField();
            if (field.type.kind != TypeExpressionKind::Bad)
            {
                type.fields.emplace_back(std::move(field));
            }

            if (!check(TokenKind::Semicolon) && !check(TokenKind::RightBrace) && !isAtEnd())
            {
                report("TAGC-E2122", "Expected ';' or '}' after struct field.", peek().span);
                skipToFieldEnd();
            }
        }

        consume(TokenKind::RightBrace, "TAGC-E2121", "Expected '}' to close struct.");
    }

    StructField Parser::parseStructField()
    {
        StructField field{};
        const Token& first = peek();

        if (check(TokenKind::Identifier))
        {
            const TokenKind next = lookAhead(1).kind;
            const bool embedded = next == TokenKind::Dot
                                  || next == TokenKind::Semicolon
                                  || next == TokenKind::RightBrace
                                  || next == TokenKind::StringLiteral
                                  || next == TokenKind::RawStringLiteral
                                  || (next == TokenKind::LeftBracket && isEmbeddedInstantiation());

            if (!embedded)
            {
                do
                {
                    const Token& name = consume(TokenKind::Identifier, "TAGC-E2123", "Expected field name.");
                    if (name.kind != TokenKind::Identifier)
                    {
                        break;
                    }
                    field.names.push_back(Identifier{name.text, name.span});
                } while (match(TokenKind::Comma));
            }

            field.type = parseType();
        }
        else if (check(TokenKind::Asterisk) || check(TokenKind::LeftParen))
        {
            field.type = parseType();
        }
        else
        {
            report("TAGC-E2123", "Expected field name or embedded type.", peek().span);
            skipToFieldEnd();
            return field;
        }

        if (check(TokenKind::StringLiteral) || check(TokenKind::RawStringLiteral))
        {
            const Token& tag = advance();
            field.tag = TagLiteral{tag.text, tag.span};
        }

        field.span = {first.span.begin, previous().span.end};
        return field;
    }

    // `Base[T]` embeds a generic type while `Buffer [4]byte` declares a field.
    bool Parser::isEmbeddedInstantiation() const
    {
        const std::size_t close = matchingClose(m_current + 1);
        if (close + 1 >= m_tokens.size())
        {
            return true;
        }
        return !canStartType(m_tokens[close + 1].kind);
    }

    bool Parser::canStartType(TokenKind kind) const
    {
        switch (kind)
        {
        case TokenKind::Identifier:
        case TokenKind::Asterisk:
        case TokenKind::LeftBracket:
        case TokenKind::LeftParen:
        case TokenKind::KeywordMap:
        case TokenKind::KeywordChan:
        case TokenKind::KeywordFunc:
        case TokenKind::KeywordInterface:
        case TokenKind::KeywordStruct:
        case TokenKind::Arrow:
            return true;
        default:
            return false;
        }
    }

    std::size_t Parser::matchingClose(std::size_t openIndex) const
    {
        int depth = 0;
        for (std::size_t index = openIndex; index < m_tokens.size(); ++index)
        {
            const TokenKind kind = m_tokens[index].kind;
            if (isOpening(kind))
            {
                ++depth;
            }
            else if (isClosing(kind) && --depth == 0)
            {
                return index;
            }
        }
        return m_tokens.size() - 1;
    }

    void Parser::skipBalanced(std::vector<TypeExpression>* nestedStructs)
    {
        const SourceSpan openSpan = peek().span;
        int depth = 0;

        do
        {
            if (nestedStructs != nullptr
                && check(TokenKind::KeywordStruct)
                && lookAhead(1).kind == TokenKind::LeftBrace)
            {
                nestedStructs->push_back(parseType());
                continue;
            }

            const Token& token = advance();
            if (isOpening(token.kind))
            {
                ++depth;
            }
            else if (isClosing(token.kind))
            {
                --depth;
            }
        } while (depth > 0 && !isAtEnd());

        if (depth > 0)
        {
            report("TAGC-E2124", "Unbalanced brackets.", openSpan);
        }
    }

    void Parser::skipToFieldEnd()
    {
        int depth = 0;
        while (!isAtEnd())
        {
            const TokenKind kind = peek().kind;
            if (depth == 0 && (kind == TokenKind::Semicolon || kind == TokenKind::RightBrace))
            {
                return;
            }

            if (isOpening(kind))
            {
                ++depth;
            }
            else if (isClosing(kind))
            {
                --depth;
            }
            advance();
        }
    }

    void Parser::skipToDeclarationEnd()
    {
        int depth = 0;
        while (!isAtEnd())
        {
            const TokenKind kind = peek().kind;
            if (depth == 0 && kind == TokenKind::Semicolon)
            {
                advance();
                return;
            }

            if (depth == 0 && isClosing(kind))
            {
                return;
            }

            if (isOpening(kind))
            {
                ++depth;
            }
            else if (isClosing(kind))
            {
                --depth;
            }
            advance();
        }
    }

    std::string Parser::textBetween(std::size_t first, std::size_t last) const
    {
        std::string text;
        bool separateNext = false;

        for (std::size_t index = first; index < last && index < m_tokens.size(); ++index)
        {
            const Token& token = m_tokens[index];
            if (token.kind == TokenKind::Semicolon)
            {
                text.append("; ");
                separateNext = false;
                continue;
            }

            const bool word = isWord(token);
            if (word && separateNext)
            {
                text.push_back(' ');
            }

            text.append(token.text);
            separateNext = word || token.kind == TokenKind::RightParen;
        }

        return text;
    }
} // namespace tagcheck::frontend
