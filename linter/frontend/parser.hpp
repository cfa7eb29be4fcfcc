#pragma once

#include "ast.hpp"
#include "lexer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tagcheck::frontend
{
    // Parses package, import and type declarations plus every struct type in the
    // file. Statements and expressions are skipped token by token.
    class Parser
    {
    public:
        explicit Parser(const std::vector<Token>& tokens);

        [[nodiscard]] CompilationUnit parse();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        const Token& peek() const;
        const Token& previous() const;
        const Token& lookAhead(std::size_t offset) const;
        const Token& advance();
        bool isAtEnd() const;
        bool check(TokenKind kind) const;
        bool match(TokenKind kind);
        const Token& consume(TokenKind kind, std::string_view messageCode, std::string_view messageText);
        void report(std::string_view code, std::string_view message, SourceSpan span);

        PackageClause parsePackage();
        void parseImports(CompilationUnit& unit);
        void parseImportSpec(CompilationUnit& unit);
        void parseTypeDeclarations(CompilationUnit& unit);
        void parseTypeSpec(CompilationUnit& unit);
        bool startsTypeParameterList() const;

        TypeExpression parseType();
        void parseTypeBody(TypeExpression& type);
        void parseTypeName(TypeExpression& type);
        void parseArrayOrSlice(TypeExpression& type);
        void parseMap(TypeExpression& type);
        void parseChannel(TypeExpression& type);
        void parseFunction(TypeExpression& type);
        void parseStruct(TypeExpression& type);
        StructField parseStructField();
        bool isEmbeddedInstantiation() const;

        bool canStartType(TokenKind kind) const;
        std::size_t matchingClose(std::size_t openIndex) const;
        void skipBalanced(std::vector<TypeExpression>* nestedStructs);
        void skipToFieldEnd();
        void skipToDeclarationEnd();
        std::string textBetween(std::size_t first, std::size_t last) const;

    private:
        const std::vector<Token>& m_tokens;
        std::size_t m_current{0};
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace tagcheck::frontend
