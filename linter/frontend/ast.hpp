#pragma once

#include "token.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagcheck::frontend
{
    enum class TypeExpressionKind : std::uint16_t
    {
        Bad,
        Identifier,
        Selector,
        Pointer,
        Array,
        Slice,
        Map,
        Channel,
        Function,
        Interface,
        Struct,
        Parenthesized,
        Instantiation,
        Ellipsis
    };

    [[nodiscard]] std::string_view toString(TypeExpressionKind kind);

    struct StructField;

    struct TypeExpression
    {
        TypeExpressionKind kind{TypeExpressionKind::Bad};

        // Identifier: the name. Selector: the selected name, with the package in qualifier.
        std::string name;
        std::string qualifier;

        // Pointer, Array, Slice, Channel, Parenthesized, Ellipsis: [0] is the element type.
        // Map: [0] is the key type, [1] the value type.
        // Instantiation: [0] is the generic type, followed by the type arguments.
        // Function: struct types found in the parameter lists, then the result type.
        // Interface: struct types found in the method set.
        std::vector<TypeExpression> elements;

        // Struct only, in declaration order.
        std::vector<StructField> fields;

        std::string text;
        SourceSpan span{};
    };

    struct Identifier
    {
        std::string name;
        SourceSpan span;
    };

    struct TagLiteral
    {
        // Literal text including its quote characters.
        std::string value;
        SourceSpan span;
    };

    struct StructField
    {
        std::vector<Identifier> names;
        TypeExpression type;
        std::optional<TagLiteral> tag;
        SourceSpan span;
    };

    struct TypeDeclaration
    {
        // Empty for struct types found outside a type declaration.
        std::string name;
        TypeExpression type;
        SourceSpan span;
        bool isAlias{false};
    };

    struct ImportDeclaration
    {
        std::string path;
        std::string alias;
        SourceSpan span;
    };

    struct PackageClause
    {
        std::string name;
        SourceSpan span;
    };

    struct CompilationUnit
    {
        PackageClause package;
        std::vector<ImportDeclaration> imports;
        std::vector<TypeDeclaration> types;
    };
} // namespace tagcheck::frontend
