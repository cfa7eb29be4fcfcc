#include <gtest/gtest.h>

#include "lexer.hpp"
#include "parser.hpp"

#include <algorithm>

namespace tagcheck::frontend
{
namespace
{
    CompilationUnit parseSource(const std::string& source, std::vector<Diagnostic>& outDiagnostics)
    {
        Lexer lexer{source};
        lexer.lex();

        Parser parser{lexer.tokens()};
        CompilationUnit unit = parser.parse();
        outDiagnostics = parser.diagnostics();
        return unit;
    }

    TEST(ParserTest, ParsesPackageAndImports)
    {
        const std::string source = R"(package demo

import "strings"

import (
	"fmt"
	j "encoding/json"
)
)";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        ASSERT_TRUE(diagnostics.empty())
            << "First diagnostic: " << diagnostics.front().code << " - " << diagnostics.front().message;
        EXPECT_EQ(unit.package.name, "demo");
        ASSERT_EQ(unit.imports.size(), 3u);
        EXPECT_EQ(unit.imports[0].path, "strings");
        EXPECT_EQ(unit.imports[1].path, "fmt");
        EXPECT_TRUE(unit.imports[1].alias.empty());
        EXPECT_EQ(unit.imports[2].path, "encoding/json");
        EXPECT_EQ(unit.imports[2].alias, "j");
    }

    TEST(ParserTest, ParsesStructFieldsAndTags)
    {
        const std::string source = R"(package demo

type User struct {
	ID        int64  `json:"id"`
	FirstName string `json:"first_name,omitempty"`
	A, B      bool
}
)";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        ASSERT_TRUE(diagnostics.empty())
            << "First diagnostic: " << diagnostics.front().code << " - " << diagnostics.front().message;
        ASSERT_EQ(unit.types.size(), 1u);

        const auto& declaration = unit.types.front();
        EXPECT_EQ(declaration.name, "User");
        EXPECT_FALSE(declaration.isAlias);
        ASSERT_EQ(declaration.type.kind, TypeExpressionKind::Struct);
        EXPECT_EQ(declaration.type.span.begin.line, 3u);
        EXPECT_EQ(declaration.type.span.begin.column, 11u);

        const auto& fields = declaration.type.fields;
        ASSERT_EQ(fields.size(), 3u);

        ASSERT_EQ(fields[0].names.size(), 1u);
        EXPECT_EQ(fields[0].names[0].name, "ID");
        EXPECT_EQ(fields[0].type.kind, TypeExpressionKind::Identifier);
        EXPECT_EQ(fields[0].type.name, "int64");
        ASSERT_TRUE(fields[0].tag.has_value());
        EXPECT_EQ(fields[0].tag->value, "`json:\"id\"`");
        EXPECT_EQ(fields[0].tag->span.begin.line, 4u);

        ASSERT_TRUE(fields[1].tag.has_value());
        EXPECT_EQ(fields[1].tag->value, "`json:\"first_name,omitempty\"`");

        ASSERT_EQ(fields[2].names.size(), 2u);
        EXPECT_EQ(fields[2].names[0].name, "A");
        EXPECT_EQ(fields[2].names[1].name, "B");
        EXPECT_FALSE(fields[2].tag.has_value());
    }

    TEST(ParserTest, ParsesCompositeFieldTypes)
    {
        const std::string source = R"(package demo

type Shapes struct {
	Ptr      *string
	Items    []int
	Fixed    [4 * size]byte
	Lookup   map[string]*time.Time
	Stream   <-chan int
	Callback func(ctx context.Context) (int, error)
	Any      interface{ Close() error }
}
)";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        ASSERT_TRUE(diagnostics.empty())
            << "First diagnostic: " << diagnostics.front().code << " - " << diagnostics.front().message;
        ASSERT_EQ(unit.types.size(), 1u);
        const auto& fields = unit.types.front().type.fields;
        ASSERT_EQ(fields.size(), 7u);

        EXPECT_EQ(fields[0].type.kind, TypeExpressionKind::Pointer);
        ASSERT_EQ(fields[0].type.elements.size(), 1u);
        EXPECT_EQ(fields[0].type.elements[0].name, "string");

        EXPECT_EQ(fields[1].type.kind, TypeExpressionKind::Slice);
        EXPECT_EQ(fields[1].type.text, "[]int");

        EXPECT_EQ(fields[2].type.kind, TypeExpressionKind::Array);
        ASSERT_EQ(fields[2].type.elements.size(), 1u);
        EXPECT_EQ(fields[2].type.elements[0].name, "byte");

        const auto& lookup = fields[3].type;
        EXPECT_EQ(lookup.kind, TypeExpressionKind::Map);
        ASSERT_EQ(lookup.elements.size(), 2u);
        EXPECT_EQ(lookup.elements[0].name, "string");
        EXPECT_EQ(lookup.elements[1].kind, TypeExpressionKind::Pointer);
        ASSERT_EQ(lookup.elements[1].elements.size(), 1u);
        EXPECT_EQ(lookup.elements[1].elements[0].kind, TypeExpressionKind::Selector);
        EXPECT_EQ(lookup.elements[1].elements[0].qualifier, "time");
        EXPECT_EQ(lookup.elements[1].elements[0].name, "Time");
        EXPECT_EQ(lookup.text, "map[string]*time.Time");

        EXPECT_EQ(fields[4].type.kind, TypeExpressionKind::Channel);
        EXPECT_EQ(fields[5].type.kind, TypeExpressionKind::Function);
        EXPECT_EQ(fields[6].type.kind, TypeExpressionKind::Interface);
    }

    TEST(ParserTest, ParsesEmbeddedFields)
    {
        const std::string source = R"(package demo

type Outer struct {
	Base
	*pkg.Thing `json:"thing"`
	io.Reader
	Generic[int]
	Buffer [4]byte
}
)";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        ASSERT_TRUE(diagnostics.empty())
            << "First diagnostic: " << diagnostics.front().code << " - " << diagnostics.front().message;
        ASSERT_EQ(unit.types.size(), 1u);
        const auto& fields = unit.types.front().type.fields;
        ASSERT_EQ(fields.size(), 5u);

        EXPECT_TRUE(fields[0].names.empty());
        EXPECT_EQ(fields[0].type.kind, TypeExpressionKind::Identifier);
        EXPECT_EQ(fields[0].type.name, "Base");

        EXPECT_TRUE(fields[1].names.empty());
        EXPECT_EQ(fields[1].type.kind, TypeExpressionKind::Pointer);
        EXPECT_EQ(fields[1].type.text, "*pkg.Thing");
        EXPECT_TRUE(fields[1].tag.has_value());

        EXPECT_TRUE(fields[2].names.empty());
        EXPECT_EQ(fields[2].type.kind, TypeExpressionKind::Selector);

        EXPECT_TRUE(fields[3].names.empty());
        EXPECT_EQ(fields[3].type.kind, TypeExpressionKind::Instantiation);
        EXPECT_EQ(fields[3].type.text, "Generic[int]");

        ASSERT_EQ(fields[4].names.size(), 1u);
        EXPECT_EQ(fields[4].names[0].name, "Buffer");
        EXPECT_EQ(fields[4].type.kind, TypeExpressionKind::Array);
    }

    TEST(ParserTest, ParsesGroupedGenericAndAliasDeclarations)
    {
        const std::string source = R"(package demo

type (
	Point struct { X int `json:"x"` }
	Location = Point
	List[T any] struct {
		Items []T `json:"items"`
	}
	Buffer [16]byte
)
)";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        ASSERT_TRUE(diagnostics.empty())
            << "First diagnostic: " << diagnostics.front().code << " - " << diagnostics.front().message;
        ASSERT_EQ(unit.types.size(), 4u);

        EXPECT_EQ(unit.types[0].name, "Point");
        EXPECT_EQ(unit.types[0].type.kind, TypeExpressionKind::Struct);
        EXPECT_EQ(unit.types[0].type.fields.size(), 1u);

        EXPECT_EQ(unit.types[1].name, "Location");
        EXPECT_TRUE(unit.types[1].isAlias);
        EXPECT_EQ(unit.types[1].type.kind, TypeExpressionKind::Identifier);

        EXPECT_EQ(unit.types[2].name, "List");
        ASSERT_EQ(unit.types[2].type.kind, TypeExpressionKind::Struct);
        ASSERT_EQ(unit.types[2].type.fields.size(), 1u);
        EXPECT_EQ(unit.types[2].type.fields[0].type.kind, TypeExpressionKind::Slice);

        EXPECT_EQ(unit.types[3].name, "Buffer");
        EXPECT_EQ(unit.types[3].type.kind, TypeExpressionKind::Array);
    }

    TEST(ParserTest, CollectsNestedAndAnonymousStructs)
    {
        const std::string source = R"(package demo

type Outer struct {
	Inner struct {
		Value int `json:"value"`
	} `json:"inner"`
	Hook func(struct{ Name string }) error
}

var defaults = struct {
	Port int `json:"port"`
}{Port: 80}

func handle(request struct{ ID string }) {
	type local struct {
		Count int `json:"count"`
	}
}
)";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        ASSERT_TRUE(diagnostics.empty())
            << "First diagnostic: " << diagnostics.front().code << " - " << diagnostics.front().message;
        ASSERT_EQ(unit.types.size(), 4u);

        const auto& outer = unit.types[0];
        EXPECT_EQ(outer.name, "Outer");
        ASSERT_EQ(outer.type.fields.size(), 2u);

        const auto& inner = outer.type.fields[0];
        EXPECT_EQ(inner.type.kind, TypeExpressionKind::Struct);
        ASSERT_EQ(inner.type.fields.size(), 1u);
        EXPECT_EQ(inner.type.fields[0].names[0].name, "Value");
        ASSERT_TRUE(inner.tag.has_value());
        EXPECT_EQ(inner.tag->value, "`json:\"inner\"`");

        const auto& hook = outer.type.fields[1].type;
        EXPECT_EQ(hook.kind, TypeExpressionKind::Function);
        ASSERT_EQ(hook.elements.size(), 2u);
        EXPECT_EQ(hook.elements[0].kind, TypeExpressionKind::Struct);
        EXPECT_EQ(hook.elements[1].name, "error");

        EXPECT_TRUE(unit.types[1].name.empty());
        EXPECT_EQ(unit.types[1].type.kind, TypeExpressionKind::Struct);
        EXPECT_EQ(unit.types[1].type.fields[0].names[0].name, "Port");

        EXPECT_TRUE(unit.types[2].name.empty());
        EXPECT_EQ(unit.types[2].type.fields[0].names[0].name, "ID");

        EXPECT_EQ(unit.types[3].name, "local");
    }

    TEST(ParserTest, IgnoresTypeSwitchGuards)
    {
        const std::string source = R"(package demo

func kind(value any) string {
	switch value.(type) {
	case int:
		return "int"
	}
	return "other"
}
)";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        EXPECT_TRUE(diagnostics.empty());
        EXPECT_TRUE(unit.types.empty());
    }

    TEST(ParserTest, ReportsMissingPackageClause)
    {
        const std::string source = "type Empty struct{}\n";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        ASSERT_FALSE(diagnostics.empty());
        EXPECT_EQ(diagnostics.front().code, "TAGC-E2100");
        ASSERT_EQ(unit.types.size(), 1u);
        EXPECT_EQ(unit.types.front().name, "Empty");
    }

    TEST(ParserTest, RecoversFromMalformedField)
    {
        const std::string source = R"(package demo

type Broken struct {
	Name string `json:"name"`
	123
	Other int
}
)";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        const bool reported = std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& diagnostic) {
            return diagnostic.code == "TAGC-E2123";
        });
        EXPECT_TRUE(reported);

        ASSERT_EQ(unit.types.size(), 1u);
        const auto& fields = unit.types.front().type.fields;
        ASSERT_EQ(fields.size(), 2u);
        EXPECT_EQ(fields[0].names[0].name, "Name");
        EXPECT_EQ(fields[1].names[0].name, "Other");
    }

    TEST(ParserTest, ReportsUnclosedStruct)
    {
        const std::string source = "package demo\n\ntype Open struct {\n\tName string\n";

        std::vector<Diagnostic> diagnostics;
        parseSource(source, diagnostics);

        const bool reported = std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& diagnostic) {
            return diagnostic.code == "TAGC-E2121";
        });
        EXPECT_TRUE(reported);
    }

    TEST(ParserTest, RecoversFromStrayCloserInTypeGroup)
    {
        const std::string source = "package p\ntype (\n  A struct{ X int `json:\"x\"` } }\n)\n";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        const bool reported = std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& diagnostic) {
            return diagnostic.code == "TAGC-E2102";
        });
        EXPECT_TRUE(reported);
        EXPECT_LT(diagnostics.size(), 4u);

        ASSERT_EQ(unit.types.size(), 1u);
        EXPECT_EQ(unit.types.front().name, "A");
        ASSERT_EQ(unit.types.front().type.fields.size(), 1u);
        EXPECT_EQ(unit.types.front().type.fields[0].names[0].name, "X");
    }

    TEST(ParserTest, RecoversFromStrayCloserInImportGroup)
    {
        const std::string source = "package p\nimport (\n]\n)\n\ntype B struct {\n\tY string\n}\n";

        std::vector<Diagnostic> diagnostics;
        CompilationUnit unit = parseSource(source, diagnostics);

        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "TAGC-E2105");
        EXPECT_TRUE(unit.imports.empty());
        ASSERT_EQ(unit.types.size(), 1u);
        EXPECT_EQ(unit.types.front().name, "B");
    }
} // namespace
} // namespace tagcheck::frontend
