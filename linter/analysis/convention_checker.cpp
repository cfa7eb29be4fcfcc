#include "convention_checker.hpp"

#include "naming_case.hpp"
#include "struct_tag.hpp"

#include <string>
#include <utility>

namespace tagcheck::analysis
{
    namespace
    {
        void report(std::vector<Diagnostic>& diagnostics, std::string_view code, std::string message,
            frontend::SourceSpan span)
        {
            Diagnostic diagnostic;
            diagnostic.code = std::string{code};
            diagnostic.message = std::move(message);
            diagnostic.span = span;
            diagnostics.emplace_back(std::move(diagnostic));
        }

        std::string rulePrefix(std::string_view key, std::string_view convention)
        {
            std::string prefix{key};
            prefix.push_back('(');
            prefix.append(convention);
            prefix.append("): ");
            return prefix;
        }
    } // namespace

    void checkFieldConventions(const CheckerConfig& config,
        const frontend::TypeExpression& structType,
        const frontend::TagLiteral& tag,
        std::string_view fieldName,
        std::vector<Diagnostic>& diagnostics)
    {
        if (config.reportMalformedTags)
        {
            const StructTag parsed = parseStructTag(tag.value);
            if (!parsed.wellFormed())
            {
                report(diagnostics, "TAGC-E4004", "malformed struct tag: " + *parsed.error, tag.span);
            }
        }

        for (const auto& [key, convention] : config.rules)
        {
            if (convention.empty())
            {
                continue;
            }
            checkTagConvention(key, convention, config.useFieldName, structType, tag, fieldName, diagnostics);
        }
    }

    void checkTagConvention(std::string_view key,
        std::string_view convention,
        bool useFieldName,
        const frontend::TypeExpression& structType,
        const frontend::TagLiteral& tag,
        std::string_view fieldName,
        std::vector<Diagnostic>& diagnostics)
    {
        const auto value = lookupTagValue(tag.value, key);
        if (!value.has_value() || *value == "-" || value->empty())
        {
            return;
        }

        std::string errorMessage;
        const auto converter = findConverter(convention, errorMessage);
        if (!converter.has_value())
        {
            report(diagnostics, "TAGC-E4003", rulePrefix(key, convention) + errorMessage, structType.span);
            return;
        }

        const std::string expected = (*converter)(useFieldName ? fieldName : std::string_view{*value});
        if (*value != expected)
        {
            report(diagnostics, "TAGC-E4100",
                rulePrefix(key, convention) + "got '" + *value + "' want '" + expected + "'", tag.span);
        }
    }
} // namespace tagcheck::analysis
