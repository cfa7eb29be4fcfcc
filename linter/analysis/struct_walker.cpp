#include "struct_walker.hpp"

#include "convention_checker.hpp"
#include "field_name.hpp"
#include "field_type.hpp"

#include <string>
#include <utility>

namespace tagcheck::analysis
{
    StructWalker::StructWalker(const frontend::CompilationUnit& unit, const CheckerConfig& config)
        : m_unit(unit)
        , m_config(config)
    {
    }

    void StructWalker::walk()
    {
        m_diagnostics.clear();
        m_structsVisited = 0;
        m_fieldsChecked = 0;

        // Rules with an empty convention still traverse so field errors surface.
        if (m_config.rules.empty())
        {
            return;
        }

        for (const auto& declaration : m_unit.types)
        {
            visit(declaration.type);
        }
    }

    const std::vector<Diagnostic>& StructWalker::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    std::size_t StructWalker::structsVisited() const noexcept
    {
        return m_structsVisited;
    }

    std::size_t StructWalker::fieldsChecked() const noexcept
    {
        return m_fieldsChecked;
    }

    void StructWalker::visit(const frontend::TypeExpression& type)
    {
        if (type.kind == frontend::TypeExpressionKind::Struct)
        {
            checkStruct(type);
            for (const auto& field : type.fields)
            {
                visit(field.type);
            }
        }

        for (const auto& element : type.elements)
        {
            visit(element);
        }
    }

    void StructWalker::checkStruct(const frontend::TypeExpression& structType)
    {
        ++m_structsVisited;
        if (structType.fields.empty())
        {
            return;
        }

        for (const auto& field : structType.fields)
        {
            if (field.tag.has_value())
            {
                checkField(structType, field);
            }
        }
    }

    void StructWalker::checkField(const frontend::TypeExpression& structType, const frontend::StructField& field)
    {
        std::string errorMessage;
        const auto fieldName = resolveFieldName(field, errorMessage);
        if (!fieldName.has_value())
        {
            emitError("TAGC-E4001", "unable to get field name: " + errorMessage, structType.span);
            return;
        }

        if (classifyFieldType(field.type).empty())
        {
            std::string detail = "unexpected type ";
            detail.append(frontend::toString(field.type.kind));
            detail.append(": ");
            detail.append(field.type.text);
            emitError("TAGC-E4002", "unable to get field type: " + detail, structType.span);
            return;
        }

        ++m_fieldsChecked;
        checkFieldConventions(m_config, structType, *field.tag, *fieldName, m_diagnostics);
    }

    void StructWalker::emitError(std::string_view code, std::string message, frontend::SourceSpan span)
    {
        Diagnostic diagnostic;
        diagnostic.code = std::string{code};
        diagnostic.message = std::move(message);
        diagnostic.span = span;
        m_diagnostics.emplace_back(std::move(diagnostic));
    }
} // namespace tagcheck::analysis
