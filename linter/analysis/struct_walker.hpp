#pragma once

#include "../frontend/ast.hpp"
#include "checker_config.hpp"
#include "diagnostic.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tagcheck::analysis
{
    // Visits every struct type of a compilation unit, outer structs before the structs
    // nested in their fields, and checks each tagged field against the configured rules.
    class StructWalker
    {
    public:
        StructWalker(const frontend::CompilationUnit& unit, const CheckerConfig& config);

        void walk();

        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;
        [[nodiscard]] std::size_t structsVisited() const noexcept;
        [[nodiscard]] std::size_t fieldsChecked() const noexcept;

    private:
        void visit(const frontend::TypeExpression& type);
        void checkStruct(const frontend::TypeExpression& structType);
        void checkField(const frontend::TypeExpression& structType, const frontend::StructField& field);
        void emitError(std::string_view code, std::string message, frontend::SourceSpan span);

    private:
        const frontend::CompilationUnit& m_unit;
        const CheckerConfig& m_config;
        std::vector<Diagnostic> m_diagnostics;
        std::size_t m_structsVisited{0};
        std::size_t m_fieldsChecked{0};
    };
} // namespace tagcheck::analysis
