#pragma once

#include "../frontend/ast.hpp"
#include "checker_config.hpp"
#include "diagnostic.hpp"

#include <string_view>
#include <vector>

namespace tagcheck::analysis
{
    // Checks one tagged field against every active rule of config. structType locates
    // configuration errors; tag locates mismatches.
    void checkFieldConventions(const CheckerConfig& config,
        const frontend::TypeExpression& structType,
        const frontend::TagLiteral& tag,
        std::string_view fieldName,
        std::vector<Diagnostic>& diagnostics);

    // Checks the value stored under key against convention. Missing values, "-" and
    // empty values are not checked.
    void checkTagConvention(std::string_view key,
        std::string_view convention,
        bool useFieldName,
        const frontend::TypeExpression& structType,
        const frontend::TagLiteral& tag,
        std::string_view fieldName,
        std::vector<Diagnostic>& diagnostics);
} // namespace tagcheck::analysis
