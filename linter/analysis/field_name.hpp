#pragma once

#include "../frontend/ast.hpp"

#include <optional>
#include <string>

namespace tagcheck::analysis
{
    // Name a tag is compared against: the last declared identifier of the field, or
    // for an embedded field the type name with pointers and package qualifiers removed.
    // Returns nullopt and fills errorMessage for embedded fields of any other shape.
    [[nodiscard]] std::optional<std::string> resolveFieldName(const frontend::StructField& field,
        std::string& errorMessage);

    [[nodiscard]] std::optional<std::string> resolveTypeName(const frontend::TypeExpression& type,
        std::string& errorMessage);
} // namespace tagcheck::analysis
