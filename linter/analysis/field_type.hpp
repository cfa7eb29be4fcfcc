#pragma once

#include "../frontend/ast.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace tagcheck::analysis
{
    enum class FieldType : std::uint16_t
    {
        // Shapes wrapping another type.
        Pointer,
        Array,
        Slice,
        Map,

        // Terminal classifications of a type name.
        Boolean,
        String,
        Integer,
        Unsigned,
        Float,
        Complex,
        Byte,
        Rune,
        Error,
        Any,
        Named
    };

    [[nodiscard]] std::string_view toString(FieldType type);

    // Classifies a predeclared type name; anything else is Named.
    [[nodiscard]] FieldType parseFieldType(std::string_view name);

    // Shape of a field type read outward-in, e.g. `*[]int` is {Pointer, Slice, Integer}.
    // Empty when the outermost expression is not a pointer, array, slice, map or type name.
    [[nodiscard]] std::vector<FieldType> classifyFieldType(const frontend::TypeExpression& type);
} // namespace tagcheck::analysis
