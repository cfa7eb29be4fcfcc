#include "field_type.hpp"

namespace tagcheck::analysis
{
    namespace
    {
        using frontend::TypeExpression;
        using frontend::TypeExpressionKind;

        std::vector<FieldType> wrap(FieldType shape, const TypeExpression& inner)
        {
            std::vector<FieldType> result{shape};
            const std::vector<FieldType> rest = classifyFieldType(inner);
            result.insert(result.end(), rest.begin(), rest.end());
            return result;
        }
    } // namespace

    std::string_view toString(FieldType type)
    {
        switch (type)
        {
        case FieldType::Pointer: return "pointer";
        case FieldType::Array: return "array";
        case FieldType::Slice: return "slice";
        case FieldType::Map: return "map";
        case FieldType::Boolean: return "boolean";
        case FieldType::String: return "string";
        case FieldType::Integer: return "integer";
        case FieldType::Unsigned: return "unsigned";
        case FieldType::Float: return "float";
        case FieldType::Complex: return "complex";
        case FieldType::Byte: return "byte";
        case FieldType::Rune: return "rune";
        case FieldType::Error: return "error";
        case FieldType::Any: return "any";
        case FieldType::Named: return "named";
        }

        return "unknown";
    }

    FieldType parseFieldType(std::string_view name)
    {
        if (name == "bool") return FieldType::Boolean;
        if (name == "string") return FieldType::String;
        if (name == "int" || name == "int8" || name == "int16" || name == "int32" || name == "int64")
        {
            return FieldType::Integer;
        }
        if (name == "uint" || name == "uint8" || name == "uint16" || name == "uint32" || name == "uint64"
            || name == "uintptr")
        {
            return FieldType::Unsigned;
        }
        if (name == "float32" || name == "float64") return FieldType::Float;
        if (name == "complex64" || name == "complex128") return FieldType::Complex;
        if (name == "byte") return FieldType::Byte;
        if (name == "rune") return FieldType::Rune;
        if (name == "error") return FieldType::Error;
        if (name == "any") return FieldType::Any;
        return FieldType::Named;
    }

    std::vector<FieldType> classifyFieldType(const TypeExpression& type)
    {
        switch (type.kind)
        {
        case TypeExpressionKind::Identifier:
        case TypeExpressionKind::Selector:
            // The package qualifier of a selector plays no part.
            return {parseFieldType(type.name)};
        case TypeExpressionKind::Pointer:
            if (!type.elements.empty())
            {
                return wrap(FieldType::Pointer, type.elements.front());
            }
            break;
        case TypeExpressionKind::Array:
            if (!type.elements.empty())
            {
                return wrap(FieldType::Array, type.elements.front());
            }
            break;
        case TypeExpressionKind::Slice:
            if (!type.elements.empty())
            {
                return wrap(FieldType::Slice, type.elements.front());
            }
            break;
        case TypeExpressionKind::Map:
            // Only the value type is classified.
            if (type.elements.size() == 2)
            {
                return wrap(FieldType::Map, type.elements[1]);
            }
            break;
        default:
            break;
        }

        return {};
    }
} // namespace tagcheck::analysis
