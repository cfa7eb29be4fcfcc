#include "field_name.hpp"

namespace tagcheck::analysis
{
    std::optional<std::string> resolveFieldName(const frontend::StructField& field, std::string& errorMessage)
    {
        // In `a, b int` the last name wins.
        std::string name;
        for (const auto& identifier : field.names)
        {
            if (!identifier.name.empty())
            {
                name = identifier.name;
            }
        }

        if (!name.empty())
        {
            return name;
        }

        return resolveTypeName(field.type, errorMessage);
    }

    std::optional<std::string> resolveTypeName(const frontend::TypeExpression& type, std::string& errorMessage)
    {
        switch (type.kind)
        {
        case frontend::TypeExpressionKind::Identifier:
        case frontend::TypeExpressionKind::Selector:
            return type.name;
        case frontend::TypeExpressionKind::Pointer:
            if (!type.elements.empty())
            {
                return resolveTypeName(type.elements.front(), errorMessage);
            }
            break;
        default:
            break;
        }

        errorMessage = "unexpected type ";
        errorMessage.append(frontend::toString(type.kind));
        errorMessage.append(": ");
        errorMessage.append(type.text);
        return std::nullopt;
    }
} // namespace tagcheck::analysis
