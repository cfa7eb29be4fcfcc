#include "ast.hpp"

namespace tagcheck::frontend
{
    std::string_view toString(TypeExpressionKind kind)
    {
        switch (kind)
        {
        case TypeExpressionKind::Bad: return "bad";
        case TypeExpressionKind::Identifier: return "identifier";
        case TypeExpressionKind::Selector: return "selector";
        case TypeExpressionKind::Pointer: return "pointer";
        case TypeExpressionKind::Array: return "array";
        case TypeExpressionKind::Slice: return "slice";
        case TypeExpressionKind::Map: return "map";
        case TypeExpressionKind::Channel: return "channel";
        case TypeExpressionKind::Function: return "function";
        case TypeExpressionKind::Interface: return "interface";
        case TypeExpressionKind::Struct: return "struct";
        case TypeExpressionKind::Parenthesized: return "parenthesized";
        case TypeExpressionKind::Instantiation: return "instantiation";
        case TypeExpressionKind::Ellipsis: return "ellipsis";
        }

        return "unknown";
    }
} // namespace tagcheck::frontend
