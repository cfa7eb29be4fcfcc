#include "token.hpp"

namespace tagcheck::frontend
{
    std::string_view toString(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::EndOfFile: return "endOfFile";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::NumberLiteral: return "numberLiteral";
        case TokenKind::RuneLiteral: return "runeLiteral";
        case TokenKind::StringLiteral: return "stringLiteral";
        case TokenKind::RawStringLiteral: return "rawStringLiteral";

        case TokenKind::KeywordBreak: return "break";
        case TokenKind::KeywordCase: return "case";
        case TokenKind::KeywordChan: return "chan";
        case TokenKind::KeywordConst: return "const";
        case TokenKind::KeywordContinue: return "continue";
        case TokenKind::KeywordDefault: return "default";
        case TokenKind::KeywordDefer: return "defer";
        case TokenKind::KeywordElse: return "else";
        case TokenKind::KeywordFallthrough: return "fallthrough";
        case TokenKind::KeywordFor: return "for";
        case TokenKind::KeywordFunc: return "func";
        case TokenKind::KeywordGo: return "go";
        case TokenKind::KeywordGoto: return "goto";
        case TokenKind::KeywordIf: return "if";
        case TokenKind::KeywordImport: return "import";
        case TokenKind::KeywordInterface: return "interface";
        case TokenKind::KeywordMap: return "map";
        case TokenKind::KeywordPackage: return "package";
        case TokenKind::KeywordRange: return "range";
        case TokenKind::KeywordReturn: return "return";
        case TokenKind::KeywordSelect: return "select";
        case TokenKind::KeywordStruct: return "struct";
        case TokenKind::KeywordSwitch: return "switch";
        case TokenKind::KeywordType: return "type";
        case TokenKind::KeywordVar: return "var";

        case TokenKind::LeftBrace: return "leftBrace";
        case TokenKind::RightBrace: return "rightBrace";
        case TokenKind::LeftParen: return "leftParen";
        case TokenKind::RightParen: return "rightParen";
        case TokenKind::LeftBracket: return "leftBracket";
        case TokenKind::RightBracket: return "rightBracket";
        case TokenKind::Comma: return "comma";
        case TokenKind::Colon: return "colon";
        case TokenKind::Semicolon: return "semicolon";
        case TokenKind::Dot: return "dot";
        case TokenKind::Ellipsis: return "ellipsis";
        case TokenKind::Equals: return "equals";
        case TokenKind::Asterisk: return "asterisk";
        case TokenKind::Arrow: return "arrow";
        case TokenKind::PlusPlus: return "plusPlus";
        case TokenKind::MinusMinus: return "minusMinus";
        case TokenKind::Operator: return "operator";
        }

        return "unknown";
    }

    bool isKeyword(TokenKind kind) noexcept
    {
        return kind >= TokenKind::KeywordBreak && kind <= TokenKind::KeywordVar;
    }
} // namespace tagcheck::frontend
