#pragma once

#include "../frontend/token.hpp"

#include <string>

namespace tagcheck::analysis
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        frontend::SourceSpan span;
    };
} // namespace tagcheck::analysis
