#include "checker_config.hpp"

#include "naming_case.hpp"

#include <utility>

namespace tagcheck::analysis
{
    bool hasActiveRules(const CheckerConfig& config)
    {
        for (const auto& [key, convention] : config.rules)
        {
            if (!convention.empty())
            {
                return true;
            }
        }
        return false;
    }

    bool validateConfig(const CheckerConfig& config, std::vector<Diagnostic>& diagnostics)
    {
        bool valid = true;
        for (const auto& [key, convention] : config.rules)
        {
            if (convention.empty() || parseNamingCase(convention).has_value())
            {
                continue;
            }

            Diagnostic diagnostic;
            diagnostic.code = "TAGC-E1010";
            diagnostic.message = "rule '" + key + "': unsupported case: " + convention;
            diagnostics.emplace_back(std::move(diagnostic));
            valid = false;
        }
        return valid;
    }
} // namespace tagcheck::analysis
