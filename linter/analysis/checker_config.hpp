#pragma once

#include "diagnostic.hpp"

#include <map>
#include <string>
#include <vector>

namespace tagcheck::analysis
{
    struct CheckerConfig
    {
        // Tag key -> naming case identifier, e.g. "json" -> "camel". An empty
        // identifier disables the rule.
        std::map<std::string, std::string> rules;

        // Derive the expected tag value from the field name instead of the tag value.
        bool useFieldName{false};

        // Report tags the conventional key:"value" grammar rejects.
        bool reportMalformedTags{false};
    };

    [[nodiscard]] bool hasActiveRules(const CheckerConfig& config);

    // Appends one TAGC-E1010 diagnostic per rule naming an unknown case.
    bool validateConfig(const CheckerConfig& config, std::vector<Diagnostic>& diagnostics);
} // namespace tagcheck::analysis
