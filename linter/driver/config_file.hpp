#pragma once

#include "../analysis/checker_config.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tagcheck
{
    struct ConfigIssue
    {
        std::size_t line{0};
        std::string code;
        std::string message;
    };

    // Applies `key = value` lines to config. Blank lines and lines starting with '#'
    // are ignored. Recognized keys:
    //   use-field-name = true|false
    //   report-malformed-tags = true|false
    //   rules.<tag-key> = <case>
    // Returns false if any line was rejected; accepted lines are still applied.
    bool parseConfigText(std::string_view text, analysis::CheckerConfig& config, std::vector<ConfigIssue>& issues);

    // Reads path and applies it with parseConfigText. An unreadable file is reported
    // as a TAGC-E1020 issue on line 0.
    bool loadConfigFile(const std::string& path, analysis::CheckerConfig& config, std::vector<ConfigIssue>& issues);
} // namespace tagcheck
