#include "config_file.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace tagcheck
{
    namespace
    {
        constexpr std::string_view kRulePrefix{"rules."};

        std::string_view trim(std::string_view text)
        {
            const std::size_t first = text.find_first_not_of(" \t\r");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const std::size_t last = text.find_last_not_of(" \t\r");
            return text.substr(first, last - first + 1);
        }

        std::optional<bool> parseBoolean(std::string_view value)
        {
            if (value == "true" || value == "yes" || value == "on" || value == "1") return true;
            if (value == "false" || value == "no" || value == "off" || value == "0") return false;
            return std::nullopt;
        }

        void addIssue(std::vector<ConfigIssue>& issues, std::size_t line, std::string_view code, std::string message)
        {
            ConfigIssue issue;
            issue.line = line;
            issue.code = std::string{code};
            issue.message = std::move(message);
            issues.emplace_back(std::move(issue));
        }
    } // namespace

    bool parseConfigText(std::string_view text, analysis::CheckerConfig& config, std::vector<ConfigIssue>& issues)
    {
        bool success = true;
        std::size_t lineNumber = 0;

        while (!text.empty())
        {
            ++lineNumber;
            const std::size_t newline = text.find('\n');
            std::string_view line = text.substr(0, newline);
            text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);

            line = trim(line);
            if (line.empty() || line.front() == '#')
            {
                continue;
            }

            const std::size_t equals = line.find('=');
            if (equals == std::string_view::npos)
            {
                addIssue(issues, lineNumber, "TAGC-E1021", "expected 'key = value', got '" + std::string{line} + "'");
                success = false;
                continue;
            }

            const std::string_view key = trim(line.substr(0, equals));
            const std::string_view value = trim(line.substr(equals + 1));

            if (key == "use-field-name" || key == "report-malformed-tags")
            {
                const auto flag = parseBoolean(value);
                if (!flag.has_value())
                {
                    addIssue(issues, lineNumber, "TAGC-E1023",
                        "expected true or false for '" + std::string{key} + "', got '" + std::string{value} + "'");
                    success = false;
                    continue;
                }

                if (key == "use-field-name")
                {
                    config.useFieldName = *flag;
                }
                else
                {
                    config.reportMalformedTags = *flag;
                }
                continue;
            }

            if (key.rfind(kRulePrefix, 0) == 0)
            {
                const std::string_view tagKey = key.substr(kRulePrefix.size());
                if (tagKey.empty())
                {
                    addIssue(issues, lineNumber, "TAGC-E1024", "missing tag key after 'rules.'");
                    success = false;
                    continue;
                }
                config.rules[std::string{tagKey}] = std::string{value};
                continue;
            }

            addIssue(issues, lineNumber, "TAGC-E1022", "unknown configuration key '" + std::string{key} + "'");
            success = false;
        }

        return success;
    }

    bool loadConfigFile(const std::string& path, analysis::CheckerConfig& config, std::vector<ConfigIssue>& issues)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            addIssue(issues, 0, "TAGC-E1020", "unable to open configuration file '" + path + "'");
            return false;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return parseConfigText(buffer.str(), config, issues);
    }
} // namespace tagcheck
