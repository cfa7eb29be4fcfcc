#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tagcheck
{
    struct CommandLineOptions
    {
        std::vector<std::string> inputPaths;
        // Tag key and naming case pairs from --rule, in command-line order.
        std::vector<std::pair<std::string, std::string>> rules;
        std::optional<std::string> configPath;
        std::optional<bool> useFieldName;
        bool reportMalformedTags{false};
        bool verbose{false};
        bool showHelp{false};
        bool showVersion{false};
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument.rfind("--rule=", 0) == 0)
                {
                    if (!addRule(options, argument.substr(7)))
                    {
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument == "--rule")
                {
                    if (index + 1 >= argc)
                    {
                        std::cerr << "TAGC-E1003 MissingRule: expected <key>=<case> after --rule option.\n";
                        return std::nullopt;
                    }
                    if (!addRule(options, argv[++index]))
                    {
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--config=", 0) == 0)
                {
                    options.configPath = std::string{argument.substr(9)};
                    continue;
                }

                if (argument == "--config")
                {
                    if (index + 1 >= argc)
                    {
                        std::cerr << "TAGC-E1005 MissingConfig: expected path after --config option.\n";
                        return std::nullopt;
                    }
                    options.configPath = std::string{argv[++index]};
                    continue;
                }

                if (argument == "--use-field-name")
                {
                    options.useFieldName = true;
                    continue;
                }

                if (argument == "--no-use-field-name")
                {
                    options.useFieldName = false;
                    continue;
                }

                if (argument == "--report-malformed-tags")
                {
                    options.reportMalformedTags = true;
                    continue;
                }

                if (argument == "--verbose" || argument == "-v")
                {
                    options.verbose = true;
                    continue;
                }

                if (!argument.empty() && argument[0] == '-')
                {
                    std::cerr << "TAGC-E1001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                options.inputPaths.emplace_back(argument);
            }

            if (options.inputPaths.empty())
            {
                std::cerr << "TAGC-E1002 MissingInput: at least one input file is required.\n";
                return std::nullopt;
            }

            return options;
        }

    private:
        static bool addRule(CommandLineOptions& options, std::string_view rule)
        {
            const std::size_t separator = rule.find('=');
            if (separator == std::string_view::npos || separator == 0)
            {
                std::cerr << "TAGC-E1004 InvalidRule: expected <key>=<case>, got '" << rule << "'.\n";
                return false;
            }

            options.rules.emplace_back(std::string{rule.substr(0, separator)}, std::string{rule.substr(separator + 1)});
            return true;
        }
    };
} // namespace tagcheck
