#include "../analysis/checker_config.hpp"
#include "../analysis/struct_walker.hpp"
#include "../frontend/lexer.hpp"
#include "../frontend/parser.hpp"
#include "command_line.hpp"
#include "config_file.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifndef TAGCHECK_VERSION
#define TAGCHECK_VERSION "0.1.0"
#endif

namespace tagcheck
{
    namespace
    {
        constexpr int kExitClean = 0;
        constexpr int kExitFindings = 1;
        constexpr int kExitFailure = 2;

        template <typename DiagnosticT>
        void printDiagnostic(std::ostream& stream, const std::string& path, const DiagnosticT& diagnostic)
        {
            stream << diagnostic.code << ' ' << path
                   << ":L" << diagnostic.span.begin.line << ":C" << diagnostic.span.begin.column
                   << " -> " << diagnostic.message << '\n';
        }
    } // namespace

    void printHelp()
    {
        std::cout << "tagcheck - struct tag naming convention checker for Go sources\n"
                  << "Usage: tagcheck [options] <file.go>...\n\n"
                  << "Options:\n"
                  << "  --help                    Show this help text and exit.\n"
                  << "  --version                 Show version information and exit.\n"
                  << "  --rule <key>=<case>       Check the values of tag key against a naming case (repeatable).\n"
                  << "  --rule=<key>=<case>       Same as --rule <key>=<case>.\n"
                  << "  --config=<path>           Read settings from a configuration file.\n"
                  << "  --use-field-name          Derive expected tag values from field names.\n"
                  << "  --no-use-field-name       Derive expected tag values from the tag values (default).\n"
                  << "  --report-malformed-tags   Report tags that do not follow the key:\"value\" syntax.\n"
                  << "  --verbose, -v             Print progress notices.\n\n"
                  << "Cases: camel, pascal, kebab, snake, goCamel, goPascal, goKebab, goSnake, upper, lower.\n";
    }

    void printVersion()
    {
        std::cout << "tagcheck " << TAGCHECK_VERSION << '\n';
    }

    std::optional<std::string> loadFile(const std::string& path)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    // Config file first, command-line flags override it.
    std::optional<analysis::CheckerConfig> buildConfig(const CommandLineOptions& options)
    {
        analysis::CheckerConfig config;

        if (options.configPath.has_value())
        {
            std::vector<ConfigIssue> issues;
            if (!loadConfigFile(*options.configPath, config, issues))
            {
                for (const auto& issue : issues)
                {
                    std::cerr << issue.code << ' ' << *options.configPath << ":L" << issue.line
                              << " -> " << issue.message << '\n';
                }
                return std::nullopt;
            }
        }

        for (const auto& [key, convention] : options.rules)
        {
            config.rules[key] = convention;
        }

        if (options.useFieldName.has_value())
        {
            config.useFieldName = *options.useFieldName;
        }

        if (options.reportMalformedTags)
        {
            config.reportMalformedTags = true;
        }

        std::vector<analysis::Diagnostic> diagnostics;
        if (!analysis::validateConfig(config, diagnostics))
        {
            for (const auto& diagnostic : diagnostics)
            {
                std::cerr << diagnostic.code << " InvalidRule: " << diagnostic.message << '\n';
            }
            return std::nullopt;
        }

        return config;
    }

    int runChecker(const CommandLineOptions& options)
    {
        const auto config = buildConfig(options);
        if (!config.has_value())
        {
            return kExitFailure;
        }

        if (options.verbose)
        {
            std::cout << "[information] Starting tagcheck.\n";
            for (const auto& [key, convention] : config->rules)
            {
                std::cout << "  rule: " << key << " -> " << (convention.empty() ? "(disabled)" : convention) << '\n';
            }
            std::cout << "  use-field-name: " << (config->useFieldName ? "true" : "false") << '\n';
            if (!analysis::hasActiveRules(*config))
            {
                std::cout << "[notice] No active rules; nothing to check.\n";
            }
        }

        bool failed = false;
        std::size_t findings = 0;

        for (const auto& path : options.inputPaths)
        {
            const auto content = loadFile(path);
            if (!content.has_value())
            {
                std::cerr << "TAGC-E3000 InputReadFailed: unable to open '" << path << "'.\n";
                failed = true;
                continue;
            }

            frontend::Lexer lexer{*content};
            lexer.lex();
            if (!lexer.diagnostics().empty())
            {
                for (const auto& diagnostic : lexer.diagnostics())
                {
                    printDiagnostic(std::cerr, path, diagnostic);
                }
                failed = true;
                continue;
            }

            frontend::Parser parser{lexer.tokens()};
            const frontend::CompilationUnit unit = parser.parse();
            if (!parser.diagnostics().empty())
            {
                for (const auto& diagnostic : parser.diagnostics())
                {
                    printDiagnostic(std::cerr, path, diagnostic);
                }
                failed = true;
                continue;
            }

            analysis::StructWalker walker{unit, *config};
            walker.walk();

            for (const auto& diagnostic : walker.diagnostics())
            {
                printDiagnostic(std::cout, path, diagnostic);
            }
            findings += walker.diagnostics().size();

            if (options.verbose)
            {
                std::cout << "[notice] Checked '" << path << "' (package " << unit.package.name
                          << ", structs: " << walker.structsVisited()
                          << ", fields: " << walker.fieldsChecked()
                          << ", findings: " << walker.diagnostics().size() << ").\n";
            }
        }

        if (failed)
        {
            std::cerr << "TAGC-W3001 Check incomplete: one or more inputs could not be analysed.\n";
            return kExitFailure;
        }

        return findings == 0 ? kExitClean : kExitFindings;
    }
} // namespace tagcheck

int main(int argc, char** argv)
{
    tagcheck::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 2;
    }

    if (options->showHelp)
    {
        tagcheck::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        tagcheck::printVersion();
        return 0;
    }

    return tagcheck::runChecker(options.value());
}
