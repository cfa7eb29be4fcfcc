#include <gtest/gtest.h>

#include "command_line.hpp"

#include <iterator>

namespace
{
    TEST(CommandLineParserTest, ParsesRuleEqualsForm)
    {
        const char* argv[] = {
            "tagcheck",
            "--rule=json=camel",
            "model.go"
        };

        tagcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_EQ(options->rules.size(), 1u);
        EXPECT_EQ(options->rules.front().first, "json");
        EXPECT_EQ(options->rules.front().second, "camel");
        ASSERT_EQ(options->inputPaths.size(), 1u);
        EXPECT_EQ(options->inputPaths.front(), "model.go");
    }

    TEST(CommandLineParserTest, ParsesRepeatedRuleSeparateArgument)
    {
        const char* argv[] = {
            "tagcheck",
            "--rule",
            "json=snake",
            "--rule",
            "yaml=",
            "a.go",
            "b.go"
        };

        tagcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_EQ(options->rules.size(), 2u);
        EXPECT_EQ(options->rules[0].first, "json");
        EXPECT_EQ(options->rules[0].second, "snake");
        EXPECT_EQ(options->rules[1].first, "yaml");
        EXPECT_TRUE(options->rules[1].second.empty());
        EXPECT_EQ(options->inputPaths.size(), 2u);
    }

    TEST(CommandLineParserTest, MissingRuleValueFails)
    {
        const char* argv[] = {
            "tagcheck",
            "--rule"
        };

        tagcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, RuleWithoutKeyFails)
    {
        const char* argv[] = {
            "tagcheck",
            "--rule=camel",
            "model.go"
        };

        tagcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        EXPECT_FALSE(options.has_value());

        const char* emptyKey[] = {
            "tagcheck",
            "--rule==camel",
            "model.go"
        };
        options = parser.parse(static_cast<int>(std::size(emptyKey)), const_cast<char**>(emptyKey));
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, LastFieldNameFlagWins)
    {
        const char* argv[] = {
            "tagcheck",
            "--use-field-name",
            "--no-use-field-name",
            "model.go"
        };

        tagcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_TRUE(options->useFieldName.has_value());
        EXPECT_FALSE(*options->useFieldName);
    }

    TEST(CommandLineParserTest, FieldNameFlagDefaultsToUnset)
    {
        const char* argv[] = {
            "tagcheck",
            "model.go"
        };

        tagcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_FALSE(options->useFieldName.has_value());
        EXPECT_FALSE(options->reportMalformedTags);
        EXPECT_FALSE(options->verbose);
        EXPECT_FALSE(options->configPath.has_value());
    }

    TEST(CommandLineParserTest, ParsesConfigAndReportingFlags)
    {
        const char* argv[] = {
            "tagcheck",
            "--config=tagcheck.conf",
            "--report-malformed-tags",
            "--verbose",
            "model.go"
        };

        tagcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_TRUE(options->configPath.has_value());
        EXPECT_EQ(*options->configPath, "tagcheck.conf");
        EXPECT_TRUE(options->reportMalformedTags);
        EXPECT_TRUE(options->verbose);
    }

    TEST(CommandLineParserTest, MissingConfigPathFails)
    {
        const char* argv[] = {
            "tagcheck",
            "model.go",
            "--config"
        };

        tagcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, UnknownOptionFails)
    {
        const char* argv[] = {
            "tagcheck",
            "--fix",
            "model.go"
        };

        tagcheck::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, RequiresInputUnlessHelpOrVersion)
    {
        tagcheck::CommandLineParser parser;

        const char* noInput[] = {"tagcheck", "--rule=json=camel"};
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(noInput)), const_cast<char**>(noInput)).has_value());

        const char* help[] = {"tagcheck", "--help"};
        auto helpOptions = parser.parse(static_cast<int>(std::size(help)), const_cast<char**>(help));
        ASSERT_TRUE(helpOptions.has_value());
        EXPECT_TRUE(helpOptions->showHelp);

        const char* version[] = {"tagcheck", "--version"};
        auto versionOptions = parser.parse(static_cast<int>(std::size(version)), const_cast<char**>(version));
        ASSERT_TRUE(versionOptions.has_value());
        EXPECT_TRUE(versionOptions->showVersion);
    }
} // namespace
