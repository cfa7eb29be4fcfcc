#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagcheck::analysis
{
    struct TagEntry
    {
        std::string key;
        std::string value;
    };

    struct StructTag
    {
        // Entries up to the first syntax error, in source order.
        std::vector<TagEntry> entries;
        std::optional<std::string> error;

        [[nodiscard]] bool wellFormed() const noexcept
        {
            return !error.has_value();
        }
    };

    // Tag text of a literal: backticks trimmed from a raw literal, escapes resolved in
    // an interpreted one. Returns nullopt for an interpreted literal with a bad escape.
    [[nodiscard]] std::optional<std::string> tagText(std::string_view literal);

    // Full parse of a tag literal, recording the first syntax error.
    [[nodiscard]] StructTag parseStructTag(std::string_view literal);

    // First comma-separated segment of the value stored under key, so `json:"name,omitempty"`
    // yields "name". A missing key and malformed tag text both yield nullopt.
    [[nodiscard]] std::optional<std::string> lookupTagValue(std::string_view literal, std::string_view key);

    [[nodiscard]] std::optional<std::string> unquote(std::string_view quoted);
} // namespace tagcheck::analysis
