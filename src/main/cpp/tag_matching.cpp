#include <algorithm>
#include <cstddef>
#include <span>
#include <string_view>

#include "vellum/util/case_transform.hpp"
#include "vellum/util/chars.hpp"
#include "vellum/util/unicode.hpp"

#include "vellum/tag_matching.hpp"

namespace vellum {

namespace {

[[nodiscard]]
constexpr char32_t normalize_attribute_char(char32_t c) noexcept
{
    return c == char32_t(attribute_word_separator_alt) ? char32_t(attribute_word_separator) : c;
}

/// @brief Returns `true` iff `candidate` with every `_` replaced by `-`
/// equals `expected`, ignoring case.
/// Both strings are compared code point by code point using their simple uppercase mappings.
[[nodiscard]]
bool equals_normalized_ignore_case(std::u8string_view candidate, std::u8string_view expected)
{
    while (!candidate.empty() && !expected.empty()) {
        const auto [c, c_length] = utf8::decode_and_length_or_replacement(candidate);
        const auto [e, e_length] = utf8::decode_and_length_or_replacement(expected);
        if (simple_to_upper(normalize_attribute_char(c)) != simple_to_upper(e)) {
            return false;
        }
        candidate.remove_prefix(std::size_t(c_length));
        expected.remove_prefix(std::size_t(e_length));
    }
    return candidate.empty() && expected.empty();
}

} // namespace

const Rule_Set& Rule_Set::none() noexcept
{
    static const Rule_Set instance {};
    return instance;
}

bool attribute_satisfies(std::u8string_view required, std::u8string_view candidate) noexcept
{
    if (candidate == required) {
        return true;
    }
    if (required.starts_with(directive_binding_prefix)) {
        const std::u8string_view unprefixed = required.substr(directive_binding_prefix.length());
        return equals_normalized_ignore_case(candidate, unprefixed);
    }
    return equals_normalized_ignore_case(candidate, required);
}

bool rule_matches(
    const Rule_Descriptor& rule,
    std::u8string_view tag_name,
    std::span<const std::u8string_view> attribute_names
) noexcept
{
    if (!rule.is_wildcard() && !equals_ignore_case(rule.tag_name, tag_name)) {
        return false;
    }
    return std::ranges::all_of(rule.required_attributes, [&](std::u8string_view required) {
        return std::ranges::any_of(attribute_names, [&](std::u8string_view candidate) {
            return attribute_satisfies(required, candidate);
        });
    });
}

bool Tag_Matcher::matches(
    std::u8string_view tag_name,
    std::span<const std::u8string_view> attribute_names
) const noexcept
{
    return std::ranges::any_of(m_rules->rules, [&](const Rule_Descriptor& rule) {
        return rule_matches(rule, tag_name, attribute_names);
    });
}

} // namespace vellum
