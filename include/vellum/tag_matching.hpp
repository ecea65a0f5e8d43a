#ifndef VELLUM_TAG_MATCHING_HPP
#define VELLUM_TAG_MATCHING_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vellum/fwd.hpp"

namespace vellum {

/// @brief The tag name pattern which matches any tag.
inline constexpr std::u8string_view tag_name_wildcard = u8"*";

/// @brief The prefix of attributes which bind to a parameter of a native directive.
/// Templates may omit this prefix, so `for` satisfies a required `asp-for`.
inline constexpr std::u8string_view directive_binding_prefix = u8"asp-";

/// @brief Describes which tag name and which attributes identify a native directive.
struct Rule_Descriptor {
    /// @brief Either `tag_name_wildcard` or a tag name, compared case-insensitively using simple case mappings.
    std::u8string tag_name;
    /// @brief Names of attributes which all have to be present.
    std::vector<std::u8string> required_attributes;

    [[nodiscard]]
    bool is_wildcard() const noexcept
    {
        return tag_name == tag_name_wildcard;
    }
};

/// @brief The complete set of rules under which a native directive applies.
/// Rule sets are built once by the directive registry and never mutated afterwards.
struct Rule_Set {
    /// @brief The name of the directive.
    std::u8string name;
    /// @brief Identifies where the directive was defined, such as the library providing it.
    std::u8string origin;
    std::vector<Rule_Descriptor> rules;

    /// @brief Returns the shared empty rule set, which matches nothing.
    [[nodiscard]]
    static const Rule_Set& none() noexcept;

    [[nodiscard]]
    bool empty() const noexcept
    {
        return rules.empty();
    }
};

/// @brief Returns `true` iff the attribute `candidate`, as written in a template,
/// satisfies the attribute `required` by a rule.
///
/// That is the case if they are equal, or if
/// - `required` starts with `directive_binding_prefix` and `candidate`,
///   with every `_` replaced by `-`, is equal to the rest of `required`,
///   ignoring case, or
/// - `required` does not start with `directive_binding_prefix` and `candidate`,
///   with every `_` replaced by `-`, is equal to `required`, ignoring case.
///
/// Case is ignored by comparing the simple uppercase mappings of each code point.
[[nodiscard]]
bool attribute_satisfies(std::u8string_view required, std::u8string_view candidate) noexcept;

/// @brief Returns `true` iff `rule` applies to a tag named `tag_name`
/// with the given attributes.
[[nodiscard]]
bool rule_matches(
    const Rule_Descriptor& rule,
    std::u8string_view tag_name,
    std::span<const std::u8string_view> attribute_names
) noexcept;

/// @brief Decides whether a tag invocation should be handed to the native directive
/// described by a `Rule_Set`.
/// A matcher holds no mutable state and can be shared between threads.
struct Tag_Matcher {
private:
    const Rule_Set* m_rules;

public:
    /// @brief Constructs a matcher which matches nothing.
    [[nodiscard]]
    Tag_Matcher() noexcept
        : m_rules { &Rule_Set::none() }
    {
    }

    /// @brief Constructs a matcher for `rules`.
    /// `rules` shall outlive the matcher.
    [[nodiscard]]
    explicit Tag_Matcher(const Rule_Set& rules) noexcept
        : m_rules { &rules }
    {
    }

    [[nodiscard]]
    const Rule_Set& rule_set() const noexcept
    {
        return *m_rules;
    }

    /// @brief Returns `true` iff any rule of the rule set applies to a tag named `tag_name`
    /// with the given attributes, which are names as they appear in the template.
    [[nodiscard]]
    bool matches(std::u8string_view tag_name, std::span<const std::u8string_view> attribute_names)
        const noexcept;
};

} // namespace vellum

#endif
