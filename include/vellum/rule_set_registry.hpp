#ifndef VELLUM_RULE_SET_REGISTRY_HPP
#define VELLUM_RULE_SET_REGISTRY_HPP

#include <cstddef>
#include <deque>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "vellum/util/transparent_comparison.hpp"

#include "vellum/fwd.hpp"
#include "vellum/services.hpp"
#include "vellum/tag_matching.hpp"

namespace vellum {

/// @brief Holds the rule sets of all registered native directives,
/// and resolves tag invocations to the directive responsible for them.
///
/// Registration happens during setup.
/// Once rendering has started, the registry is only read,
/// and references to its rule sets remain valid for its lifetime.
struct Rule_Set_Registry {
private:
    // std::deque never relocates its elements, so matchers can refer to them.
    std::pmr::deque<Rule_Set> m_sets;
    std::pmr::deque<Tag_Matcher> m_matchers;
    std::pmr::unordered_map<
        std::u8string_view,
        std::size_t,
        Transparent_String_View_Hash8,
        Transparent_String_View_Equals8>
        m_by_name;
    Logger* m_logger;

public:
    [[nodiscard]]
    explicit Rule_Set_Registry(
        Logger& logger = ignorant_logger,
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    )
        : m_sets { memory }
        , m_matchers { memory }
        , m_by_name { memory }
        , m_logger { &logger }
    {
    }

    Rule_Set_Registry(const Rule_Set_Registry&) = delete;
    Rule_Set_Registry& operator=(const Rule_Set_Registry&) = delete;

    /// @brief Registers `rules` under `rules.name`.
    /// @returns `true` iff no rule set with the same name was registered before.
    /// Otherwise, the registry is unchanged.
    /// If registration throws, the registry is also left unchanged.
    bool insert(Rule_Set&& rules);

    /// @brief Returns the rule set registered under `name`, or null if there is none.
    [[nodiscard]]
    const Rule_Set* find(std::u8string_view name) const;

    /// @brief Returns the first registered rule set, in registration order,
    /// which matches a tag named `tag_name` with the given attributes,
    /// or `Rule_Set::none()` if there is no such rule set.
    [[nodiscard]]
    const Rule_Set& resolve(
        std::u8string_view tag_name,
        std::span<const std::u8string_view> attribute_names
    ) const;

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_sets.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_sets.empty();
    }
};

} // namespace vellum

#endif
