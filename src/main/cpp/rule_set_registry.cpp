#include <cstddef>
#include <span>
#include <string_view>
#include <utility>

#include "vellum/diagnostic.hpp"
#include "vellum/settings.hpp"
#include "vellum/rule_set_registry.hpp"
#include "vellum/tag_matching.hpp"

namespace vellum {

bool Rule_Set_Registry::insert(Rule_Set&& rules)
{
    if (m_by_name.contains(std::u8string_view { rules.name })) {
        m_logger->log(
            Severity::warning, diagnostic::rule_set_duplicate,
            u8"A rule set with the same directive name is already registered; "
            u8"the new one was ignored."
        );
        return false;
    }
    const std::size_t index = m_sets.size();
    const Rule_Set& stored = m_sets.emplace_back(std::move(rules));
#ifdef VELLUM_EXCEPTIONS
    try {
#endif
        m_matchers.emplace_back(stored);
#ifdef VELLUM_EXCEPTIONS
    } catch (...) {
        rules = std::move(m_sets.back());
        m_sets.pop_back();
        throw;
    }
    try {
#endif
        m_by_name.emplace(std::u8string_view { stored.name }, index);
#ifdef VELLUM_EXCEPTIONS
    } catch (...) {
        m_matchers.pop_back();
        rules = std::move(m_sets.back());
        m_sets.pop_back();
        throw;
    }
#endif
    return true;
}

const Rule_Set* Rule_Set_Registry::find(std::u8string_view name) const
{
    const auto it = m_by_name.find(name);
    return it == m_by_name.end() ? nullptr : &m_sets[it->second];
}

const Rule_Set& Rule_Set_Registry::resolve(
    std::u8string_view tag_name,
    std::span<const std::u8string_view> attribute_names
) const
{
    for (const Tag_Matcher& matcher : m_matchers) {
        if (matcher.matches(tag_name, attribute_names)) {
            return matcher.rule_set();
        }
    }
    m_logger->log(
        Severity::debug, diagnostic::rule_set_unresolved,
        u8"No native directive applies to the tag; it is treated as plain markup."
    );
    return Rule_Set::none();
}

} // namespace vellum
