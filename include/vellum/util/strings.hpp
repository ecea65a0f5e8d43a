#ifndef VELLUM_STRINGS_HPP
#define VELLUM_STRINGS_HPP

#include <span>
#include <string_view>

namespace vellum {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
constexpr std::span<const char8_t> as_span(std::u8string_view text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
constexpr bool contains(std::u8string_view str, char8_t c)
{
    return str.find(c) != std::u8string_view::npos;
}

} // namespace vellum

#endif
