#ifndef VELLUM_CASE_TRANSFORM_HPP
#define VELLUM_CASE_TRANSFORM_HPP

#include <string_view>

namespace vellum {

/// @brief Returns the value of the `Simple_Uppercase_Mapping` property of `c`,
/// or `c` itself if `c` is not a code point with such a property.
[[nodiscard]]
char32_t simple_to_upper(char32_t c);

/// @brief Returns the value of the `Simple_Lowercase_Mapping` property of `c`,
/// or `c` itself if `c` is not a code point with such a property.
[[nodiscard]]
char32_t simple_to_lower(char32_t c);

/// @brief Returns `true` iff `x` and `y` consist of the same code points
/// after applying `simple_to_upper` to each of them.
/// Ill-formed code units are treated as U+FFFD REPLACEMENT CHARACTER.
[[nodiscard]]
bool equals_ignore_case(std::u8string_view x, std::u8string_view y);

} // namespace vellum

#endif
