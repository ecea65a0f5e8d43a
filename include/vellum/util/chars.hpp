#ifndef VELLUM_CHARS_HPP
#define VELLUM_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/unicode.hpp"
#include "ulight/impl/unicode_chars.hpp"

namespace vellum {

using ulight::is_ascii;
using ulight::is_scalar_value;

/// @brief The separator used between words of attribute names in markup,
/// such as in `data-value`.
inline constexpr char8_t attribute_word_separator = u8'-';

/// @brief The alternative separator which template authors may use instead of
/// `attribute_word_separator`, such as in `data_value`.
inline constexpr char8_t attribute_word_separator_alt = u8'_';

} // namespace vellum

#endif
