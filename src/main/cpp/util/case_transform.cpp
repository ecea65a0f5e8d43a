#include <cstddef>
#include <string_view>

#include <unicode/uchar.h>

#include "vellum/util/case_transform.hpp"
#include "vellum/util/unicode.hpp"

namespace vellum {

char32_t simple_to_upper(char32_t c)
{
    return char32_t(u_toupper(UChar32(c)));
}

char32_t simple_to_lower(char32_t c)
{
    return char32_t(u_tolower(UChar32(c)));
}

bool equals_ignore_case(std::u8string_view x, std::u8string_view y)
{
    while (!x.empty() && !y.empty()) {
        const auto [x_point, x_length] = utf8::decode_and_length_or_replacement(x);
        const auto [y_point, y_length] = utf8::decode_and_length_or_replacement(y);
        if (simple_to_upper(x_point) != simple_to_upper(y_point)) {
            return false;
        }
        x.remove_prefix(std::size_t(x_length));
        y.remove_prefix(std::size_t(y_length));
    }
    return x.empty() && y.empty();
}

} // namespace vellum
