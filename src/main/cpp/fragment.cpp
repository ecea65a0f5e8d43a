#include <array>
#include <cstddef>
#include <expected>
#include <span>
#include <string_view>

#include "vellum/util/assert.hpp"

#include "vellum/fragment.hpp"
#include "vellum/settings.hpp"

namespace vellum {

namespace {

[[nodiscard]]
consteval std::array<Interned_Char, interned_char_count> make_interned_chars()
{
    static_assert(interned_char_count <= 0x800, "Interned code points must fit in two code units.");

    std::array<Interned_Char, interned_char_count> result {};
    for (std::size_t c = 0; c < interned_char_count; ++c) {
        if (c < 0x80) {
            result[c] = { .code_units = { char8_t(c), 0 }, .length = 1 };
        }
        else {
            result[c] = {
                .code_units = { char8_t(0xc0 | (c >> 6)), char8_t(0x80 | (c & 0x3f)) },
                .length = 2,
            };
        }
    }
    return result;
}

constinit const std::array<Interned_Char, interned_char_count> interned_char_table
    = make_interned_chars();

struct Fragment_Text_Visitor {
    [[nodiscard]]
    std::u8string_view operator()(const Interned_Char* c) const noexcept
    {
        return c->str();
    }

    [[nodiscard]]
    std::u8string_view operator()(const Owned_Text& text) const noexcept
    {
        return text.str();
    }

    [[nodiscard]]
    std::u8string_view operator()(const Borrowed_Span& span) const noexcept
    {
        return span.str();
    }

    [[nodiscard]]
    std::u8string_view operator()(const Copied_Span& span) const noexcept
    {
        return span.str();
    }
};

} // namespace

std::span<const Interned_Char, interned_char_count> interned_chars() noexcept
{
    return interned_char_table;
}

const Interned_Char& interned_char(char32_t c) noexcept
{
    VELLUM_ASSERT(c < interned_char_count);
    return interned_char_table[c];
}

std::expected<Fragment, Fragment_Error> Fragment::borrow(std::span<const char8_t> buffer)
{
    if (buffer.data() == nullptr) {
        return std::unexpected { Fragment_Error::invalid_argument };
    }
    return Fragment { variant_type { Borrowed_Span {
        .buffer = buffer,
        .offset = 0,
        .length = buffer.size(),
    } } };
}

std::expected<Fragment, Fragment_Error>
Fragment::borrow(std::span<const char8_t> buffer, std::size_t offset, std::size_t length)
{
    if (buffer.data() == nullptr) {
        return std::unexpected { Fragment_Error::invalid_argument };
    }
    if (offset > buffer.size() || length > buffer.size() - offset) {
        return std::unexpected { Fragment_Error::out_of_range };
    }
    if (offset == 0 && length == buffer.size()) {
        return borrow(buffer);
    }
    return Fragment { variant_type { Borrowed_Span {
        .buffer = buffer,
        .offset = offset,
        .length = length,
    } } };
}

std::u8string_view Fragment::str() const noexcept
{
    return std::visit(Fragment_Text_Visitor {}, m_value);
}

} // namespace vellum
