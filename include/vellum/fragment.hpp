#ifndef VELLUM_FRAGMENT_HPP
#define VELLUM_FRAGMENT_HPP

#include <array>
#include <cstddef>
#include <expected>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "vellum/util/assert.hpp"
#include "vellum/util/strings.hpp"

#include "vellum/fwd.hpp"
#include "vellum/settings.hpp"

namespace vellum {

enum struct Fragment_Kind : Default_Underlying {
    /// @brief A single code point below `interned_char_count`,
    /// shared process-wide.
    interned_char,
    /// @brief A complete string owned by the fragment.
    owned_text,
    /// @brief A view into a caller-supplied buffer which outlives the fragment.
    borrowed_span,
    /// @brief An independent copy of data whose lifetime could not be trusted.
    copied_span,
};

[[nodiscard]]
constexpr std::u8string_view fragment_kind_name(Fragment_Kind kind)
{
    using enum Fragment_Kind;
    switch (kind) {
        VELLUM_ENUM_STRING_CASE8(interned_char);
        VELLUM_ENUM_STRING_CASE8(owned_text);
        VELLUM_ENUM_STRING_CASE8(borrowed_span);
        VELLUM_ENUM_STRING_CASE8(copied_span);
    }
    VELLUM_ASSERT_UNREACHABLE(u8"Invalid fragment kind.");
}

enum struct Fragment_Error : Default_Underlying {
    /// @brief The backing buffer of a range fragment is absent.
    invalid_argument,
    /// @brief The requested range does not lie within the backing buffer.
    out_of_range,
    /// @brief A character is not a Unicode scalar value, so it has no UTF-8 encoding.
    invalid_code_point,
};

[[nodiscard]]
constexpr std::u8string_view fragment_error_message(Fragment_Error error)
{
    switch (error) {
    case Fragment_Error::invalid_argument:
        return u8"The buffer of a character range must not be null.";
    case Fragment_Error::out_of_range:
        return u8"The character range exceeds the bounds of its buffer.";
    case Fragment_Error::invalid_code_point:
        return u8"The character is not a Unicode scalar value and cannot be encoded as UTF-8.";
    }
    VELLUM_ASSERT_UNREACHABLE(u8"Invalid fragment error.");
}

/// @brief The UTF-8 encoding of a single code point in `[0, interned_char_count)`.
/// Objects of this type only exist within the table returned by `interned_chars()`,
/// so two fragments for the same code point refer to the same object.
struct Interned_Char {
    std::array<char8_t, 2> code_units;
    unsigned char length;

    [[nodiscard]]
    constexpr std::u8string_view str() const noexcept
    {
        return { code_units.data(), length };
    }

    [[nodiscard]]
    constexpr char32_t code_point() const noexcept
    {
        return length == 1 ? char32_t(code_units[0])
                           : char32_t(((code_units[0] & 0x1f) << 6) | (code_units[1] & 0x3f));
    }
};

/// @brief Returns the process-wide table of interned characters,
/// where the element at index `c` holds the encoding of the code point `c`.
[[nodiscard]]
std::span<const Interned_Char, interned_char_count> interned_chars() noexcept;

/// @brief Returns the interned character for `c`.
/// `c < interned_char_count` shall be `true`.
[[nodiscard]]
const Interned_Char& interned_char(char32_t c) noexcept;

struct Owned_Text {
    std::pmr::u8string text;

    [[nodiscard]]
    std::u8string_view str() const noexcept
    {
        return text;
    }
};

struct Borrowed_Span {
    /// @brief The whole buffer as handed over by the writer.
    std::span<const char8_t> buffer;
    std::size_t offset;
    std::size_t length;

    [[nodiscard]]
    constexpr std::u8string_view str() const noexcept
    {
        return as_u8string_view(buffer.subspan(offset, length));
    }

    [[nodiscard]]
    constexpr bool covers_whole_buffer() const noexcept
    {
        return offset == 0 && length == buffer.size();
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Borrowed_Span& x, const Borrowed_Span& y) noexcept
    {
        return x.buffer.data() == y.buffer.data() && x.buffer.size() == y.buffer.size()
            && x.offset == y.offset && x.length == y.length;
    }
};

struct Copied_Span {
    std::pmr::vector<char8_t> data;

    [[nodiscard]]
    std::u8string_view str() const noexcept
    {
        return as_u8string_view(data);
    }
};

/// @brief An immutable piece of already formatted output awaiting emission.
struct Fragment {
    using variant_type = std::variant<const Interned_Char*, Owned_Text, Borrowed_Span, Copied_Span>;

private:
    variant_type m_value;

    [[nodiscard]]
    explicit Fragment(variant_type&& value) noexcept
        : m_value { std::move(value) }
    {
    }

public:
    /// @brief Returns the fragment for the interned character `c`.
    /// `c < interned_char_count` shall be `true`.
    [[nodiscard]]
    static Fragment interned(char32_t c) noexcept
    {
        return Fragment { variant_type { &interned_char(c) } };
    }

    /// @brief Returns a fragment holding a copy of `text`, allocated from `memory`.
    [[nodiscard]]
    static Fragment owned(std::u8string_view text, std::pmr::memory_resource* memory)
    {
        return Fragment { variant_type { Owned_Text { std::pmr::u8string(text, memory) } } };
    }

    /// @brief Returns a fragment which views the whole `buffer` without copying.
    /// Fails with `Fragment_Error::invalid_argument` if `buffer.data()` is null.
    [[nodiscard]]
    static std::expected<Fragment, Fragment_Error> borrow(std::span<const char8_t> buffer);

    /// @brief Returns a fragment which views `length` elements of `buffer` starting at `offset`.
    /// If the range covers the whole buffer, the result is the same as `borrow(buffer)`.
    /// Fails with `Fragment_Error::invalid_argument` if `buffer.data()` is null,
    /// and with `Fragment_Error::out_of_range` if the range exceeds `buffer`.
    [[nodiscard]]
    static std::expected<Fragment, Fragment_Error>
    borrow(std::span<const char8_t> buffer, std::size_t offset, std::size_t length);

    /// @brief Returns a fragment holding an independent copy of `data`,
    /// allocated from `memory`.
    [[nodiscard]]
    static Fragment copy(std::span<const char8_t> data, std::pmr::memory_resource* memory)
    {
        std::pmr::vector<char8_t> copied(data.begin(), data.end(), memory);
        return Fragment { variant_type { Copied_Span { std::move(copied) } } };
    }

    [[nodiscard]]
    Fragment_Kind kind() const noexcept
    {
        return Fragment_Kind(m_value.index());
    }

    /// @brief Returns the text of this fragment.
    /// The result is a view into the fragment, the interned table,
    /// or the borrowed buffer, and is never materialized.
    [[nodiscard]]
    std::u8string_view str() const noexcept;

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return str().size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return str().empty();
    }

    [[nodiscard]]
    const Interned_Char* as_interned() const noexcept
    {
        const auto* const result = std::get_if<const Interned_Char*>(&m_value);
        return result ? *result : nullptr;
    }

    [[nodiscard]]
    const Owned_Text* as_owned() const noexcept
    {
        return std::get_if<Owned_Text>(&m_value);
    }

    [[nodiscard]]
    const Borrowed_Span* as_borrowed() const noexcept
    {
        return std::get_if<Borrowed_Span>(&m_value);
    }

    [[nodiscard]]
    const Copied_Span* as_copied() const noexcept
    {
        return std::get_if<Copied_Span>(&m_value);
    }

    template <typename F>
    decltype(auto) visit(F&& f) const
    {
        return std::visit(std::forward<F>(f), m_value);
    }
};

static_assert(std::variant_size_v<Fragment::variant_type> == 4);

} // namespace vellum

#endif
