#include <array>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>

#include <gtest/gtest.h>

#include "vellum/fragment.hpp"

#include "test_resources.hpp"

using namespace std::string_view_literals;

namespace vellum {
namespace {

TEST(Fragment, interned_table)
{
    const std::span<const Interned_Char, interned_char_count> table = interned_chars();
    for (std::size_t c = 0; c < table.size(); ++c) {
        EXPECT_EQ(table[c].code_point(), char32_t(c));
        EXPECT_EQ(table[c].str().length(), c < 0x80 ? 1 : 2);
        EXPECT_EQ(&interned_char(char32_t(c)), &table[c]);
    }
    EXPECT_EQ(interned_char(U'a').str(), u8"a"sv);
    EXPECT_EQ(interned_char(U'é').str(), u8"é"sv);
    EXPECT_EQ(interned_char(U'ÿ').str(), u8"ÿ"sv);
    EXPECT_EQ(interned_char(0).str(), std::u8string_view(u8"\0", 1));
}

TEST(Fragment, interned_identity)
{
    const Fragment a = Fragment::interned(U'<');
    const Fragment b = Fragment::interned(U'<');

    EXPECT_EQ(a.kind(), Fragment_Kind::interned_char);
    EXPECT_EQ(a.as_interned(), b.as_interned());
    EXPECT_EQ(a.str().data(), b.str().data());
    EXPECT_EQ(a.as_owned(), nullptr);
    EXPECT_EQ(a.as_borrowed(), nullptr);
    EXPECT_EQ(a.as_copied(), nullptr);
}

TEST(Fragment, owned)
{
    std::pmr::monotonic_buffer_resource memory;
    const Fragment fragment = Fragment::owned(u8"text", &memory);

    EXPECT_EQ(fragment.kind(), Fragment_Kind::owned_text);
    ASSERT_NE(fragment.as_owned(), nullptr);
    EXPECT_EQ(fragment.str(), u8"text"sv);
    EXPECT_EQ(fragment.size(), 4);
    EXPECT_EQ(fragment.as_interned(), nullptr);
}

TEST(Fragment, borrow_whole)
{
    static constexpr std::u8string_view text = u8"borrowed";
    const auto fragment = Fragment::borrow(as_chars(text));

    ASSERT_TRUE(fragment);
    EXPECT_EQ(fragment->kind(), Fragment_Kind::borrowed_span);
    EXPECT_EQ(fragment->str(), text);
    EXPECT_EQ(fragment->str().data(), text.data());
    ASSERT_NE(fragment->as_borrowed(), nullptr);
    EXPECT_TRUE(fragment->as_borrowed()->covers_whole_buffer());
}

TEST(Fragment, borrow_range)
{
    static constexpr std::u8string_view text = u8"borrowed";

    const auto range = Fragment::borrow(as_chars(text), 2, 3);
    ASSERT_TRUE(range);
    EXPECT_EQ(range->str(), u8"rro"sv);
    EXPECT_FALSE(range->as_borrowed()->covers_whole_buffer());

    const auto whole = Fragment::borrow(as_chars(text), 0, text.size());
    ASSERT_TRUE(whole);
    EXPECT_EQ(*whole->as_borrowed(), *Fragment::borrow(as_chars(text))->as_borrowed());

    const auto empty_tail = Fragment::borrow(as_chars(text), text.size(), 0);
    ASSERT_TRUE(empty_tail);
    EXPECT_TRUE(empty_tail->empty());
}

TEST(Fragment, borrow_null)
{
    const auto whole = Fragment::borrow(std::span<const char8_t> {});
    ASSERT_FALSE(whole);
    EXPECT_EQ(whole.error(), Fragment_Error::invalid_argument);

    const auto range = Fragment::borrow(std::span<const char8_t> {}, 0, 0);
    ASSERT_FALSE(range);
    EXPECT_EQ(range.error(), Fragment_Error::invalid_argument);
}

TEST(Fragment, borrow_out_of_range)
{
    static constexpr std::u8string_view text = u8"abc";

    EXPECT_EQ(Fragment::borrow(as_chars(text), 4, 0).error(), Fragment_Error::out_of_range);
    EXPECT_EQ(Fragment::borrow(as_chars(text), 1, 3).error(), Fragment_Error::out_of_range);
    EXPECT_EQ(
        Fragment::borrow(as_chars(text), 1, std::size_t(-1)).error(), Fragment_Error::out_of_range
    );
}

TEST(Fragment, copy_is_independent)
{
    std::pmr::monotonic_buffer_resource memory;
    std::array<char8_t, 2> data { u8'o', u8'k' };

    const Fragment fragment = Fragment::copy(data, &memory);
    data[0] = u8'n';

    EXPECT_EQ(fragment.kind(), Fragment_Kind::copied_span);
    EXPECT_EQ(fragment.str(), u8"ok"sv);
}

TEST(Fragment, names_and_messages)
{
    EXPECT_EQ(fragment_kind_name(Fragment_Kind::interned_char), u8"interned_char"sv);
    EXPECT_EQ(fragment_kind_name(Fragment_Kind::copied_span), u8"copied_span"sv);
    EXPECT_FALSE(fragment_error_message(Fragment_Error::invalid_argument).empty());
    EXPECT_FALSE(fragment_error_message(Fragment_Error::out_of_range).empty());
    EXPECT_FALSE(fragment_error_message(Fragment_Error::invalid_code_point).empty());
}

} // namespace
} // namespace vellum
