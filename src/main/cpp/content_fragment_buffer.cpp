#include <algorithm>
#include <cstddef>
#include <expected>
#include <memory_resource>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vellum/util/assert.hpp"
#include "vellum/util/chars.hpp"
#include "vellum/util/unicode.hpp"

#include "vellum/content_fragment_buffer.hpp"
#include "vellum/diagnostic.hpp"
#include "vellum/fragment.hpp"
#include "vellum/fragment_sink.hpp"
#include "vellum/scratch_pool.hpp"

namespace vellum {

namespace {

/// @brief Ensures that one more element can be pushed to `v` without reallocation,
/// while keeping geometric growth.
template <typename T>
void reserve_one_more(std::pmr::vector<T>& v)
{
    if (v.size() == v.capacity()) {
        v.reserve(std::max<std::size_t>(v.capacity() * 2, 8));
    }
}

[[nodiscard]]
constexpr std::u8string_view diagnostic_id_of(Fragment_Error error)
{
    switch (error) {
    case Fragment_Error::invalid_argument: return diagnostic::fragment_invalid_argument;
    case Fragment_Error::out_of_range: return diagnostic::fragment_out_of_range;
    case Fragment_Error::invalid_code_point: return diagnostic::fragment_invalid_code_point;
    }
    VELLUM_ASSERT_UNREACHABLE(u8"Invalid fragment error.");
}

} // namespace

Content_Fragment_Buffer::Content_Fragment_Buffer(const Buffer_Options& options)
    : m_memory { options.memory ? options.memory : std::pmr::get_default_resource() }
    , m_scratch_pool { options.scratch_pool ? options.scratch_pool : Global_Scratch_Pool::get() }
    , m_logger { options.logger ? options.logger : &ignorant_logger }
    , m_newline { options.newline, m_memory }
    , m_fragments { m_memory }
    , m_pooled { m_memory }
{
}

Content_Fragment_Buffer::Content_Fragment_Buffer(Content_Fragment_Buffer&& other) noexcept
    : m_memory { other.m_memory }
    , m_scratch_pool { other.m_scratch_pool }
    , m_logger { other.m_logger }
    , m_newline { std::move(other.m_newline) }
    , m_fragments { std::move(other.m_fragments) }
    , m_pooled { std::move(other.m_pooled) }
{
    // The blocks now belong to this buffer and must not be released by other.
    other.m_pooled.clear();
}

Content_Fragment_Buffer::~Content_Fragment_Buffer()
{
    dispose();
}

Write_Result Content_Fragment_Buffer::write_char(char32_t c)
{
    if (c < interned_char_count) {
        m_fragments.push_back(Fragment::interned(c));
        return {};
    }
    if (!is_scalar_value(c)) {
        log_rejected(Fragment_Error::invalid_code_point);
        return std::unexpected { Fragment_Error::invalid_code_point };
    }
    const utf8::Code_Units_And_Length encoded = utf8::encode8_unchecked(c);
    m_fragments.push_back(Fragment::owned(encoded.as_string(), m_memory));
    return {};
}

void Content_Fragment_Buffer::write_text(std::u8string_view text)
{
    m_fragments.push_back(Fragment::owned(text, m_memory));
}

Write_Result Content_Fragment_Buffer::write_chars(std::span<const char8_t> buffer)
{
    std::expected<Fragment, Fragment_Error> fragment = Fragment::borrow(buffer);
    if (!fragment) {
        log_rejected(fragment.error());
        return std::unexpected { fragment.error() };
    }
    m_fragments.push_back(std::move(*fragment));
    return {};
}

Write_Result Content_Fragment_Buffer::write_chars(
    std::span<const char8_t> buffer,
    std::size_t offset,
    std::size_t length
)
{
    if (offset == 0 && length == buffer.size()) {
        return write_chars(buffer);
    }
    std::expected<Fragment, Fragment_Error> fragment = Fragment::borrow(buffer, offset, length);
    if (!fragment) {
        log_rejected(fragment.error());
        return std::unexpected { fragment.error() };
    }
    m_fragments.push_back(std::move(*fragment));
    return {};
}

void Content_Fragment_Buffer::write_span(std::span<const char8_t> span)
{
    // Both pushes below must not allocate,
    // so that the lease is only given up once the write has fully succeeded.
    reserve_one_more(m_fragments);
    reserve_one_more(m_pooled);

    Scratch_Lease lease { *m_scratch_pool, span.size() };
    std::ranges::copy(span, lease.get().begin());

#ifdef VELLUM_EXCEPTIONS
    try {
#endif
        m_fragments.push_back(Fragment::copy(lease.get(), m_memory));
#ifdef VELLUM_EXCEPTIONS
    } catch (const std::bad_alloc&) {
        lease.reset();
        m_logger->log(
            Severity::warning, diagnostic::scratch_copy_failed,
            u8"Failed to copy a transient character span; nothing was written."
        );
        throw;
    }
#endif
    m_pooled.push_back(lease.take());
}

void Content_Fragment_Buffer::write_line()
{
    const bool newline_is_ascii
        = std::ranges::all_of(m_newline, [](char8_t c) { return is_ascii(c); });
    if (newline_is_ascii) {
        for (const char8_t c : m_newline) {
            m_fragments.push_back(Fragment::interned(c));
        }
    }
    else {
        write_text(m_newline);
    }
}

Write_Result Content_Fragment_Buffer::write_line(char32_t c)
{
    Write_Result result = write_char(c);
    if (result) {
        write_line();
    }
    return result;
}

void Content_Fragment_Buffer::write_line(std::u8string_view text)
{
    write_text(text);
    write_line();
}

Write_Result Content_Fragment_Buffer::write_line(
    std::span<const char8_t> buffer,
    std::size_t offset,
    std::size_t length
)
{
    Write_Result result = write_chars(buffer, offset, length);
    if (result) {
        write_line();
    }
    return result;
}

void Content_Fragment_Buffer::emit(Fragment_Sink& out) const
{
    for (const Fragment& fragment : m_fragments) {
        out.write(fragment);
    }
}

void Content_Fragment_Buffer::emit(Text_Sink& out) const
{
    Text_Fragment_Sink fragment_out { out };
    emit(fragment_out);
}

std::pmr::u8string Content_Fragment_Buffer::to_string(std::pmr::memory_resource* memory) const
{
    std::pmr::u8string result { memory };
    result.reserve(text_length());
    for (const Fragment& fragment : m_fragments) {
        result += fragment.str();
    }
    return result;
}

void Content_Fragment_Buffer::dispose() noexcept
{
    for (const std::span<char8_t> block : m_pooled) {
        m_scratch_pool->release(block);
    }
    m_pooled.clear();
}

void Content_Fragment_Buffer::reserve(std::size_t n)
{
    m_fragments.reserve(n);
    m_pooled.reserve(n);
}

std::size_t Content_Fragment_Buffer::text_length() const noexcept
{
    std::size_t result = 0;
    for (const Fragment& fragment : m_fragments) {
        result += fragment.size();
    }
    return result;
}

void Content_Fragment_Buffer::log_rejected(Fragment_Error error)
{
    m_logger->log(Severity::error, diagnostic_id_of(error), fragment_error_message(error));
}

} // namespace vellum
