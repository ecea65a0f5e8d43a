#ifndef VELLUM_CONTENT_FRAGMENT_BUFFER_HPP
#define VELLUM_CONTENT_FRAGMENT_BUFFER_HPP

#include <coroutine>
#include <cstddef>
#include <expected>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "vellum/fragment.hpp"
#include "vellum/fragment_sink.hpp"
#include "vellum/fwd.hpp"
#include "vellum/scratch_pool.hpp"
#include "vellum/services.hpp"
#include "vellum/settings.hpp"

namespace vellum {

struct Buffer_Options {
    /// @brief The sequence appended by `write_line`.
    std::u8string_view newline = default_newline;
    /// @brief The pool from which `write_span` obtains scratch memory.
    /// If null, `Global_Scratch_Pool::get()` is used.
    Scratch_Pool* scratch_pool = nullptr;
    /// @brief The memory for fragments and bookkeeping.
    /// If null, `std::pmr::get_default_resource()` is used.
    std::pmr::memory_resource* memory = nullptr;
    /// @brief Receives diagnostics about rejected or failed writes.
    Logger* logger = &ignorant_logger;
};

/// @brief The awaitable result of an asynchronous-style write.
/// The write has always completed by the time this object exists,
/// so awaiting it never suspends.
struct [[nodiscard]] Completed_Write {
    [[nodiscard]]
    constexpr bool await_ready() const noexcept
    {
        return true;
    }

    constexpr void await_suspend(std::coroutine_handle<>) const noexcept { }

    constexpr void await_resume() const noexcept { }
};

/// @brief Like `Completed_Write`, but carrying the result of the write.
template <typename T>
struct [[nodiscard]] Completed_Write_Result {
    T result;

    [[nodiscard]]
    constexpr bool await_ready() const noexcept
    {
        return true;
    }

    constexpr void await_suspend(std::coroutine_handle<>) const noexcept { }

    [[nodiscard]]
    constexpr T await_resume() noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        return std::move(result);
    }
};

using Write_Result = std::expected<void, Fragment_Error>;

/// @brief Accumulates the output of a single render pass as a sequence of fragments,
/// and later emits them in write order.
///
/// Whole strings and whole buffers are stored without being concatenated,
/// single characters below `interned_char_count` are not allocated at all,
/// and only transient spans given to `write_span` are copied.
///
/// A buffer is owned by exactly one render pass and is not safe for concurrent use.
struct Content_Fragment_Buffer {
private:
    std::pmr::memory_resource* m_memory;
    Scratch_Pool* m_scratch_pool;
    Logger* m_logger;
    std::pmr::u8string m_newline;
    std::pmr::vector<Fragment> m_fragments;
    std::pmr::vector<std::span<char8_t>> m_pooled;

public:
    [[nodiscard]]
    explicit Content_Fragment_Buffer(const Buffer_Options& options = {});

    [[nodiscard]]
    Content_Fragment_Buffer(Content_Fragment_Buffer&& other) noexcept;

    Content_Fragment_Buffer(const Content_Fragment_Buffer&) = delete;
    Content_Fragment_Buffer& operator=(const Content_Fragment_Buffer&) = delete;
    Content_Fragment_Buffer& operator=(Content_Fragment_Buffer&&) = delete;

    ~Content_Fragment_Buffer();

    /// @brief Appends the code point `c`.
    /// If `c < interned_char_count`, the shared interned fragment is appended,
    /// otherwise a new owned fragment holding the UTF-8 encoding of `c`.
    /// Fails with `Fragment_Error::invalid_code_point` if `c` is not a Unicode scalar value,
    /// in which case nothing is appended.
    VELLUM_HOT
    Write_Result write_char(char32_t c);

    /// @brief Appends `text` as a single owned fragment.
    void write_text(std::u8string_view text);

    /// @brief Appends a fragment which refers to the whole `buffer` without copying it.
    /// The contents of `buffer` shall not change until the buffer is emitted for the last time.
    /// Fails with `Fragment_Error::invalid_argument` if `buffer.data()` is null,
    /// in which case nothing is appended.
    [[nodiscard]]
    Write_Result write_chars(std::span<const char8_t> buffer);

    /// @brief Appends a fragment which refers to `length` code units of `buffer`
    /// starting at `offset`, without copying.
    /// If the range covers all of `buffer`, this is equivalent to `write_chars(buffer)`.
    /// Fails with `Fragment_Error::invalid_argument` if `buffer.data()` is null,
    /// and with `Fragment_Error::out_of_range` if the range exceeds `buffer`.
    /// On failure, nothing is appended.
    [[nodiscard]]
    Write_Result write_chars(std::span<const char8_t> buffer, std::size_t offset, std::size_t length);

    /// @brief Appends a copy of `span`, whose contents may change or vanish after the call.
    /// The data is first staged in a block from the scratch pool,
    /// which is retained until `dispose()`,
    /// and the stored fragment is a durable copy made from that block.
    /// If making the copy fails, the block is released before the failure propagates,
    /// and nothing is appended.
    void write_span(std::span<const char8_t> span);

    /// @brief Appends the configured newline sequence.
    void write_line();
    Write_Result write_line(char32_t c);
    void write_line(std::u8string_view text);
    [[nodiscard]]
    Write_Result write_line(std::span<const char8_t> buffer, std::size_t offset, std::size_t length);

    Completed_Write_Result<Write_Result> async_write_char(char32_t c)
    {
        return { write_char(c) };
    }

    Completed_Write async_write_text(std::u8string_view text)
    {
        write_text(text);
        return {};
    }

    Completed_Write_Result<Write_Result>
    async_write_chars(std::span<const char8_t> buffer, std::size_t offset, std::size_t length)
    {
        return { write_chars(buffer, offset, length) };
    }

    Completed_Write async_write_line()
    {
        write_line();
        return {};
    }

    Completed_Write_Result<Write_Result> async_write_line(char32_t c)
    {
        return { write_line(c) };
    }

    Completed_Write async_write_line(std::u8string_view text)
    {
        write_line(text);
        return {};
    }

    Completed_Write_Result<Write_Result>
    async_write_line(std::span<const char8_t> buffer, std::size_t offset, std::size_t length)
    {
        return { write_line(buffer, offset, length) };
    }

    /// @brief Writes every fragment to `out`, in write order.
    /// The buffer is left unchanged.
    void emit(Fragment_Sink& out) const;

    /// @brief Writes the text of every fragment to `out`, in write order.
    /// The buffer is left unchanged.
    void emit(Text_Sink& out) const;

    /// @brief Returns the concatenated text of all fragments.
    [[nodiscard]]
    std::pmr::u8string to_string(std::pmr::memory_resource* memory) const;

    /// @brief Releases every block obtained from the scratch pool, exactly once.
    /// Fragments remain valid and can still be emitted.
    /// Calling this more than once has no further effect.
    void dispose() noexcept;

    /// @brief Reserves bookkeeping for at least `n` fragments,
    /// and for `n` scratch blocks.
    void reserve(std::size_t n);

    [[nodiscard]]
    std::span<const Fragment> fragments() const noexcept
    {
        return m_fragments;
    }

    /// @brief Returns the number of fragments.
    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_fragments.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_fragments.empty();
    }

    /// @brief Returns the total length of all fragments, in code units.
    [[nodiscard]]
    std::size_t text_length() const noexcept;

    /// @brief Returns the number of scratch blocks which have yet to be released.
    [[nodiscard]]
    std::size_t pooled_count() const noexcept
    {
        return m_pooled.size();
    }

    [[nodiscard]]
    std::u8string_view newline() const noexcept
    {
        return m_newline;
    }

private:
    void log_rejected(Fragment_Error error);
};

} // namespace vellum

#endif
