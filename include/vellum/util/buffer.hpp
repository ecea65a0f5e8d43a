#ifndef VELLUM_BUFFER_HPP
#define VELLUM_BUFFER_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include "vellum/util/assert.hpp"

#include "vellum/settings.hpp"

namespace vellum {

/// @brief A fixed-capacity staging area for code units,
/// which hands its contents to `Sink` whenever it runs full or is flushed.
/// Pending contents are flushed on destruction.
/// If the sink fails during that final flush, the pending contents are discarded,
/// so `flush()` should be called explicitly wherever a failure has to be observed.
template <std::size_t cap, std::invocable<std::u8string_view> Sink>
    requires(cap != 0)
struct Code_Unit_Buffer {
private:
    char8_t m_buffer[cap];
    [[no_unique_address]]
    Sink m_sink;

    std::size_t m_size = 0;

public:
    [[nodiscard]]
    constexpr explicit Code_Unit_Buffer(Sink sink) noexcept(
        std::is_nothrow_move_constructible_v<Sink>
    )
        : m_sink { std::move(sink) }
    {
    }

    Code_Unit_Buffer(const Code_Unit_Buffer&) = delete;
    Code_Unit_Buffer& operator=(const Code_Unit_Buffer&) = delete;

    constexpr ~Code_Unit_Buffer()
    {
#ifdef VELLUM_EXCEPTIONS
        try {
#endif
            flush();
#ifdef VELLUM_EXCEPTIONS
        } catch (...) {
            // The pending text is lost.
        }
#endif
    }

    [[nodiscard]]
    constexpr std::size_t capacity() const noexcept
    {
        return cap;
    }

    /// @brief Returns the number of code units currently in the buffer.
    /// `size() <= capacity()` is always `true`.
    [[nodiscard]]
    constexpr std::size_t size() const noexcept
    {
        return m_size;
    }

    /// @brief Equivalent to `capacity() - size()`.
    [[nodiscard]]
    constexpr std::size_t available() const noexcept
    {
        return cap - m_size;
    }

    [[nodiscard]]
    constexpr bool full() const noexcept
    {
        return m_size == cap;
    }

    [[nodiscard]]
    constexpr bool empty() const noexcept
    {
        return m_size == 0;
    }

    /// @brief Appends `text`, flushing as many times as necessary.
    /// Text which is at least as long as the capacity bypasses the buffer.
    VELLUM_HOT
    constexpr void append(std::u8string_view text)
    {
        if (text.size() >= cap) {
            flush();
            m_sink(text);
            return;
        }
        while (!text.empty()) {
            if (full()) {
                flush();
            }
            const std::size_t chunk_size = std::min(available(), text.size());
            VELLUM_DEBUG_ASSERT(chunk_size != 0);
            std::ranges::copy(text.substr(0, chunk_size), m_buffer + m_size);
            text.remove_prefix(chunk_size);
            m_size += chunk_size;
        }
    }

    /// @brief Returns a view of what is currently in the buffer.
    /// This view is invalidated by any operation which changes buffer contents.
    [[nodiscard]]
    constexpr std::u8string_view str() const noexcept
    {
        return { m_buffer, m_size };
    }

    /// @brief Writes any buffered text to the underlying sink and empties the buffer.
    /// The buffer is empty afterwards even if the sink throws,
    /// so the same text is never handed to the sink twice.
    constexpr void flush()
    {
        if (m_size != 0) {
            const std::size_t size = std::exchange(m_size, 0);
            m_sink(std::u8string_view { m_buffer, size });
        }
    }
};

} // namespace vellum

#endif
