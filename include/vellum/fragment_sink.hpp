#ifndef VELLUM_FRAGMENT_SINK_HPP
#define VELLUM_FRAGMENT_SINK_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <utility>
#include <vector>

#include "vellum/util/buffer.hpp"
#include "vellum/util/strings.hpp"

#include "vellum/fragment.hpp"
#include "vellum/fwd.hpp"
#include "vellum/settings.hpp"

namespace vellum {

/// @brief Receives fragments in write order and performs the final output.
struct Fragment_Sink {
    virtual ~Fragment_Sink() = default;

    virtual void write(const Fragment& fragment) = 0;
};

/// @brief Receives UTF-8 text in write order.
struct Text_Sink {
    virtual ~Text_Sink() = default;

    virtual void write(std::u8string_view text) = 0;
};

/// @brief A `Fragment_Sink` which forwards the text of each fragment to a `Text_Sink`.
struct Text_Fragment_Sink final : Fragment_Sink {
private:
    Text_Sink& m_out;

public:
    [[nodiscard]]
    explicit Text_Fragment_Sink(Text_Sink& out) noexcept
        : m_out { out }
    {
    }

    void write(const Fragment& fragment) final
    {
        if (!fragment.empty()) {
            m_out.write(fragment.str());
        }
    }
};

/// @brief A `Text_Sink` which collects all text into a `std::pmr::vector`.
struct Vector_Text_Sink final : Text_Sink {
private:
    std::pmr::vector<char8_t> m_out;

public:
    [[nodiscard]]
    explicit Vector_Text_Sink(std::pmr::memory_resource* memory)
        : m_out { memory }
    {
    }

    [[nodiscard]]
    std::pmr::vector<char8_t>& operator*() &
    {
        return m_out;
    }

    [[nodiscard]]
    const std::pmr::vector<char8_t>& operator*() const&
    {
        return m_out;
    }

    [[nodiscard]]
    std::pmr::vector<char8_t>&& operator*() &&
    {
        return std::move(m_out);
    }

    [[nodiscard]]
    std::u8string_view str() const noexcept
    {
        return as_u8string_view(m_out);
    }

    void write(std::u8string_view text) final
    {
        m_out.insert(m_out.end(), text.begin(), text.end());
    }
};

struct Text_Sink_Forwarder {
    Text_Sink& parent;

    void operator()(std::u8string_view text) const
    {
        parent.write(text);
    }
};

/// @brief A `Fragment_Sink` which coalesces fragments into chunks of up to `cap` code units
/// before handing them to a `Text_Sink`.
/// This turns long runs of single-character fragments into few writes.
/// Pending text is forwarded on destruction,
/// but a failure of the `Text_Sink` at that point is not propagated;
/// call `flush()` first to observe it.
template <std::size_t cap = default_text_sink_buffer_size>
struct Buffered_Text_Sink final : Fragment_Sink {
private:
    Code_Unit_Buffer<cap, Text_Sink_Forwarder> m_buffer;

public:
    [[nodiscard]]
    explicit Buffered_Text_Sink(Text_Sink& parent) noexcept
        : m_buffer { Text_Sink_Forwarder { parent } }
    {
    }

    VELLUM_HOT
    void write(const Fragment& fragment) final
    {
        m_buffer.append(fragment.str());
    }

    /// @brief Returns the text which has not been forwarded yet.
    [[nodiscard]]
    std::u8string_view pending() const noexcept
    {
        return m_buffer.str();
    }

    void flush()
    {
        m_buffer.flush();
    }
};

} // namespace vellum

#endif
