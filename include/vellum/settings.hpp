#ifndef VELLUM_SETTINGS_HPP
#define VELLUM_SETTINGS_HPP

#include <cstddef>
#include <string_view>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define VELLUM_DEBUG 1
#define VELLUM_IF_DEBUG(...) __VA_ARGS__
#define VELLUM_IF_NOT_DEBUG(...)
#else // release builds
#define VELLUM_IF_DEBUG(...)
#define VELLUM_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#define VELLUM_HOT ULIGHT_HOT
#define VELLUM_COLD ULIGHT_COLD

#ifdef ULIGHT_EXCEPTIONS
#define VELLUM_EXCEPTIONS ULIGHT_EXCEPTIONS
#endif

namespace vellum {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = VELLUM_IF_DEBUG(true) VELLUM_IF_NOT_DEBUG(false);

/// @brief The number of code points (starting at U+0000) for which single-character
/// fragments are interned, i.e. shared process-wide instead of allocated per write.
inline constexpr std::size_t interned_char_count = 256;

/// @brief The newline sequence appended by `write_line` unless configured otherwise.
inline constexpr std::u8string_view default_newline = u8"\n";

/// @brief The buffer size for `Buffered_Text_Sink`s when no other size is chosen.
inline constexpr std::size_t default_text_sink_buffer_size = 512;

} // namespace vellum

#endif
