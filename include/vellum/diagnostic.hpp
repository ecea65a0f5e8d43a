#ifndef VELLUM_DIAGNOSTIC_HPP
#define VELLUM_DIAGNOSTIC_HPP

#include <string_view>

#include "vellum/util/severity.hpp"

#include "vellum/fwd.hpp"

namespace vellum {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// FRAGMENT BUFFER DIAGNOSTICS =====================================================================

/// @brief A range write was given an absent (null) buffer.
inline constexpr std::u8string_view fragment_invalid_argument = u8"fragment.invalid-argument";

/// @brief A range write was given an offset and length exceeding the buffer.
inline constexpr std::u8string_view fragment_out_of_range = u8"fragment.out-of-range";

/// @brief A single character was a surrogate or greater than U+10FFFF.
/// @see is_scalar_value
inline constexpr std::u8string_view fragment_invalid_code_point = u8"fragment.invalid-code-point";
/// @brief Copying a transient span into durable storage failed.
/// The scratch block was returned to its pool and nothing was written.
inline constexpr std::u8string_view scratch_copy_failed = u8"scratch.copy-failed";

// RULE SET DIAGNOSTICS ============================================================================

/// @brief A tag matched no registered rule set and is treated as plain markup.
inline constexpr std::u8string_view rule_set_unresolved = u8"rule-set.unresolved";

/// @brief A rule set was registered under a name that is already taken.
inline constexpr std::u8string_view rule_set_duplicate = u8"rule-set.duplicate";

} // namespace diagnostic

} // namespace vellum

#endif
