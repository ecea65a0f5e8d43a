#ifndef VELLUM_FWD_HPP
#define VELLUM_FWD_HPP

#include "vellum/settings.hpp"

VELLUM_IF_DEBUG() // silence unused warning for settings.hpp

namespace vellum {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define VELLUM_ENUM_STRING_CASE8(...)                                                              \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Borrowed_Span;
struct Buffer_Options;
struct Collecting_Logger;
struct Completed_Write;
template <typename T>
struct Completed_Write_Result;
struct Content_Fragment_Buffer;
struct Copied_Span;
struct Diagnostic;
struct Fragment;
enum struct Fragment_Error : Default_Underlying;
enum struct Fragment_Kind : Default_Underlying;
struct Fragment_Sink;
struct Global_Scratch_Pool;
struct Ignorant_Logger;
struct Interned_Char;
struct Logger;
struct Memory_Resource_Scratch_Pool;
struct Owned_Text;
struct Rule_Descriptor;
struct Rule_Set;
struct Rule_Set_Registry;
struct Scratch_Lease;
struct Scratch_Pool;
enum struct Severity : Default_Underlying;
struct Tag_Matcher;
struct Text_Fragment_Sink;
struct Text_Sink;
struct Vector_Text_Sink;

} // namespace vellum

#endif
