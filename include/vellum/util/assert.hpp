#ifndef VELLUM_ASSERT_HPP
#define VELLUM_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace vellum {

using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define VELLUM_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define VELLUM_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define VELLUM_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)
#define VELLUM_DEBUG_ASSERT_UNREACHABLE(...) ULIGHT_DEBUG_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace vellum

#endif
