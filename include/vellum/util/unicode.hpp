#ifndef VELLUM_UNICODE_HPP
#define VELLUM_UNICODE_HPP

#include "ulight/impl/unicode.hpp"

namespace vellum::utf8 {

using ulight::utf8::Code_Point_And_Length;
using ulight::utf8::Code_Units_And_Length;
using ulight::utf8::decode_and_length_or_replacement;
using ulight::utf8::encode8_unchecked;

} // namespace vellum::utf8

#endif
