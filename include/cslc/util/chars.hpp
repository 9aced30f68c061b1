#ifndef CSLC_CHARS_HPP
#define CSLC_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/lang/html_chars.hpp"

namespace cslc {

using ulight::is_html_whitespace;
using ulight::to_ascii_lower;

/// @brief Returns true if `c` is a blank character.
/// This matches the C locale definition,
/// and includes vertical tabs,
/// unlike `is_ascii_whitespace`.
[[nodiscard]]
constexpr bool is_ascii_blank(char8_t c)
{
    return is_html_whitespace(c) || c == u8'\v';
}

} // namespace cslc

#endif
