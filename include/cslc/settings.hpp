#ifndef CSLC_SETTINGS_HPP
#define CSLC_SETTINGS_HPP

#include <cstddef>

namespace cslc {

/// @brief The amount of leading blank characters that may precede the `<`
/// of an inline style before the input is treated as a file path instead.
inline constexpr std::size_t inline_style_max_leading_blanks = 16;

/// @brief The locale used when neither the caller nor the style requests one.
inline constexpr char8_t fallback_locale[] = u8"en-US";

} // namespace cslc

#endif
