#ifndef CSLC_STRINGS_HPP
#define CSLC_STRINGS_HPP

#include <cstddef>
#include <span>
#include <string_view>

#include "cslc/util/chars.hpp"

namespace cslc {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

namespace detail {

/// @brief Rudimentary version of `std::ranges::all_of` to avoid including all of `<algorithm>`
template <typename R, typename Predicate>
[[nodiscard]]
constexpr bool all_of(R&& r, Predicate predicate) // NOLINT(cppcoreguidelines-missing-std-forward)
{
    for (const auto& e : r) { // NOLINT(readability-use-anyofallof)
        if (!predicate(e)) {
            return false;
        }
    }
    return true;
}

} // namespace detail

/// @brief Returns `true` if `str` is a possibly empty ASCII string comprised
/// entirely of blank ASCII characters (`is_ascii_blank`).
[[nodiscard]]
constexpr bool is_ascii_blank(std::u8string_view str)
{
    constexpr auto predicate = [](char8_t x) { return is_ascii_blank(x); };
    return detail::all_of(str, predicate);
}

[[nodiscard]]
constexpr std::size_t length_blank_left(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_ascii_blank(str[i])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_left(std::u8string_view str)
{
    return str.substr(length_blank_left(str));
}

/// @brief Returns `true` iff `x` and `y` are equal when ASCII letters are compared
/// regardless of case.
[[nodiscard]]
constexpr bool equals_ascii_ignore_case(std::u8string_view x, std::u8string_view y)
{
    if (x.length() != y.length()) {
        return false;
    }
    for (std::size_t i = 0; i < x.length(); ++i) {
        if (to_ascii_lower(x[i]) != to_ascii_lower(y[i])) {
            return false;
        }
    }
    return true;
}

/// @brief Calls `f` for each of the substrings of `str` that are separated by blank characters.
/// Empty substrings are skipped, so `"  a  b "` yields `"a"` and `"b"`.
template <typename F>
constexpr void for_each_blank_separated(std::u8string_view str, F f)
{
    while (!str.empty()) {
        str = trim_ascii_blank_left(str);
        std::size_t length = 0;
        while (length < str.length() && !is_ascii_blank(str[length])) {
            ++length;
        }
        if (length != 0) {
            f(str.substr(0, length));
        }
        str.remove_prefix(length);
    }
}

} // namespace cslc

#endif
