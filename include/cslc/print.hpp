#ifndef CSLC_PRINT_HPP
#define CSLC_PRINT_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "cslc/fwd.hpp"

namespace cslc {

/// @brief Appends a human-readable, indented tree representation of `node` to `out`.
/// Each node occupies one line, indented by two spaces per level of nesting,
/// starting at `indent_level`.
void dump(std::pmr::u8string& out, const Render_Node& node, std::size_t indent_level = 0);

/// @brief Appends a human-readable summary of `style` to `out`,
/// including its options, the trees of its layouts, sorts, and macros,
/// and its locale data.
void dump(std::pmr::u8string& out, const Compiled_Style& style);

std::ostream& operator<<(std::ostream& out, std::u8string_view str);

} // namespace cslc

#endif
