#ifndef CSLC_XML_HPP
#define CSLC_XML_HPP

#include <string_view>

#include "cslc/util/result.hpp"

#include "cslc/fwd.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"

namespace cslc {

/// @brief Parses `text` as an XML document and returns its root element.
/// Comments are retained as comment nodes; see `strip_comments`.
/// Malformed XML (including empty input) results in `Style_Error::parse`,
/// and a `diagnostic::xml_parse` error is logged.
/// Attribute names are stored without namespace prefix,
/// so `xml:lang` becomes `lang`.
[[nodiscard]]
Result<Style_Node, Style_Error> parse_xml(std::u8string_view text, Compile_Context& context);

} // namespace cslc

#endif
