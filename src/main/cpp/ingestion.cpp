#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/regex.hpp>

#include "cslc/util/io.hpp"
#include "cslc/util/result.hpp"
#include "cslc/util/strings.hpp"

#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/settings.hpp"
#include "cslc/style.hpp"
#include "cslc/style_node.hpp"
#include "cslc/xml.hpp"

using namespace std::string_view_literals;

namespace cslc {
namespace {

constexpr std::u8string_view utf8_byte_order_mark = u8"\uFEFF";

[[nodiscard]]
std::u8string_view skip_byte_order_mark(std::u8string_view text)
{
    if (text.starts_with(utf8_byte_order_mark)) {
        text.remove_prefix(utf8_byte_order_mark.length());
    }
    return text;
}

} // namespace

bool is_inline_style(std::u8string_view style)
{
    style = skip_byte_order_mark(style);
    const std::size_t blanks = length_blank_left(style);
    return blanks <= inline_style_max_leading_blanks && blanks < style.length()
        && style[blanks] == u8'<';
}

bool scan_year_suffix_variable(std::u8string_view text)
{
    static const boost::regex pattern { R"(variable="year-suffix")",
                                        boost::regex::literal | boost::regex::icase };
    const std::string_view chars = as_string_view(text);
    return boost::regex_search(chars.data(), chars.data() + chars.size(), pattern);
}

Result<Parsed_Style, Style_Error>
parse_style_source(std::u8string_view style, Compile_Context& context)
{
    std::pmr::vector<char8_t> file_text { context.get_memory() };
    std::u8string_view text = style;
    if (!is_inline_style(style)) {
        const Result<void, IO_Error_Code> loaded = load_utf8_file(file_text, style);
        if (!loaded) {
            context.try_error(
                diagnostic::style_input, u8"Failed to load style \""sv, style, u8"\": "sv,
                io_error_code_message(loaded.error())
            );
            return Style_Error::input;
        }
        text = as_u8string_view(file_text);
    }
    text = skip_byte_order_mark(text);

    const bool uses_year_suffix_variable = scan_year_suffix_variable(text);

    Result<Style_Node, Style_Error> root = parse_xml(text, context);
    if (!root) {
        return root.error();
    }
    return Parsed_Style {
        .uses_year_suffix_variable = uses_year_suffix_variable,
        .root = strip_comments(std::move(*root)),
    };
}

} // namespace cslc
