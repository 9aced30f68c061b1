#include <algorithm>
#include <charconv>
#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "cslc/util/assert.hpp"
#include "cslc/util/strings.hpp"

#include "cslc/options.hpp"
#include "cslc/print.hpp"
#include "cslc/render.hpp"
#include "cslc/style.hpp"
#include "cslc/style_node.hpp"
#include "cslc/terms.hpp"

namespace cslc {
namespace {

void append_indent(std::pmr::u8string& out, std::size_t level)
{
    out.append(level * 2, u8' ');
}

void append_integer(std::pmr::u8string& out, std::size_t x)
{
    char buffer[24];
    const std::to_chars_result r = std::to_chars(buffer, std::end(buffer), x);
    CSLC_ASSERT(r.ec == std::errc {});
    out.append(buffer, r.ptr);
}

void append_quoted(std::pmr::u8string& out, std::u8string_view text)
{
    out += u8'"';
    for (const char8_t c : text) {
        switch (c) {
        case u8'"': out += u8"\\\""; break;
        case u8'\\': out += u8"\\\\"; break;
        case u8'\n': out += u8"\\n"; break;
        case u8'\t': out += u8"\\t"; break;
        default: out += c; break;
        }
    }
    out += u8'"';
}

void append_attributes(std::pmr::u8string& out, std::span<const Style_Attribute> attributes)
{
    for (const Style_Attribute& attribute : attributes) {
        out += u8' ';
        out += attribute.name;
        out += u8'=';
        append_quoted(out, attribute.value);
    }
}

void dump_attribute_line(
    std::pmr::u8string& out,
    std::u8string_view label,
    std::span<const Style_Attribute> attributes,
    std::size_t indent_level
)
{
    append_indent(out, indent_level);
    out += label;
    out += u8':';
    append_attributes(out, attributes);
    out += u8'\n';
}

void dump_names(std::pmr::u8string& out, const Names_Node& names, std::size_t indent_level)
{
    append_indent(out, indent_level);
    out += u8"names[";
    bool first = true;
    for (const std::pmr::u8string& variable : names.variables) {
        if (!first) {
            out += u8' ';
        }
        out += variable;
        first = false;
    }
    out += u8']';
    append_attributes(out, names.attributes);
    out += u8'\n';

    if (names.has_name) {
        dump_attribute_line(out, u8"name", names.name_attributes, indent_level + 1);
        for (const Name_Part& part : names.name_parts) {
            dump_attribute_line(out, u8"name-part", part.attributes, indent_level + 2);
        }
    }
    if (names.has_et_al) {
        dump_attribute_line(out, u8"et-al", names.et_al_attributes, indent_level + 1);
    }
    if (names.has_label) {
        dump_attribute_line(out, u8"label", names.label_attributes, indent_level + 1);
    }
    if (!names.substitutions.empty()) {
        append_indent(out, indent_level + 1);
        out += u8"substitute:\n";
        for (const Render_Node& substitution : names.substitutions) {
            dump(out, substitution, indent_level + 2);
        }
    }
}

void dump_options(std::pmr::u8string& out, std::u8string_view heading, const Option_Map& options)
{
    out += heading;
    out += u8":\n";
    for (const Option& option : options) {
        append_indent(out, 1);
        out += option.name;
        out += u8" = ";
        append_quoted(out, option.value);
        out += u8'\n';
    }
}

void dump_layout(
    std::pmr::u8string& out,
    std::u8string_view heading,
    const std::optional<Layout>& layout,
    const std::optional<Sort>& sort
)
{
    out += heading;
    out += u8":\n";
    if (sort) {
        append_indent(out, 1);
        out += u8"sort orders:";
        for (const bool ascending : sort->orders) {
            out += ascending ? u8" ascending" : u8" descending";
        }
        out += u8'\n';
        dump(out, sort->function, 1);
    }
    if (layout) {
        dump(out, layout->function, 1);
    }
}

void dump_date_format(
    std::pmr::u8string& out,
    std::u8string_view heading,
    const std::optional<Date_Format>& format
)
{
    if (!format) {
        return;
    }
    dump_attribute_line(out, heading, format->attributes, 0);
    for (const Date_Part_Format& part : format->parts) {
        dump_attribute_line(out, u8"date-part", part.attributes, 1);
    }
}

} // namespace

void dump(std::pmr::u8string& out, const Render_Node& node, std::size_t indent_level)
{
    switch (node.get_kind()) {
    case Render_Node_Kind::text: {
        append_indent(out, indent_level);
        out += u8"text ";
        append_quoted(out, node.as_text().text);
        out += u8'\n';
        return;
    }
    case Render_Node_Kind::element: {
        const Render_Element& element = node.as_element();
        append_indent(out, indent_level);
        out += u8'<';
        out += render_tag_name(element.tag);
        append_attributes(out, element.attributes);
        out += u8">\n";
        for (const Render_Node& child : element.children) {
            dump(out, child, indent_level + 1);
        }
        return;
    }
    case Render_Node_Kind::names: {
        dump_names(out, node.as_names(), indent_level);
        return;
    }
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid render node kind.");
}

void dump(std::pmr::u8string& out, const Compiled_Style& style)
{
    out += u8"locale: ";
    out += style.locale;
    out += u8"\nnote style: ";
    out += style.cite_note ? u8"yes" : u8"no";
    out += u8"\nuses year-suffix: ";
    out += style.uses_year_suffix_variable ? u8"yes" : u8"no";
    out += u8'\n';

    dump_options(out, u8"options", style.options);
    dump_options(out, u8"citation options", style.cite_options);
    dump_options(out, u8"bibliography options", style.bib_options);
    dump_options(out, u8"locale options", style.locale_options);

    dump_layout(out, u8"citation", style.cite_layout, style.cite_sort);
    dump_layout(out, u8"bibliography", style.bib_layout, style.bib_sort);

    // Macros are printed in alphabetical order so that the dump is stable.
    std::pmr::vector<std::u8string_view> macro_names { out.get_allocator().resource() };
    macro_names.reserve(style.macros.size());
    for (const auto& entry : style.macros) {
        macro_names.push_back(entry.first);
    }
    std::ranges::sort(macro_names);
    for (const std::u8string_view name : macro_names) {
        out += u8"macro ";
        append_quoted(out, name);
        out += u8":\n";
        dump(out, *style.find_macro(name), 1);
    }

    dump_date_format(out, u8"date text", style.date_text);
    dump_date_format(out, u8"date numeric", style.date_numeric);

    out += u8"terms: ";
    append_integer(out, style.terms ? style.terms->size() : 0);
    out += u8'\n';
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

} // namespace cslc
