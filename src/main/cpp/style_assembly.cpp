#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cslc/util/result.hpp"

#include "cslc/compile.hpp"
#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/locale.hpp"
#include "cslc/options.hpp"
#include "cslc/render.hpp"
#include "cslc/style.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"

using namespace std::string_view_literals;

namespace cslc {
namespace {

/// @brief Returns the first element among `nodes` at or after `start`, or `nullptr`.
[[nodiscard]]
const Style_Node* next_element(std::span<const Style_Node> nodes, std::size_t& start)
{
    for (; start < nodes.size(); ++start) {
        if (nodes[start].is_element()) {
            return &nodes[start++];
        }
    }
    return nullptr;
}

[[nodiscard]]
Result<Sort, Style_Error> compile_sort(const Style_Node& node, Compile_Context& context)
{
    Result<Render_Node, Style_Error> function = compile_node(node, context);
    if (!function) {
        return function.error();
    }
    std::pmr::vector<bool> orders { context.get_memory() };
    for (const Style_Node& key : node.children) {
        if (key.is_element(u8"key")) {
            orders.push_back(key.attribute_or(u8"sort") != u8"descending");
        }
    }
    return Sort { .function = std::move(*function), .orders = std::move(orders) };
}

[[nodiscard]]
bool is_note_style(const Style_Node& info)
{
    for (const Style_Node& child : info.children) {
        if (child.is_element(u8"category")
            && child.attribute_or(u8"citation-format") == u8"note") {
            return true;
        }
    }
    return false;
}

} // namespace

Result<Layout_Fragment, Style_Error>
parse_layout_fragment(const Style_Node& node, Compile_Context& context)
{
    std::pmr::memory_resource* const memory = context.get_memory();

    std::size_t index = 0;
    const Style_Node* first = next_element(node.children, index);
    if (!first) {
        context.try_error(
            diagnostic::layout_missing, u8"<"sv, node.get_name(), u8"> has no <layout> child."sv
        );
        return Style_Error::structure;
    }

    const Style_Node* sort = nullptr;
    const Style_Node* layout = first;
    if (first->is_element(u8"sort")) {
        sort = first;
        layout = next_element(node.children, index);
        if (!layout) {
            context.try_error(
                diagnostic::layout_missing, u8"<"sv, node.get_name(),
                u8"> has a <sort> but no <layout> child."sv
            );
            return Style_Error::structure;
        }
    }
    if (!layout->is_element(u8"layout")) {
        context.try_error(
            diagnostic::layout_unexpected, u8"Expected <layout> in <"sv, node.get_name(),
            u8">, but found <"sv, layout->get_name(), u8">."sv
        );
        return Style_Error::structure;
    }

    Result<Render_Node, Style_Error> layout_function = compile_node(*layout, context);
    if (!layout_function) {
        return layout_function.error();
    }

    std::optional<Sort> compiled_sort;
    if (sort) {
        Result<Sort, Style_Error> s = compile_sort(*sort, context);
        if (!s) {
            return s.error();
        }
        compiled_sort = std::move(*s);
    }

    return Layout_Fragment {
        .options = Option_Map { node.attributes, memory },
        .layout = Layout { .function = std::move(*layout_function),
                           .attributes = copy_attributes(layout->attributes, memory) },
        .sort = std::move(compiled_sort),
    };
}

Result<Compiled_Style, Style_Error> assemble_style(
    const Style_Node& root,
    bool uses_year_suffix_variable,
    std::u8string_view requested_locale,
    Compile_Context& context
)
{
    std::pmr::memory_resource* const memory = context.get_memory();

    if (!root.is_element(u8"style")) {
        context.try_error(diagnostic::style_root, u8"The root element must be <style>."sv);
        return Style_Error::structure;
    }

    Compiled_Style style { memory };
    style.options = Option_Map { root.attributes, memory };
    style.uses_year_suffix_variable = uses_year_suffix_variable;
    style.default_locale = root.attribute_or(u8"default-locale");

    bool locale_loaded = false;
    for (const Style_Node& child : root.children) {
        if (!child.is_element()) {
            continue;
        }
        const std::optional<Style_Tag> tag = style_tag_by_name(child.get_name());
        if (!tag) {
            context.try_error(
                diagnostic::tag_unknown, u8"Unknown element <"sv, child.get_name(),
                u8"> in <style>."sv
            );
            return Style_Error::unknown_tag;
        }

        switch (*tag) {
        case Style_Tag::info: {
            style.info = child;
            style.cite_note = is_note_style(child);
            break;
        }
        case Style_Tag::locale: {
            const std::u8string_view lang = child.attribute_or(u8"lang");
            if (locale_loaded || !locale_is_compatible(lang, requested_locale)) {
                context.try_debug(
                    diagnostic::locale_ignored, u8"Ignoring <locale xml:lang=\""sv, lang,
                    u8"\"> for requested locale \""sv, requested_locale, u8"\"."sv
                );
                break;
            }
            merge_locale(style, child, context);
            locale_loaded = true;
            context.try_debug(
                diagnostic::locale_merged, u8"Merged <locale xml:lang=\""sv, lang, u8"\">."sv
            );
            break;
        }
        case Style_Tag::citation: {
            Result<Layout_Fragment, Style_Error> fragment = parse_layout_fragment(child, context);
            if (!fragment) {
                return fragment.error();
            }
            style.cite_options = std::move(fragment->options);
            style.cite_layout = std::move(fragment->layout);
            style.cite_sort = std::move(fragment->sort);
            break;
        }
        case Style_Tag::bibliography: {
            Result<Layout_Fragment, Style_Error> fragment = parse_layout_fragment(child, context);
            if (!fragment) {
                return fragment.error();
            }
            style.bib_options = std::move(fragment->options);
            style.bib_layout = std::move(fragment->layout);
            style.bib_sort = std::move(fragment->sort);
            break;
        }
        case Style_Tag::macro: {
            const std::optional<std::u8string_view> name = child.find_attribute(u8"name");
            if (!name) {
                context.try_error(
                    diagnostic::macro_name_missing, u8"A <macro> requires a \"name\" attribute."sv
                );
                return Style_Error::structure;
            }
            Result<Render_Node, Style_Error> body = compile_macro(child, context);
            if (!body) {
                return body.error();
            }
            style.macros.insert_or_assign(std::pmr::u8string { *name, memory }, std::move(*body));
            break;
        }
        default: {
            context.try_warning(
                diagnostic::style_child_ignored, u8"Ignoring <"sv, child.get_name(),
                u8"> as a child of <style>."sv
            );
            break;
        }
        }
    }

    if (!style.cite_layout) {
        context.try_error(diagnostic::layout_missing, u8"The style has no <citation>."sv);
        return Style_Error::structure;
    }
    if (!style.bib_layout) {
        context.try_error(diagnostic::layout_missing, u8"The style has no <bibliography>."sv);
        return Style_Error::structure;
    }
    return style;
}

} // namespace cslc
