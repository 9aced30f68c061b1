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
#include "cslc/render.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"

using namespace std::string_view_literals;

namespace cslc {
namespace {

[[nodiscard]]
Result<std::pmr::vector<Render_Node>, Style_Error>
compile_children(std::span<const Style_Node> children, Compile_Context& context)
{
    std::pmr::vector<Render_Node> result { context.get_memory() };
    result.reserve(children.size());
    for (const Style_Node& child : children) {
        if (child.kind == Style_Node_Kind::comment || is_blank_text(child)) {
            continue;
        }
        Result<Render_Node, Style_Error> compiled = compile_node(child, context);
        if (!compiled) {
            return compiled.error();
        }
        result.push_back(std::move(*compiled));
    }
    return result;
}

[[nodiscard]]
Result<Render_Node, Style_Error> compile_element(
    Render_Tag tag,
    const Style_Node& node,
    bool keep_attributes,
    Compile_Context& context
)
{
    Result<std::pmr::vector<Render_Node>, Style_Error> children
        = compile_children(node.children, context);
    if (!children) {
        return children.error();
    }
    std::pmr::memory_resource* const memory = context.get_memory();
    Attributes attributes
        = keep_attributes ? copy_attributes(node.attributes, memory) : Attributes { memory };
    return Render_Node { Render_Element {
        .tag = tag,
        .attributes = std::move(attributes),
        .children = std::move(*children),
    } };
}

} // namespace

Result<Render_Node, Style_Error> compile_node(const Style_Node& node, Compile_Context& context)
{
    if (!node.is_element()) {
        const std::u8string_view text
            = node.kind == Style_Node_Kind::text ? node.get_text() : std::u8string_view {};
        return Render_Node { Render_Text { std::pmr::u8string { text, context.get_memory() } } };
    }

    const std::optional<Style_Tag> tag = style_tag_by_name(node.get_name());
    if (!tag) {
        context.try_error(
            diagnostic::tag_unknown, u8"Unknown element <"sv, node.get_name(), u8">."sv
        );
        return Style_Error::unknown_tag;
    }
    if (*tag == Style_Tag::names) {
        return compile_names(node, context);
    }

    const std::optional<Render_Tag> render_tag = style_tag_render_tag(*tag);
    if (!render_tag) {
        context.try_error(
            diagnostic::tag_misplaced, u8"The element <"sv, node.get_name(),
            u8"> cannot appear in renderable content."sv
        );
        return Style_Error::structure;
    }
    return compile_element(*render_tag, node, true, context);
}

Result<Render_Node, Style_Error> compile_macro(const Style_Node& node, Compile_Context& context)
{
    return compile_element(Render_Tag::macro, node, false, context);
}

} // namespace cslc
