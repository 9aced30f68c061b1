#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "cslc/util/assert.hpp"

#include "cslc/render.hpp"
#include "cslc/style.hpp"
#include "cslc/style_node.hpp"

namespace cslc {
namespace {

[[nodiscard]]
Rendered
evaluate_element(const Render_Element& element, Render_Context& context)
{
    std::pmr::vector<Rendered> children { context.get_memory() };
    children.reserve(element.children.size());
    for (const Render_Node& child : element.children) {
        children.push_back(evaluate(child, context));
    }

    const Render_Runtime::Attribute_Span attributes = element.attributes;
    const Render_Runtime::Children child_results = children;
    Render_Runtime& runtime = context.get_runtime();

    using enum Render_Tag;
    switch (element.tag) {
    case layout: return runtime.render_layout(attributes, context, child_results);
    case macro: return runtime.render_macro(attributes, context, child_results);
    case text: return runtime.render_text(attributes, context, child_results);
    case date: return runtime.render_date(attributes, context, child_results);
    case date_part: return runtime.render_date_part(attributes, context, child_results);
    case number: return runtime.render_number(attributes, context, child_results);
    case label: return runtime.render_label(attributes, context, child_results);
    case group: return runtime.render_group(attributes, context, child_results);
    case choose: return runtime.render_choose(attributes, context, child_results);
    case if_: return runtime.render_if(attributes, context, child_results);
    case else_if: return runtime.render_else_if(attributes, context, child_results);
    case else_: return runtime.render_else(attributes, context, child_results);
    case sort: return runtime.render_sort(attributes, context, child_results);
    case key: return runtime.render_key(attributes, context, child_results);
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid render tag.");
}

} // namespace

Rendered evaluate(const Render_Node& node, Render_Context& context)
{
    switch (node.get_kind()) {
    case Render_Node_Kind::text: {
        return Rendered {
            .text = std::pmr::u8string { node.as_text().text, context.get_memory() },
            .kind = Rendered_Kind::text_only,
        };
    }
    case Render_Node_Kind::element: {
        return evaluate_element(node.as_element(), context);
    }
    case Render_Node_Kind::names: {
        return evaluate_names(node.as_names(), context);
    }
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid render node kind.");
}

std::optional<Rendered> evaluate_macro(std::u8string_view name, Render_Context& context)
{
    const Render_Node* const macro = context.get_style().find_macro(name);
    if (!macro) {
        return {};
    }
    return evaluate(*macro, context);
}

} // namespace cslc
