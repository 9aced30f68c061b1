#include <charconv>
#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "cslc/util/assert.hpp"
#include "cslc/util/result.hpp"
#include "cslc/util/strings.hpp"

#include "cslc/compile.hpp"
#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/render.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"

using namespace std::string_view_literals;

namespace cslc {
namespace {

/// @brief Returns `true` iff `node` has a `name`, `et-al`, or `label` child.
/// A nested `names` element without any of these inherits them from the enclosing `names`.
[[nodiscard]]
bool has_own_name_settings(const Style_Node& node)
{
    for (const Style_Node& child : node.children) {
        if (child.is_element(u8"name") || child.is_element(u8"et-al")
            || child.is_element(u8"label")) {
            return true;
        }
    }
    return false;
}

void inherit_name_settings(Names_Node& out, const Names_Node& outer, Compile_Context& context)
{
    std::pmr::memory_resource* const memory = context.get_memory();
    out.name_attributes = copy_attributes(outer.name_attributes, memory);
    for (const Name_Part& part : outer.name_parts) {
        out.name_parts.push_back({ .name = std::pmr::u8string { part.name, memory },
                                   .attributes = copy_attributes(part.attributes, memory) });
    }
    out.et_al_attributes = copy_attributes(outer.et_al_attributes, memory);
    out.label_attributes = copy_attributes(outer.label_attributes, memory);
    out.has_name = outer.has_name;
    out.has_et_al = outer.has_et_al;
    out.has_label = outer.has_label;
    out.label_before_names = outer.label_before_names;
}

[[nodiscard]]
Result<void, Style_Error>
gather_name_settings(Names_Node& out, const Style_Node& node, Compile_Context& context)
{
    std::pmr::memory_resource* const memory = context.get_memory();

    for (const Style_Node& child : node.children) {
        if (!child.is_element()) {
            continue;
        }
        const std::optional<Style_Tag> tag = style_tag_by_name(child.get_name());
        if (!tag) {
            context.try_error(
                diagnostic::tag_unknown, u8"Unknown element <"sv, child.get_name(),
                u8"> in <names>."sv
            );
            return Style_Error::unknown_tag;
        }

        switch (*tag) {
        case Style_Tag::name: {
            out.has_name = true;
            out.name_attributes = copy_attributes(child.attributes, memory);
            for (const Style_Node& part : child.children) {
                if (!part.is_element(u8"name-part")) {
                    continue;
                }
                out.name_parts.push_back({
                    .name = std::pmr::u8string { part.attribute_or(u8"name"), memory },
                    .attributes = copy_attributes(part.attributes, memory),
                });
            }
            break;
        }
        case Style_Tag::et_al: {
            out.has_et_al = true;
            out.et_al_attributes = copy_attributes(child.attributes, memory);
            break;
        }
        case Style_Tag::label: {
            out.has_label = true;
            out.label_attributes = copy_attributes(child.attributes, memory);
            break;
        }
        case Style_Tag::substitute: break;
        default: {
            context.try_error(
                diagnostic::tag_misplaced, u8"The element <"sv, child.get_name(),
                u8"> cannot appear in <names>."sv
            );
            return Style_Error::structure;
        }
        }
    }

    out.label_before_names = !out.has_label && out.has_name;
    return {};
}

[[nodiscard]]
Result<Names_Node, Style_Error>
compile_names_node(const Style_Node& node, const Names_Node* outer, Compile_Context& context);

[[nodiscard]]
Result<void, Style_Error>
compile_substitutions(Names_Node& out, const Style_Node& substitute, Compile_Context& context)
{
    for (const Style_Node& child : substitute.children) {
        if (child.kind == Style_Node_Kind::comment || is_blank_text(child)) {
            continue;
        }
        if (child.is_element(u8"names")) {
            Result<Names_Node, Style_Error> nested = compile_names_node(child, &out, context);
            if (!nested) {
                return nested.error();
            }
            out.substitutions.push_back(Render_Node { std::move(*nested) });
            continue;
        }
        Result<Render_Node, Style_Error> compiled = compile_node(child, context);
        if (!compiled) {
            return compiled.error();
        }
        out.substitutions.push_back(std::move(*compiled));
    }
    return {};
}

Result<Names_Node, Style_Error>
compile_names_node(const Style_Node& node, const Names_Node* outer, Compile_Context& context)
{
    std::pmr::memory_resource* const memory = context.get_memory();

    const std::optional<std::u8string_view> variable = node.find_attribute(u8"variable");
    if (!variable) {
        context.try_error(
            diagnostic::names_variable_missing,
            u8"A <names> element requires a \"variable\" attribute."sv
        );
        return Style_Error::structure;
    }

    Names_Node result {
        .variables = std::pmr::vector<std::pmr::u8string> { memory },
        .attributes = copy_attributes(node.attributes, memory),
        .name_attributes = Attributes { memory },
        .name_parts = std::pmr::vector<Name_Part> { memory },
        .et_al_attributes = Attributes { memory },
        .label_attributes = Attributes { memory },
        .substitutions = std::pmr::vector<Render_Node> { memory },
    };
    for_each_blank_separated(*variable, [&](std::u8string_view name) {
        result.variables.emplace_back(name);
    });

    // First pass: the formatting of the names,
    // which substitutions may inherit and must therefore be known beforehand.
    if (outer && !has_own_name_settings(node)) {
        inherit_name_settings(result, *outer, context);
    }
    else {
        if (Result<void, Style_Error> r = gather_name_settings(result, node, context); !r) {
            return r.error();
        }
        if (!outer && !result.has_name && !result.has_label) {
            context.try_error(
                diagnostic::names_label_order,
                u8"A <names> element needs a <name> or <label> child "
                u8"to determine the order of names and label."sv
            );
            return Style_Error::structure;
        }
    }

    // Second pass: substitutions.
    for (const Style_Node& child : node.children) {
        if (!child.is_element(u8"substitute")) {
            continue;
        }
        if (Result<void, Style_Error> r = compile_substitutions(result, child, context); !r) {
            return r.error();
        }
    }

    return result;
}

[[nodiscard]]
Rendered empty_vars_result(Render_Context& context)
{
    return Rendered {
        .text = std::pmr::u8string { context.get_memory() },
        .kind = Rendered_Kind::empty_vars,
    };
}

[[nodiscard]]
Rendered evaluate_substitutions(const Names_Node& names, Render_Context& context)
{
    for (const Render_Node& substitution : names.substitutions) {
        Rendered result = evaluate(substitution, context);
        if (!result.empty()) {
            result.substituted = true;
            return result;
        }
    }
    return empty_vars_result(context);
}

} // namespace

Result<Render_Node, Style_Error> compile_names(const Style_Node& node, Compile_Context& context)
{
    Result<Names_Node, Style_Error> result = compile_names_node(node, nullptr, context);
    if (!result) {
        return result.error();
    }
    return Render_Node { std::move(*result) };
}

Rendered evaluate_names(const Names_Node& names, Render_Context& context)
{
    Render_Runtime& runtime = context.get_runtime();
    if (runtime.suppresses_author(context)) {
        return empty_vars_result(context);
    }

    Rendered result = runtime.render_name_vars(names, context);
    if (result.empty()) {
        result = evaluate_substitutions(names, context);
    }

    if (names.is_count()) {
        const std::size_t count = runtime.count_names(result, context);
        result.text.clear();
        if (count != 0) {
            char buffer[24];
            const std::to_chars_result r = std::to_chars(buffer, std::end(buffer), count);
            CSLC_ASSERT(r.ec == std::errc {});
            result.text.append(buffer, r.ptr);
        }
    }
    return result;
}

} // namespace cslc
