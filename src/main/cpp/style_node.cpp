#include <algorithm>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cslc/util/strings.hpp"

#include "cslc/style_node.hpp"

namespace cslc {

[[nodiscard]]
std::optional<std::u8string_view>
find_attribute(std::span<const Style_Attribute> attributes, std::u8string_view name)
{
    for (const Style_Attribute& attribute : attributes) {
        if (attribute.name == name) {
            return attribute.value;
        }
    }
    return {};
}

[[nodiscard]]
std::u8string_view attribute_or(
    std::span<const Style_Attribute> attributes,
    std::u8string_view name,
    std::u8string_view fallback
)
{
    return find_attribute(attributes, name).value_or(fallback);
}

Attributes
copy_attributes(std::span<const Style_Attribute> attributes, std::pmr::memory_resource* memory)
{
    Attributes result { memory };
    result.reserve(attributes.size());
    for (const Style_Attribute& attribute : attributes) {
        result.push_back({ .name = std::pmr::u8string { attribute.name, memory },
                           .value = std::pmr::u8string { attribute.value, memory } });
    }
    return result;
}

const Style_Node* Style_Node::find_child(std::u8string_view tag) const
{
    const auto it = std::ranges::find_if(children, [&](const Style_Node& child) {
        return child.is_element(tag);
    });
    return it == children.end() ? nullptr : &*it;
}

const Style_Node* Style_Node::first_element_child() const
{
    const auto it = std::ranges::find_if(children, [](const Style_Node& child) {
        return child.is_element();
    });
    return it == children.end() ? nullptr : &*it;
}

std::pmr::u8string Style_Node::get_text_content(std::pmr::memory_resource* memory) const
{
    std::pmr::u8string result { memory };
    for (const Style_Node& child : children) {
        if (child.is_text()) {
            result += child.name_or_text;
        }
    }
    return result;
}

bool is_blank_text(const Style_Node& node)
{
    return node.is_text() && is_ascii_blank(std::u8string_view { node.name_or_text });
}

namespace {

void strip_comments_in_place(Style_Node& node)
{
    if (!node.is_element()) {
        return;
    }
    std::pmr::vector<Style_Node> kept { node.children.get_allocator() };
    kept.reserve(node.children.size());
    for (Style_Node& child : node.children) {
        switch (child.kind) {
        case Style_Node_Kind::comment: break;
        case Style_Node_Kind::text: {
            if (!kept.empty() && kept.back().is_text()) {
                kept.back().name_or_text += child.name_or_text;
                break;
            }
            kept.push_back(std::move(child));
            break;
        }
        case Style_Node_Kind::element: {
            strip_comments_in_place(child);
            kept.push_back(std::move(child));
            break;
        }
        }
    }
    node.children = std::move(kept);
}

} // namespace

Style_Node strip_comments(Style_Node&& node)
{
    strip_comments_in_place(node);
    return std::move(node);
}

} // namespace cslc
