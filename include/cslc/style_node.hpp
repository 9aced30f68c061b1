#ifndef CSLC_STYLE_NODE_HPP
#define CSLC_STYLE_NODE_HPP

#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cslc/util/assert.hpp"

#include "cslc/fwd.hpp"

namespace cslc {

struct Style_Attribute {
    std::pmr::u8string name;
    std::pmr::u8string value;
};

/// @brief An ordered list of attributes, in document order.
using Attributes = std::pmr::vector<Style_Attribute>;

/// @brief Returns the value of the first attribute named `name`,
/// or `std::nullopt` if there is no such attribute.
[[nodiscard]]
std::optional<std::u8string_view>
find_attribute(std::span<const Style_Attribute> attributes, std::u8string_view name);

/// @brief Like `find_attribute`, but yields `fallback` when the attribute is absent.
[[nodiscard]]
std::u8string_view attribute_or(
    std::span<const Style_Attribute> attributes,
    std::u8string_view name,
    std::u8string_view fallback = {}
);

/// @brief Returns a copy of `attributes` whose strings are allocated from `memory`.
[[nodiscard]]
Attributes
copy_attributes(std::span<const Style_Attribute> attributes, std::pmr::memory_resource* memory);

enum struct Style_Node_Kind : Default_Underlying {
    element,
    text,
    comment,
};

/// @brief A generic node of a parsed XML document.
/// Elements have a tag name, attributes, and children;
/// text and comment nodes only have text.
struct Style_Node {
    Style_Node_Kind kind;
    /// @brief The tag name of an element, or the text of a text or comment node.
    std::pmr::u8string name_or_text;
    Attributes attributes;
    std::pmr::vector<Style_Node> children;

    [[nodiscard]]
    static Style_Node element(std::u8string_view name, std::pmr::memory_resource* memory)
    {
        return { Style_Node_Kind::element, std::pmr::u8string { name, memory },
                 Attributes { memory }, std::pmr::vector<Style_Node> { memory } };
    }

    [[nodiscard]]
    static Style_Node text(std::u8string_view text, std::pmr::memory_resource* memory)
    {
        return { Style_Node_Kind::text, std::pmr::u8string { text, memory },
                 Attributes { memory }, std::pmr::vector<Style_Node> { memory } };
    }

    [[nodiscard]]
    static Style_Node comment(std::u8string_view text, std::pmr::memory_resource* memory)
    {
        return { Style_Node_Kind::comment, std::pmr::u8string { text, memory },
                 Attributes { memory }, std::pmr::vector<Style_Node> { memory } };
    }

    [[nodiscard]]
    bool is_element() const
    {
        return kind == Style_Node_Kind::element;
    }

    [[nodiscard]]
    bool is_element(std::u8string_view tag) const
    {
        return kind == Style_Node_Kind::element && name_or_text == tag;
    }

    [[nodiscard]]
    bool is_text() const
    {
        return kind == Style_Node_Kind::text;
    }

    [[nodiscard]]
    std::u8string_view get_name() const
    {
        CSLC_ASSERT(is_element());
        return name_or_text;
    }

    [[nodiscard]]
    std::u8string_view get_text() const
    {
        CSLC_ASSERT(!is_element());
        return name_or_text;
    }

    [[nodiscard]]
    std::optional<std::u8string_view> find_attribute(std::u8string_view name) const
    {
        return cslc::find_attribute(attributes, name);
    }

    [[nodiscard]]
    std::u8string_view attribute_or(std::u8string_view name, std::u8string_view fallback = {})
        const
    {
        return cslc::attribute_or(attributes, name, fallback);
    }

    /// @brief Returns the first child element with the given `tag`, or `nullptr`.
    [[nodiscard]]
    const Style_Node* find_child(std::u8string_view tag) const;

    /// @brief Returns the first child which is an element, or `nullptr`.
    [[nodiscard]]
    const Style_Node* first_element_child() const;

    /// @brief Returns the concatenation of all text children.
    [[nodiscard]]
    std::pmr::u8string get_text_content(std::pmr::memory_resource* memory) const;
};

/// @brief Returns `true` if `node` is text consisting only of ASCII blanks.
/// The compiler skips such text between elements.
[[nodiscard]]
bool is_blank_text(const Style_Node& node);

/// @brief Removes comments from `node`, recursively.
/// Text on both sides of a removed comment is joined into one text node.
/// Whitespace-only text is kept, since it is the value of terms like `<term> </term>`.
[[nodiscard]]
Style_Node strip_comments(Style_Node&& node);

} // namespace cslc

#endif
