#ifndef CSLC_COMPILE_HPP
#define CSLC_COMPILE_HPP

#include <optional>
#include <string_view>

#include "cslc/util/assert.hpp"
#include "cslc/util/result.hpp"

#include "cslc/fwd.hpp"
#include "cslc/render.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"

namespace cslc {

#define CSLC_STYLE_TAG_ENUM_DATA(F)                                                                \
    F(bibliography, u8"bibliography")                                                              \
    F(choose, u8"choose")                                                                          \
    F(citation, u8"citation")                                                                      \
    F(date, u8"date")                                                                              \
    F(date_part, u8"date-part")                                                                    \
    F(else_, u8"else")                                                                             \
    F(else_if, u8"else-if")                                                                        \
    F(et_al, u8"et-al")                                                                            \
    F(group, u8"group")                                                                            \
    F(if_, u8"if")                                                                                 \
    F(info, u8"info")                                                                              \
    F(key, u8"key")                                                                                \
    F(label, u8"label")                                                                            \
    F(layout, u8"layout")                                                                          \
    F(locale, u8"locale")                                                                          \
    F(macro, u8"macro")                                                                            \
    F(multiple, u8"multiple")                                                                      \
    F(name, u8"name")                                                                              \
    F(name_part, u8"name-part")                                                                    \
    F(names, u8"names")                                                                            \
    F(number, u8"number")                                                                          \
    F(single, u8"single")                                                                          \
    F(sort, u8"sort")                                                                              \
    F(style, u8"style")                                                                            \
    F(style_options, u8"style-options")                                                            \
    F(substitute, u8"substitute")                                                                  \
    F(term, u8"term")                                                                              \
    F(terms, u8"terms")                                                                            \
    F(text, u8"text")

#define CSLC_STYLE_TAG_ENUMERATOR(id, name) id,

/// @brief The closed set of element names known to the compiler.
/// Elements that only occur within `info` are not listed
/// because `info` is passed through without being compiled.
enum struct Style_Tag : Default_Underlying { CSLC_STYLE_TAG_ENUM_DATA(CSLC_STYLE_TAG_ENUMERATOR) };

#undef CSLC_STYLE_TAG_ENUMERATOR

[[nodiscard]]
constexpr std::u8string_view style_tag_name(Style_Tag tag)
{
#define CSLC_STYLE_TAG_NAME_CASE(id, name)                                                         \
    case Style_Tag::id: return name;

    switch (tag) {
        CSLC_STYLE_TAG_ENUM_DATA(CSLC_STYLE_TAG_NAME_CASE)
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid style tag.");

#undef CSLC_STYLE_TAG_NAME_CASE
}

/// @brief Returns the tag whose element name is `name`,
/// or `std::nullopt` if the name is unknown.
[[nodiscard]]
constexpr std::optional<Style_Tag> style_tag_by_name(std::u8string_view name)
{
#define CSLC_STYLE_TAG_NAME_TEST(id, str)                                                          \
    if (name == str) {                                                                             \
        return Style_Tag::id;                                                                      \
    }

    CSLC_STYLE_TAG_ENUM_DATA(CSLC_STYLE_TAG_NAME_TEST)
    return {};

#undef CSLC_STYLE_TAG_NAME_TEST
}

/// @brief Returns the rendering primitive for elements with the given `tag`,
/// or `std::nullopt` if such elements cannot be rendered generically.
[[nodiscard]]
constexpr std::optional<Render_Tag> style_tag_render_tag(Style_Tag tag)
{
    using enum Style_Tag;
    switch (tag) {
    case layout: return Render_Tag::layout;
    case text: return Render_Tag::text;
    case date: return Render_Tag::date;
    case date_part: return Render_Tag::date_part;
    case number: return Render_Tag::number;
    case label: return Render_Tag::label;
    case group: return Render_Tag::group;
    case choose: return Render_Tag::choose;
    case if_: return Render_Tag::if_;
    case else_if: return Render_Tag::else_if;
    case else_: return Render_Tag::else_;
    case sort: return Render_Tag::sort;
    case key: return Render_Tag::key;

    case bibliography:
    case citation:
    case et_al:
    case info:
    case locale:
    case macro:
    case multiple:
    case name:
    case name_part:
    case names:
    case single:
    case style:
    case style_options:
    case substitute:
    case term:
    case terms: return {};
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid style tag.");
}

/// @brief Compiles a node of renderable content.
/// Text compiles to constant text, `names` elements are compiled by `compile_names`,
/// and every other renderable element compiles to a call of its rendering primitive.
/// Elements which are known, but cannot be rendered here (like `locale`) are
/// `Style_Error::structure` errors,
/// and elements with unknown names are `Style_Error::unknown_tag` errors.
[[nodiscard]]
Result<Render_Node, Style_Error> compile_node(const Style_Node& node, Compile_Context& context);

/// @brief Compiles a `names` element into a `Names_Node`.
[[nodiscard]]
Result<Render_Node, Style_Error> compile_names(const Style_Node& node, Compile_Context& context);

/// @brief Compiles the body of a `macro` element.
/// The attributes of the `macro` element itself are not retained.
[[nodiscard]]
Result<Render_Node, Style_Error> compile_macro(const Style_Node& node, Compile_Context& context);

} // namespace cslc

#endif
