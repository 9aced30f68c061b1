#ifndef CSLC_RENDER_HPP
#define CSLC_RENDER_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "cslc/util/assert.hpp"

#include "cslc/fwd.hpp"
#include "cslc/style_node.hpp"

namespace cslc {

/// @brief The elements which compile into a call of a rendering primitive.
/// Each tag `x` corresponds to the primitive `Render_Runtime::render_x`.
/// `names` is absent because it compiles into a `Names_Node` instead.
enum struct Render_Tag : Default_Underlying {
    layout,
    macro,
    text,
    date,
    date_part,
    number,
    label,
    group,
    choose,
    if_,
    else_if,
    else_,
    sort,
    key,
};

[[nodiscard]]
constexpr std::u8string_view render_tag_name(Render_Tag tag)
{
    using enum Render_Tag;
    switch (tag) {
    case layout: return u8"layout";
    case macro: return u8"macro";
    case text: return u8"text";
    case date: return u8"date";
    case date_part: return u8"date-part";
    case number: return u8"number";
    case label: return u8"label";
    case group: return u8"group";
    case choose: return u8"choose";
    case if_: return u8"if";
    case else_if: return u8"else-if";
    case else_: return u8"else";
    case sort: return u8"sort";
    case key: return u8"key";
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid render tag.");
}

enum struct Rendered_Kind : Default_Underlying {
    /// @brief Only constant text (affixes, terms) was rendered.
    text_only,
    /// @brief At least one variable was present and rendered.
    present_vars,
    /// @brief All variables that were referenced are empty.
    empty_vars,
};

/// @brief The result of evaluating a render node.
struct Rendered {
    std::pmr::u8string text;
    Rendered_Kind kind = Rendered_Kind::text_only;
    /// @brief The amount of names that went into `text`,
    /// maintained by the runtime's name rendering.
    std::size_t name_count = 0;
    /// @brief `true` if this result stems from a `substitute` of a `names` element
    /// rather than from the element's own variables.
    bool substituted = false;

    [[nodiscard]]
    bool empty() const
    {
        return text.empty();
    }
};

struct Name_Part {
    std::pmr::u8string name;
    Attributes attributes;
};

/// @brief The compiled form of a `text` leaf: constant text.
struct Render_Text {
    std::pmr::u8string text;
};

/// @brief The compiled form of an element which is rendered by a primitive.
/// The attributes are fixed at compile time;
/// the children are evaluated against the context of each render call.
struct Render_Element {
    Render_Tag tag;
    Attributes attributes;
    std::pmr::vector<Render_Node> children;
};

/// @brief The compiled form of a `names` element.
struct Names_Node {
    /// @brief The variables in the `variable` attribute, in order.
    std::pmr::vector<std::pmr::u8string> variables;
    /// @brief The attributes of the `names` element itself.
    Attributes attributes;
    Attributes name_attributes;
    std::pmr::vector<Name_Part> name_parts;
    Attributes et_al_attributes;
    Attributes label_attributes;
    bool has_name = false;
    bool has_et_al = false;
    bool has_label = false;
    bool label_before_names = false;
    /// @brief The alternatives that are rendered in order when `variables` renders empty.
    std::pmr::vector<Render_Node> substitutions;

    /// @brief Returns `true` iff the names are rendered as their count (`form="count"`).
    [[nodiscard]]
    bool is_count() const
    {
        return attribute_or(name_attributes, u8"form") == u8"count";
    }
};

enum struct Render_Node_Kind : Default_Underlying {
    text,
    element,
    names,
};

/// @brief A node of a compiled rendering program.
/// Compiled nodes are immutable and can be evaluated any number of times,
/// concurrently if every evaluation has its own `Render_Context`.
struct Render_Node {
private:
    std::variant<Render_Text, Render_Element, Names_Node> m_value;

public:
    [[nodiscard]]
    Render_Node() = default;

    [[nodiscard]]
    Render_Node(Render_Text&& text)
        : m_value { std::move(text) }
    {
    }

    [[nodiscard]]
    Render_Node(Render_Element&& element)
        : m_value { std::move(element) }
    {
    }

    [[nodiscard]]
    Render_Node(Names_Node&& names)
        : m_value { std::move(names) }
    {
    }

    [[nodiscard]]
    Render_Node_Kind get_kind() const
    {
        return Render_Node_Kind(m_value.index());
    }

    [[nodiscard]]
    const Render_Text& as_text() const
    {
        CSLC_ASSERT(get_kind() == Render_Node_Kind::text);
        return *std::get_if<Render_Text>(&m_value);
    }

    [[nodiscard]]
    const Render_Element& as_element() const
    {
        CSLC_ASSERT(get_kind() == Render_Node_Kind::element);
        return *std::get_if<Render_Element>(&m_value);
    }

    [[nodiscard]]
    const Names_Node& as_names() const
    {
        CSLC_ASSERT(get_kind() == Render_Node_Kind::names);
        return *std::get_if<Names_Node>(&m_value);
    }
};

/// @brief The per-call state of rendering.
/// Runtimes that need more state (the entry being rendered, suppression flags, etc.)
/// derive from this class.
struct Render_Context {
private:
    Render_Runtime& m_runtime;
    const Compiled_Style& m_style;
    std::pmr::memory_resource* m_memory;

public:
    [[nodiscard]]
    Render_Context(
        Render_Runtime& runtime,
        const Compiled_Style& style,
        std::pmr::memory_resource* memory
    )
        : m_runtime { runtime }
        , m_style { style }
        , m_memory { memory }
    {
    }

    Render_Context(const Render_Context&) = delete;
    Render_Context& operator=(const Render_Context&) = delete;

    virtual ~Render_Context() = default;

    [[nodiscard]]
    Render_Runtime& get_runtime() const
    {
        return m_runtime;
    }

    [[nodiscard]]
    const Compiled_Style& get_style() const
    {
        return m_style;
    }

    /// @brief Returns the memory from which rendered values are allocated.
    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const
    {
        return m_memory;
    }
};

/// @brief The rendering primitives which compiled styles call into.
/// Implementations produce text from entry data;
/// the compiler only invokes them.
/// Every primitive receives the attributes of the element,
/// the context of the current render call,
/// and the results of evaluating the element's children against that context.
struct Render_Runtime {
    using Children = std::span<Rendered>;
    using Attribute_Span = std::span<const Style_Attribute>;

    virtual ~Render_Runtime() = default;

    [[nodiscard]]
    virtual Rendered render_layout(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_macro(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_text(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_date(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_date_part(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_number(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_label(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_group(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_choose(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_if(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_else_if(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_else(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_sort(Attribute_Span, Render_Context&, Children) = 0;
    [[nodiscard]]
    virtual Rendered render_key(Attribute_Span, Render_Context&, Children) = 0;

    /// @brief Renders the variables of a `names` element,
    /// formatted according to all the attribute sets gathered from it.
    [[nodiscard]]
    virtual Rendered render_name_vars(const Names_Node& names, Render_Context&) = 0;

    /// @brief Returns the amount of names that were rendered into `rendered`.
    [[nodiscard]]
    virtual std::size_t count_names(const Rendered& rendered, Render_Context&)
    {
        return rendered.name_count;
    }

    /// @brief Returns `true` if names are currently suppressed,
    /// such as the author in an "author-only"/"suppress-author" citation.
    [[nodiscard]]
    virtual bool suppresses_author(const Render_Context&) = 0;
};

/// @brief Evaluates a compiled node against `context`.
[[nodiscard]]
Rendered evaluate(const Render_Node& node, Render_Context& context);

/// @brief Evaluates a compiled `names` element.
/// Yields an empty result of kind `empty_vars` if the author is suppressed.
/// Otherwise, the variables are rendered,
/// and if that result is empty, the substitutions are tried in order until one renders non-empty.
/// With `form="count"`, the text becomes the amount of rendered names,
/// or the empty string if that amount is zero.
[[nodiscard]]
Rendered evaluate_names(const Names_Node& names, Render_Context& context);

/// @brief Evaluates the macro registered under `name` in the style of `context`.
/// Returns `std::nullopt` if the style has no such macro.
[[nodiscard]]
std::optional<Rendered> evaluate_macro(std::u8string_view name, Render_Context& context);

} // namespace cslc

#endif
