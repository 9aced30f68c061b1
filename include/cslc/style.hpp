#ifndef CSLC_STYLE_HPP
#define CSLC_STYLE_HPP

#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cslc/util/result.hpp"
#include "cslc/util/transparent_comparison.hpp"

#include "cslc/fwd.hpp"
#include "cslc/options.hpp"
#include "cslc/render.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"
#include "cslc/terms.hpp"

namespace cslc {

/// @brief A compiled `layout` element.
struct Layout {
    Render_Node function;
    /// @brief The attributes of the `layout` element, such as `delimiter`.
    Attributes attributes;
};

/// @brief A compiled `sort` element.
struct Sort {
    Render_Node function;
    /// @brief One entry per sort key, `true` meaning ascending.
    std::pmr::vector<bool> orders;
};

struct Date_Part_Format {
    std::pmr::u8string name;
    Attributes attributes;
};

/// @brief A localized date format, i.e. a `date` element within a `locale`.
struct Date_Format {
    Attributes attributes;
    /// @brief The `date-part` children in order, by their `name` attribute.
    std::pmr::vector<Date_Part_Format> parts;
};

using Macro_Map = std::pmr::unordered_map<
    std::pmr::u8string,
    Render_Node,
    Transparent_String_View_Hash8,
    Transparent_String_View_Equals8>;

/// @brief The result of compiling a style.
/// It is built once and then only read,
/// so it can be shared by any number of render calls.
struct Compiled_Style {
    /// @brief The `info` element of the style, uninterpreted.
    std::optional<Style_Node> info;
    /// @brief Global options, i.e. the attributes of the `style` element.
    Option_Map options;
    Option_Map bib_options;
    Option_Map cite_options;
    Option_Map locale_options;
    std::optional<Layout> bib_layout;
    std::optional<Layout> cite_layout;
    std::optional<Sort> bib_sort;
    std::optional<Sort> cite_sort;
    /// @brief `true` iff the style is a note style.
    bool cite_note = false;
    /// @brief `true` iff the style text refers to the `year-suffix` variable.
    bool uses_year_suffix_variable = false;
    std::optional<Date_Format> date_text;
    std::optional<Date_Format> date_numeric;
    Macro_Map macros;
    std::optional<Term_List> terms;
    /// @brief The `default-locale` attribute of the style, or empty.
    std::pmr::u8string default_locale;
    /// @brief The locale the style was created for; see `create_style`.
    std::pmr::u8string locale;

    [[nodiscard]]
    explicit Compiled_Style(std::pmr::memory_resource* memory)
        : options { memory }
        , bib_options { memory }
        , cite_options { memory }
        , locale_options { memory }
        , macros { memory }
        , default_locale { memory }
        , locale { memory }
    {
    }

    /// @brief Returns the macro named `name`, or `nullptr`.
    [[nodiscard]]
    const Render_Node* find_macro(std::u8string_view name) const
    {
        const auto it = macros.find(name);
        return it == macros.end() ? nullptr : &it->second;
    }

    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const
    {
        return macros.get_allocator().resource();
    }
};

/// @brief A style text which has been parsed, but not compiled.
struct Parsed_Style {
    bool uses_year_suffix_variable;
    Style_Node root;
};

/// @brief The parts of a `citation` or `bibliography` element.
struct Layout_Fragment {
    Option_Map options;
    Layout layout;
    std::optional<Sort> sort;
};

struct Style_Options {
    /// @brief The requested locale, or empty to use the default locale of the style.
    std::u8string_view locale;
    /// @brief If `true`, `locale` is used even if the style has a default locale.
    bool force_locale = false;
};

// INGESTION =======================================================================================

/// @brief Returns `true` if `style` is inline XML rather than a file path,
/// i.e. if it contains a `<` after at most a few leading blank characters.
/// A leading UTF-8 byte order mark is ignored.
[[nodiscard]]
bool is_inline_style(std::u8string_view style);

/// @brief Returns `true` iff `text` contains `variable="year-suffix"`, ignoring case.
/// This is a textual search which does not care where the reference occurs.
[[nodiscard]]
bool scan_year_suffix_variable(std::u8string_view text);

/// @brief Obtains the text of a style (inline or from the file at `style`),
/// scans it for use of the `year-suffix` variable,
/// and parses it into a tree without comments.
[[nodiscard]]
Result<Parsed_Style, Style_Error>
parse_style_source(std::u8string_view style, Compile_Context& context);

// ASSEMBLY ========================================================================================

/// @brief Splits a `citation` or `bibliography` element into options,
/// compiled layout, and compiled sort if present.
[[nodiscard]]
Result<Layout_Fragment, Style_Error>
parse_layout_fragment(const Style_Node& node, Compile_Context& context);

/// @brief Merges a `locale` element into `style`.
/// Options which are already set are kept,
/// date formats are only set if they are not set yet,
/// and new terms override existing terms with the same definition.
void merge_locale(Compiled_Style& style, const Style_Node& locale, Compile_Context& context);

/// @brief Compiles the tree of a style into a `Compiled_Style`.
/// At most one of the `locale` elements in the style is merged,
/// namely the first one compatible with `requested_locale`.
/// Option defaults are not applied; see `set_option_defaults`.
[[nodiscard]]
Result<Compiled_Style, Style_Error> assemble_style(
    const Style_Node& root,
    bool uses_year_suffix_variable,
    std::u8string_view requested_locale,
    Compile_Context& context
);

/// @brief Sets all unset options that have a static default,
/// followed by the delimiters whose default depends on the `collapse` option.
/// Applying this function more than once has no further effect.
void set_option_defaults(Compiled_Style& style);

/// @brief Compiles a style from inline XML or a file path,
/// merges the locale obtained from `locale_getter`,
/// and applies option defaults.
[[nodiscard]]
Result<Compiled_Style, Style_Error> create_style(
    std::u8string_view style,
    Locale_Getter& locale_getter,
    const Style_Options& options,
    Compile_Context& context
);

} // namespace cslc

#endif
