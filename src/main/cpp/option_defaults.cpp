#include <optional>
#include <string_view>

#include "cslc/util/assert.hpp"

#include "cslc/options.hpp"
#include "cslc/style.hpp"
#include "cslc/style_node.hpp"

namespace cslc {
namespace {

enum struct Option_Scope : Default_Underlying {
    style,
    bib,
    cite,
    locale,
};

struct Option_Default {
    Option_Scope scope;
    std::u8string_view name;
    std::u8string_view value;
};

// Options whose default does not depend on other options.
constexpr Option_Default option_defaults[] {
    { Option_Scope::cite, u8"near-note-distance", u8"5" },
    { Option_Scope::locale, u8"punctuation-in-quote", u8"false" },
    { Option_Scope::locale, u8"limit-day-ordinals-to-day-1", u8"false" },
    { Option_Scope::bib, u8"hanging-indent", u8"false" },
    { Option_Scope::bib, u8"line-spacing", u8"1" },
    { Option_Scope::bib, u8"entry-spacing", u8"1" },
    { Option_Scope::style, u8"initialize-with-hyphen", u8"true" },
    { Option_Scope::style, u8"demote-non-dropping-particle", u8"display-and-sort" },
};

[[nodiscard]]
Option_Map& options_in_scope(Compiled_Style& style, Option_Scope scope)
{
    switch (scope) {
    case Option_Scope::style: return style.options;
    case Option_Scope::bib: return style.bib_options;
    case Option_Scope::cite: return style.cite_options;
    case Option_Scope::locale: return style.locale_options;
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid option scope.");
}

void set_collapse_delimiter_defaults(Compiled_Style& style)
{
    Option_Map& options = style.cite_options;
    const std::optional<std::u8string_view> collapse = options.find(u8"collapse");
    if (!collapse || *collapse == u8"citation-number") {
        return;
    }
    // Decided up front because the view into the map does not survive insertion.
    const bool is_year_suffix_collapse
        = *collapse == u8"year-suffix" || *collapse == u8"year-suffix-ranged";
    const std::optional<std::u8string_view> layout_delimiter = style.cite_layout
        ? find_attribute(style.cite_layout->attributes, u8"delimiter")
        : std::nullopt;

    options.set_default(u8"cite-group-delimiter", u8", ");
    if (!layout_delimiter) {
        return;
    }
    options.set_default(u8"after-collapse-delimiter", *layout_delimiter);
    if (is_year_suffix_collapse) {
        options.set_default(u8"year-suffix-delimiter", *layout_delimiter);
    }
}

} // namespace

void set_option_defaults(Compiled_Style& style)
{
    for (const Option_Default& d : option_defaults) {
        options_in_scope(style, d.scope).set_default(d.name, d.value);
    }
    set_collapse_delimiter_defaults(style);
}

} // namespace cslc
