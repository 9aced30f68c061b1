#include <optional>
#include <string_view>
#include <utility>

#include "cslc/util/result.hpp"

#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/locale.hpp"
#include "cslc/settings.hpp"
#include "cslc/style.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"
#include "cslc/terms.hpp"

using namespace std::string_view_literals;

namespace cslc {
namespace {

[[nodiscard]]
std::u8string_view
effective_locale(const Style_Options& options, std::u8string_view default_locale)
{
    if (options.force_locale || default_locale.empty()) {
        return options.locale.empty() ? std::u8string_view { fallback_locale } : options.locale;
    }
    return default_locale;
}

/// @brief Merges a locale obtained from outside the style.
/// Unlike for `locale` elements within the style,
/// the terms in `style` take precedence over the terms in `locale`.
void merge_external_locale(
    Compiled_Style& style,
    const Style_Node& locale,
    Compile_Context& context
)
{
    std::optional<Term_List> own_terms = std::exchange(style.terms, std::nullopt);
    merge_locale(style, locale, context);
    if (!own_terms) {
        return;
    }
    if (style.terms) {
        style.terms = merge_term_lists(std::move(*own_terms), *style.terms);
    }
    else {
        style.terms = std::move(own_terms);
    }
}

} // namespace

Result<Compiled_Style, Style_Error> create_style(
    std::u8string_view style,
    Locale_Getter& locale_getter,
    const Style_Options& options,
    Compile_Context& context
)
{
    Result<Parsed_Style, Style_Error> parsed = parse_style_source(style, context);
    if (!parsed) {
        return parsed.error();
    }

    const std::u8string_view locale
        = effective_locale(options, parsed->root.attribute_or(u8"default-locale"));

    Result<Compiled_Style, Style_Error> result = assemble_style(
        parsed->root, parsed->uses_year_suffix_variable, locale, context
    );
    if (!result) {
        return result;
    }

    Result<Style_Node, Style_Error> external = locale_getter(locale, context);
    if (external) {
        merge_external_locale(*result, *external, context);
    }
    else {
        context.try_warning(
            diagnostic::locale_load, u8"Failed to obtain locale \""sv, locale,
            u8"\"; only the locale data within the style is used."sv
        );
    }

    set_option_defaults(*result);
    result->locale = locale;
    return result;
}

} // namespace cslc
