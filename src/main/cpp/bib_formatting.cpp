#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>
#include <variant>

#include "cslc/util/result.hpp"
#include "cslc/util/strings.hpp"

#include "cslc/bib_formatting.hpp"
#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/options.hpp"

using namespace std::string_view_literals;

namespace cslc {
namespace {

void log_domain_error(
    Compile_Context& context,
    std::u8string_view option,
    std::u8string_view value,
    std::u8string_view expected
)
{
    context.try_error(
        diagnostic::option_value, u8"Invalid value \""sv, value,
        u8"\" for bibliography option \""sv, option, u8"\"; expected "sv, expected, u8"."sv
    );
}

[[nodiscard]]
Result<std::optional<double>, Style_Error> number_option(
    const Option_Map& options,
    std::u8string_view name,
    Compile_Context& context
)
{
    const std::optional<std::u8string_view> value = options.find(name);
    if (!value) {
        return std::optional<double> {};
    }
    const std::optional<Bib_Option_Value> converted = convert_bib_option_value(*value);
    if (!converted || !std::holds_alternative<double>(*converted)) {
        log_domain_error(context, name, *value, u8"a number"sv);
        return Style_Error::option_value;
    }
    return std::optional<double> { std::get<double>(*converted) };
}

} // namespace

std::optional<Bib_Option_Value> convert_bib_option_value(std::u8string_view value)
{
    if (value == u8"true") {
        return true;
    }
    if (value == u8"false") {
        return false;
    }
    if (value == u8"flush") {
        return Second_Field_Align::flush;
    }
    if (value == u8"margin") {
        return Second_Field_Align::margin;
    }
    const std::string_view chars = as_string_view(value);
    double result = 0;
    const std::from_chars_result r
        = std::from_chars(chars.data(), chars.data() + chars.size(), result);
    if (r.ec != std::errc {} || r.ptr != chars.data() + chars.size()) {
        return {};
    }
    return result;
}

Result<Bib_Formatting_Parameters, Style_Error>
bib_formatting_parameters(const Option_Map& bib_options, Compile_Context& context)
{
    Bib_Formatting_Parameters result;

    if (const std::optional<std::u8string_view> value = bib_options.find(u8"hanging-indent")) {
        const std::optional<Bib_Option_Value> converted = convert_bib_option_value(*value);
        if (!converted || !std::holds_alternative<bool>(*converted)) {
            log_domain_error(context, u8"hanging-indent"sv, *value, u8"true or false"sv);
            return Style_Error::option_value;
        }
        result.hanging_indent = std::get<bool>(*converted);
    }

    Result<std::optional<double>, Style_Error> line_spacing
        = number_option(bib_options, u8"line-spacing", context);
    if (!line_spacing) {
        return line_spacing.error();
    }
    result.line_spacing = *line_spacing;

    Result<std::optional<double>, Style_Error> entry_spacing
        = number_option(bib_options, u8"entry-spacing", context);
    if (!entry_spacing) {
        return entry_spacing.error();
    }
    result.entry_spacing = *entry_spacing;

    if (const std::optional<std::u8string_view> value = bib_options.find(u8"second-field-align")) {
        const std::optional<Bib_Option_Value> converted = convert_bib_option_value(*value);
        if (converted && std::holds_alternative<Second_Field_Align>(*converted)) {
            result.second_field_align = std::get<Second_Field_Align>(*converted);
        }
        else if (!converted || *converted != Bib_Option_Value { false }) {
            log_domain_error(
                context, u8"second-field-align"sv, *value, u8"flush, margin, or false"sv
            );
            return Style_Error::option_value;
        }
    }

    return result;
}

} // namespace cslc
