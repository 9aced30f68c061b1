#ifndef CSLC_BIB_FORMATTING_HPP
#define CSLC_BIB_FORMATTING_HPP

#include <optional>
#include <string_view>
#include <variant>

#include "cslc/util/assert.hpp"
#include "cslc/util/result.hpp"

#include "cslc/fwd.hpp"
#include "cslc/style_error.hpp"

namespace cslc {

/// @brief The value of the `second-field-align` bibliography option.
enum struct Second_Field_Align : Default_Underlying {
    /// @brief The option is absent or `false`.
    disabled,
    /// @brief The first field is put in the margin.
    margin,
    /// @brief The first field is flush with the margin.
    flush,
};

[[nodiscard]]
constexpr std::u8string_view second_field_align_name(Second_Field_Align align)
{
    using enum Second_Field_Align;
    switch (align) {
        CSLC_ENUM_STRING_CASE8(disabled);
        CSLC_ENUM_STRING_CASE8(margin);
        CSLC_ENUM_STRING_CASE8(flush);
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid second-field-align.");
}

/// @brief A converted bibliography option value.
using Bib_Option_Value = std::variant<bool, Second_Field_Align, double>;

/// @brief Converts the string value of a bibliography option.
/// `"true"` and `"false"` become `bool`,
/// `"flush"` and `"margin"` become `Second_Field_Align`,
/// and anything else is parsed as a number.
/// @returns The converted value, or `std::nullopt` if the value is not a number either.
[[nodiscard]]
std::optional<Bib_Option_Value> convert_bib_option_value(std::u8string_view value);

/// @brief The typed formatting parameters of a bibliography.
/// Options that were not set remain `std::nullopt`,
/// except for `second_field_align`, which is always present.
struct Bib_Formatting_Parameters {
    std::optional<bool> hanging_indent;
    std::optional<double> line_spacing;
    std::optional<double> entry_spacing;
    Second_Field_Align second_field_align = Second_Field_Align::disabled;

    [[nodiscard]]
    friend bool operator==(const Bib_Formatting_Parameters&, const Bib_Formatting_Parameters&)
        = default;
};

/// @brief Converts the options `hanging-indent`, `line-spacing`, `entry-spacing`,
/// and `second-field-align` of a bibliography into typed parameters.
/// Other options are ignored.
/// Values outside the domain of their option are `Style_Error::option_value` errors.
[[nodiscard]]
Result<Bib_Formatting_Parameters, Style_Error>
bib_formatting_parameters(const Option_Map& bib_options, Compile_Context& context);

} // namespace cslc

#endif
