#ifndef CSLC_STYLE_ERROR_HPP
#define CSLC_STYLE_ERROR_HPP

#include <string_view>

#include "cslc/util/assert.hpp"

#include "cslc/fwd.hpp"

namespace cslc {

/// @brief The kinds of errors which abort the compilation of a style.
/// None of them are recoverable;
/// a failed compilation never yields a partially built style.
enum struct Style_Error : Default_Underlying {
    /// @brief The style identifier is neither inline XML nor a readable file.
    input,
    /// @brief The XML is malformed.
    parse,
    /// @brief A fragment lacks required children,
    /// or an element appears where it has no meaning.
    structure,
    /// @brief An option holds a value outside its accepted domain.
    option_value,
    /// @brief An element has a tag name that is not part of the style language.
    unknown_tag,
};

[[nodiscard]]
constexpr std::u8string_view style_error_name(Style_Error error)
{
    using enum Style_Error;
    switch (error) {
        CSLC_ENUM_STRING_CASE8(input);
        CSLC_ENUM_STRING_CASE8(parse);
        CSLC_ENUM_STRING_CASE8(structure);
        CSLC_ENUM_STRING_CASE8(option_value);
        CSLC_ENUM_STRING_CASE8(unknown_tag);
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid style error.");
}

} // namespace cslc

#endif
