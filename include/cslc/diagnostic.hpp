#ifndef CSLC_DIAGNOSTIC_HPP
#define CSLC_DIAGNOSTIC_HPP

#include <string_view>

#include "cslc/util/severity.hpp"

#include "cslc/fwd.hpp"

namespace cslc {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// INGESTION =======================================================================================

/// @brief The style identifier is neither inline XML nor a readable file.
inline constexpr std::u8string_view style_input = u8"style.input";

/// @brief The style or locale text is not well-formed XML.
inline constexpr std::u8string_view xml_parse = u8"xml.parse";

// STYLE ASSEMBLY ==================================================================================

/// @brief The root element of a style is not `style`.
inline constexpr std::u8string_view style_root = u8"style.root";

/// @brief A `citation` or `bibliography` element is missing,
/// or lacks its `layout` child.
inline constexpr std::u8string_view layout_missing = u8"layout.missing";

/// @brief A `citation` or `bibliography` element has a child
/// where the `layout` (or `sort`) was expected.
inline constexpr std::u8string_view layout_unexpected = u8"layout.unexpected";

/// @brief A `macro` element has no `name` attribute.
inline constexpr std::u8string_view macro_name_missing = u8"macro.name.missing";

/// @brief A child of the `style` element has no meaning at the top level and was ignored.
inline constexpr std::u8string_view style_child_ignored = u8"style.child.ignored";

// COMPILATION =====================================================================================

/// @brief An element with an unknown tag name was encountered.
inline constexpr std::u8string_view tag_unknown = u8"tag.unknown";

/// @brief A known element appeared in a place where it cannot be rendered,
/// like a `name` outside of `names`.
inline constexpr std::u8string_view tag_misplaced = u8"tag.misplaced";

/// @brief A `names` element has no `variable` attribute.
inline constexpr std::u8string_view names_variable_missing = u8"names.variable.missing";

/// @brief A `names` element has neither a `name` nor a `label` child,
/// so the relative order of names and label is unknown.
inline constexpr std::u8string_view names_label_order = u8"names.label.order";

// LOCALES =========================================================================================

/// @brief A locale was merged into the style.
inline constexpr std::u8string_view locale_merged = u8"locale.merged";

/// @brief A locale embedded in the style was ignored,
/// either because it is incompatible or because another locale was merged already.
inline constexpr std::u8string_view locale_ignored = u8"locale.ignored";

/// @brief The external locale could not be loaded.
inline constexpr std::u8string_view locale_load = u8"locale.load";

// OPTIONS =========================================================================================

/// @brief An option holds a value outside of its domain.
inline constexpr std::u8string_view option_value = u8"option.value";

} // namespace diagnostic

} // namespace cslc

#endif
