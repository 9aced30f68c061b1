#ifndef CSLC_LOCALE_HPP
#define CSLC_LOCALE_HPP

#include <filesystem>
#include <string_view>
#include <utility>

#include "cslc/util/result.hpp"

#include "cslc/fwd.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"

namespace cslc {

/// @brief Returns `true` iff a `locale` element with `xml:lang` set to `candidate`
/// applies to `requested`.
/// An empty candidate applies to all locales,
/// a bare language like `de` applies to all regions of that language (`de-AT`, `de-DE`),
/// and a full identifier like `de-AT` only applies to itself.
/// Comparison ignores case and treats `_` like `-`.
[[nodiscard]]
bool locale_is_compatible(std::u8string_view candidate, std::u8string_view requested);

/// @brief Returns the language subtag of `locale`, like `de` for `de-AT`.
[[nodiscard]]
std::u8string_view locale_language(std::u8string_view locale);

/// @brief Expands a bare language to its default locale, like `de` to `de-DE`.
/// Identifiers with a region, and languages without known default, are returned unchanged.
[[nodiscard]]
std::u8string_view locale_extend(std::u8string_view locale);

/// @brief Obtains the XML of a locale, given its identifier.
struct Locale_Getter {
    virtual ~Locale_Getter() = default;

    /// @brief Returns the root `locale` element for `locale`, with comments stripped.
    [[nodiscard]]
    virtual Result<Style_Node, Style_Error> operator()(std::u8string_view locale, Compile_Context&)
        = 0;
};

/// @brief A `Locale_Getter` that never has any locale.
/// Styles created with it only have the locale data they contain themselves.
struct No_Locale_Getter final : Locale_Getter {
    [[nodiscard]]
    Result<Style_Node, Style_Error> operator()(std::u8string_view, Compile_Context&) final
    {
        return Style_Error::input;
    }
};

/// @brief Loads locales from a directory of `locales-xx-XX.xml` files,
/// as found in the CSL locales repository.
/// When no file exists for a locale, `en-US` is loaded instead.
struct Directory_Locale_Getter final : Locale_Getter {
private:
    std::filesystem::path m_directory;

public:
    [[nodiscard]]
    explicit Directory_Locale_Getter(std::filesystem::path directory)
        : m_directory { std::move(directory) }
    {
    }

    [[nodiscard]]
    Result<Style_Node, Style_Error>
    operator()(std::u8string_view locale, Compile_Context& context) final;

    [[nodiscard]]
    std::filesystem::path locale_file_path(std::u8string_view locale) const;
};

} // namespace cslc

#endif
