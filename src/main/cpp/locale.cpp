#include <filesystem>
#include <memory_resource>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "cslc/util/io.hpp"
#include "cslc/util/result.hpp"
#include "cslc/util/strings.hpp"

#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/locale.hpp"
#include "cslc/settings.hpp"
#include "cslc/style_node.hpp"
#include "cslc/xml.hpp"

using namespace std::string_view_literals;

namespace cslc {
namespace {

struct Default_Variant {
    std::u8string_view language;
    std::u8string_view locale;
};

// The variant used for each language when only the language is given,
// following the file names of the CSL locales repository.
constexpr Default_Variant default_variants[] {
    { u8"af", u8"af-ZA" }, { u8"bg", u8"bg-BG" }, { u8"ca", u8"ca-AD" }, { u8"cs", u8"cs-CZ" },
    { u8"cy", u8"cy-GB" }, { u8"da", u8"da-DK" }, { u8"de", u8"de-DE" }, { u8"el", u8"el-GR" },
    { u8"en", u8"en-US" }, { u8"es", u8"es-ES" }, { u8"et", u8"et-EE" }, { u8"fa", u8"fa-IR" },
    { u8"fi", u8"fi-FI" }, { u8"fr", u8"fr-FR" }, { u8"he", u8"he-IL" }, { u8"hr", u8"hr-HR" },
    { u8"hu", u8"hu-HU" }, { u8"id", u8"id-ID" }, { u8"is", u8"is-IS" }, { u8"it", u8"it-IT" },
    { u8"ja", u8"ja-JP" }, { u8"km", u8"km-KH" }, { u8"ko", u8"ko-KR" }, { u8"lt", u8"lt-LT" },
    { u8"lv", u8"lv-LV" }, { u8"mn", u8"mn-MN" }, { u8"nb", u8"nb-NO" }, { u8"nl", u8"nl-NL" },
    { u8"nn", u8"nn-NO" }, { u8"pl", u8"pl-PL" }, { u8"pt", u8"pt-PT" }, { u8"ro", u8"ro-RO" },
    { u8"ru", u8"ru-RU" }, { u8"sk", u8"sk-SK" }, { u8"sl", u8"sl-SI" }, { u8"sr", u8"sr-RS" },
    { u8"sv", u8"sv-SE" }, { u8"th", u8"th-TH" }, { u8"tr", u8"tr-TR" }, { u8"uk", u8"uk-UA" },
    { u8"vi", u8"vi-VN" }, { u8"zh", u8"zh-CN" },
};

[[nodiscard]]
constexpr bool is_subtag_separator(char8_t c)
{
    return c == u8'-' || c == u8'_';
}

[[nodiscard]]
bool locale_equals(std::u8string_view x, std::u8string_view y)
{
    if (x.length() != y.length()) {
        return false;
    }
    for (std::size_t i = 0; i < x.length(); ++i) {
        const bool both_separators = is_subtag_separator(x[i]) && is_subtag_separator(y[i]);
        if (!both_separators && to_ascii_lower(x[i]) != to_ascii_lower(y[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

std::u8string_view locale_language(std::u8string_view locale)
{
    for (std::size_t i = 0; i < locale.length(); ++i) {
        if (is_subtag_separator(locale[i])) {
            return locale.substr(0, i);
        }
    }
    return locale;
}

bool locale_is_compatible(std::u8string_view candidate, std::u8string_view requested)
{
    if (candidate.empty()) {
        return true;
    }
    const std::u8string_view candidate_language = locale_language(candidate);
    if (candidate_language.length() == candidate.length()) {
        return equals_ascii_ignore_case(candidate_language, locale_language(requested));
    }
    return locale_equals(candidate, requested);
}

std::u8string_view locale_extend(std::u8string_view locale)
{
    if (locale_language(locale).length() != locale.length()) {
        return locale;
    }
    for (const Default_Variant& variant : default_variants) {
        if (equals_ascii_ignore_case(variant.language, locale)) {
            return variant.locale;
        }
    }
    return locale;
}

std::filesystem::path Directory_Locale_Getter::locale_file_path(std::u8string_view locale) const
{
    std::u8string file_name { u8"locales-" };
    file_name += locale_extend(locale);
    file_name += u8".xml";
    return m_directory / file_name;
}

Result<Style_Node, Style_Error>
Directory_Locale_Getter::operator()(std::u8string_view locale, Compile_Context& context)
{
    std::filesystem::path path = locale_file_path(locale);
    std::error_code error;
    if (!std::filesystem::exists(path, error)) {
        context.try_debug(
            diagnostic::locale_load, u8"No locale file for \""sv, locale,
            u8"\", falling back to en-US."sv
        );
        path = locale_file_path(fallback_locale);
    }

    const std::u8string path_string = path.u8string();
    Result<std::pmr::vector<char8_t>, IO_Error_Code> text
        = load_utf8_file(path_string, context.get_memory());
    if (!text) {
        context.try_error(
            diagnostic::locale_load, path_string, u8": "sv, io_error_code_message(text.error())
        );
        return Style_Error::input;
    }

    Result<Style_Node, Style_Error> root = parse_xml(as_u8string_view(*text), context);
    if (!root) {
        return root.error();
    }
    if (!root->is_element(u8"locale")) {
        context.try_error(
            diagnostic::locale_load, path_string, u8": the root element is not <locale>."sv
        );
        return Style_Error::structure;
    }
    return strip_comments(std::move(*root));
}

} // namespace cslc
