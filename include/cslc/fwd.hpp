#ifndef CSLC_FWD_HPP
#define CSLC_FWD_HPP

namespace cslc {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define CSLC_ENUM_STRING_CASE(...)                                                                 \
    case __VA_ARGS__: return #__VA_ARGS__

#define CSLC_ENUM_STRING_CASE8(...)                                                                \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Bib_Formatting_Parameters;
struct Collecting_Logger;
struct Compile_Context;
struct Compiled_Style;
struct Date_Format;
struct Diagnostic;
struct Directory_Locale_Getter;
struct Error_Tag;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
struct Layout;
struct Layout_Fragment;
struct Locale_Getter;
struct Logger;
struct Names_Node;
struct Option_Map;
struct Parsed_Style;
struct Render_Context;
struct Render_Node;
struct Render_Runtime;
enum struct Render_Tag : Default_Underlying;
struct Rendered;
enum struct Rendered_Kind : Default_Underlying;
template <typename, typename>
struct Result;
enum struct Second_Field_Align : Default_Underlying;
enum struct Severity : Default_Underlying;
struct Sort;
struct Style_Attribute;
enum struct Style_Error : Default_Underlying;
struct Style_Node;
struct Style_Options;
enum struct Style_Tag : Default_Underlying;
struct Success_Tag;
struct Term;
enum struct Term_Form : Default_Underlying;
struct Term_List;
enum struct Term_Number : Default_Underlying;

template <typename>
struct Basic_Transparent_String_View_Equals;
template <typename>
struct Basic_Transparent_String_View_Hash;

using Transparent_String_View_Equals8 = Basic_Transparent_String_View_Equals<char8_t>;
using Transparent_String_View_Hash8 = Basic_Transparent_String_View_Hash<char8_t>;

} // namespace cslc

#endif
