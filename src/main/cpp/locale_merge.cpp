#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cslc/compile_context.hpp"
#include "cslc/style.hpp"
#include "cslc/style_node.hpp"
#include "cslc/terms.hpp"

namespace cslc {
namespace {

[[nodiscard]]
Date_Format make_date_format(const Style_Node& date, std::pmr::memory_resource* memory)
{
    Date_Format result { .attributes = copy_attributes(date.attributes, memory),
                         .parts = std::pmr::vector<Date_Part_Format> { memory } };
    for (const Style_Node& part : date.children) {
        if (!part.is_element(u8"date-part")) {
            continue;
        }
        result.parts.push_back({
            .name = std::pmr::u8string { part.attribute_or(u8"name"), memory },
            .attributes = copy_attributes(part.attributes, memory),
        });
    }
    return result;
}

} // namespace

void merge_locale(Compiled_Style& style, const Style_Node& locale, Compile_Context& context)
{
    std::pmr::memory_resource* const memory = context.get_memory();

    for (const Style_Node& child : locale.children) {
        if (child.is_element(u8"style-options")) {
            style.locale_options.extend(child.attributes);
        }
        else if (child.is_element(u8"date")) {
            std::optional<Date_Format>& target
                = child.attribute_or(u8"form") == u8"text" ? style.date_text : style.date_numeric;
            if (!target) {
                target = make_date_format(child, memory);
            }
        }
        else if (child.is_element(u8"terms")) {
            Term_List terms = parse_term_list(child.children, memory);
            if (style.terms) {
                style.terms = merge_term_lists(std::move(terms), *style.terms);
            }
            else {
                style.terms = std::move(terms);
            }
        }
    }
}

} // namespace cslc
