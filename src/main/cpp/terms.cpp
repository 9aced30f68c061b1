#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "cslc/style_node.hpp"
#include "cslc/terms.hpp"

namespace cslc {

Term_Form term_form_by_name(std::u8string_view name)
{
    using enum Term_Form;
    static constexpr Term_Form all_forms[] { long_, short_, verb, verb_short, symbol };
    for (const Term_Form form : all_forms) {
        if (term_form_name(form) == name) {
            return form;
        }
    }
    return long_;
}

namespace {

[[nodiscard]]
Term make_term(const Style_Node& node, std::pmr::memory_resource* memory)
{
    return {
        .name = std::pmr::u8string { node.attribute_or(u8"name"), memory },
        .form = term_form_by_name(node.attribute_or(u8"form", u8"long")),
        .number = Term_Number::none,
        .gender = std::pmr::u8string { node.attribute_or(u8"gender"), memory },
        .gender_form = std::pmr::u8string { node.attribute_or(u8"gender-form"), memory },
        .match = std::pmr::u8string { node.attribute_or(u8"match"), memory },
        .value = std::pmr::u8string { memory },
    };
}

} // namespace

Term_List parse_term_list(std::span<const Style_Node> nodes, std::pmr::memory_resource* memory)
{
    Term_List result { memory };
    for (const Style_Node& node : nodes) {
        if (!node.is_element(u8"term")) {
            continue;
        }
        const Style_Node* const single = node.find_child(u8"single");
        const Style_Node* const multiple = node.find_child(u8"multiple");
        if (single == nullptr && multiple == nullptr) {
            Term term = make_term(node, memory);
            term.value = node.get_text_content(memory);
            result.terms.push_back(std::move(term));
            continue;
        }
        if (single) {
            Term term = make_term(node, memory);
            term.number = Term_Number::single;
            term.value = single->get_text_content(memory);
            result.terms.push_back(std::move(term));
        }
        if (multiple) {
            Term term = make_term(node, memory);
            term.number = Term_Number::multiple;
            term.value = multiple->get_text_content(memory);
            result.terms.push_back(std::move(term));
        }
    }
    return result;
}

Term_List merge_term_lists(Term_List&& new_terms, const Term_List& existing)
{
    Term_List result = std::move(new_terms);
    const std::size_t new_count = result.terms.size();
    for (const Term& term : existing.terms) {
        const auto new_end = result.terms.begin() + std::ptrdiff_t(new_count);
        const bool redefined = std::any_of(result.terms.begin(), new_end, [&](const Term& t) {
            return t.defines_same(term);
        });
        if (!redefined) {
            result.terms.push_back(term);
        }
    }
    return result;
}

const Term*
find_term(const Term_List& list, std::u8string_view name, Term_Form form, Term_Number number)
{
    while (true) {
        const auto it = std::ranges::find_if(list.terms, [&](const Term& term) {
            return term.name == name && term.form == form
                && (term.number == number || term.number == Term_Number::none);
        });
        if (it != list.terms.end()) {
            return &*it;
        }
        if (form == Term_Form::long_) {
            return nullptr;
        }
        form = term_form_fallback(form);
    }
}

} // namespace cslc
