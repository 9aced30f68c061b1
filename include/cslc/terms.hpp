#ifndef CSLC_TERMS_HPP
#define CSLC_TERMS_HPP

#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cslc/util/assert.hpp"

#include "cslc/fwd.hpp"
#include "cslc/style_node.hpp"

namespace cslc {

enum struct Term_Form : Default_Underlying {
    long_,
    short_,
    verb,
    verb_short,
    symbol,
};

enum struct Term_Number : Default_Underlying {
    /// @brief The term has the same form in singular and plural.
    none,
    single,
    multiple,
};

[[nodiscard]]
constexpr std::u8string_view term_form_name(Term_Form form)
{
    using enum Term_Form;
    switch (form) {
    case long_: return u8"long";
    case short_: return u8"short";
    case verb: return u8"verb";
    case verb_short: return u8"verb-short";
    case symbol: return u8"symbol";
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid term form.");
}

/// @brief Returns the form named `name`.
/// Unrecognized names yield `Term_Form::long_`, which is the default form.
[[nodiscard]]
Term_Form term_form_by_name(std::u8string_view name);

/// @brief Returns the form to try when a term is not defined in `form`,
/// which is `long_` for `long_` itself.
[[nodiscard]]
constexpr Term_Form term_form_fallback(Term_Form form)
{
    using enum Term_Form;
    switch (form) {
    case verb_short: return verb;
    case symbol: return short_;
    case long_:
    case short_:
    case verb: return long_;
    }
    CSLC_ASSERT_UNREACHABLE(u8"Invalid term form.");
}

struct Term {
    std::pmr::u8string name;
    Term_Form form = Term_Form::long_;
    Term_Number number = Term_Number::none;
    std::pmr::u8string gender;
    std::pmr::u8string gender_form;
    std::pmr::u8string match;
    std::pmr::u8string value;

    /// @brief Returns `true` iff `*this` and `other` define the same term,
    /// so that one replaces the other when term lists are merged.
    [[nodiscard]]
    bool defines_same(const Term& other) const
    {
        return name == other.name && form == other.form && number == other.number
            && gender_form == other.gender_form;
    }
};

struct Term_List {
    std::pmr::vector<Term> terms;

    [[nodiscard]]
    explicit Term_List(std::pmr::memory_resource* memory)
        : terms { memory }
    {
    }

    [[nodiscard]]
    std::size_t size() const
    {
        return terms.size();
    }
};

/// @brief Parses the `term` elements among `nodes` into a term list.
/// A term with `single` and `multiple` children yields one term per number;
/// a term with plain text yields a single term of number `none`.
[[nodiscard]]
Term_List parse_term_list(std::span<const Style_Node> nodes, std::pmr::memory_resource* memory);

/// @brief Merges `new_terms` into `existing`.
/// The result contains every new term,
/// followed by the existing terms that are not redefined by any new term.
[[nodiscard]]
Term_List merge_term_lists(Term_List&& new_terms, const Term_List& existing);

/// @brief Looks up a term, falling back along the chain of forms
/// (`verb-short` to `verb` to `long`, `symbol` to `short` to `long`).
/// A term of number `none` matches any requested number.
/// @returns The term, or `nullptr` if none matches.
[[nodiscard]]
const Term* find_term(
    const Term_List& list,
    std::u8string_view name,
    Term_Form form = Term_Form::long_,
    Term_Number number = Term_Number::single
);

} // namespace cslc

#endif
