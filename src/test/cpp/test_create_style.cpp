#include <filesystem>
#include <memory_resource>
#include <string_view>

#include <gtest/gtest.h>

#include "cslc/util/result.hpp"
#include "cslc/util/severity.hpp"

#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/locale.hpp"
#include "cslc/services.hpp"
#include "cslc/style.hpp"
#include "cslc/style_error.hpp"
#include "cslc/terms.hpp"

#include "collecting_logger.hpp"

namespace cslc {
namespace {

constexpr std::u8string_view author_date_style = u8"test/styles/author-date.csl";
constexpr std::u8string_view note_style = u8"test/styles/note.csl";

struct Create_Style_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Compile_Context context { &memory, logger };
    Directory_Locale_Getter locales { std::filesystem::path { "test/locales" } };

    [[nodiscard]]
    Result<Compiled_Style, Style_Error>
    create(std::u8string_view style, const Style_Options& options = {})
    {
        return create_style(style, locales, options, context);
    }

    [[nodiscard]]
    static std::u8string_view term_value(
        const Compiled_Style& style,
        std::u8string_view name,
        Term_Form form = Term_Form::long_
    )
    {
        if (!style.terms) {
            return {};
        }
        const Term* const term = find_term(*style.terms, name, form);
        return term ? std::u8string_view { term->value } : std::u8string_view {};
    }
};

TEST_F(Create_Style_Test, author_date_in_fallback_locale)
{
    const Result<Compiled_Style, Style_Error> style = create(author_date_style);
    ASSERT_TRUE(style);
    EXPECT_EQ(style->locale, u8"en-US");
    EXPECT_TRUE(style->uses_year_suffix_variable);
    EXPECT_FALSE(style->cite_note);
    ASSERT_TRUE(style->cite_layout);
    ASSERT_TRUE(style->bib_layout);
    ASSERT_TRUE(style->cite_sort);
    EXPECT_EQ(style->cite_sort->orders.size(), 2);
    EXPECT_NE(style->find_macro(u8"author"), nullptr);
    EXPECT_NE(style->find_macro(u8"year"), nullptr);

    EXPECT_EQ(style->options.find(u8"demote-non-dropping-particle"), u8"never");
    EXPECT_EQ(style->options.find(u8"initialize-with-hyphen"), u8"true");
    EXPECT_EQ(style->locale_options.find(u8"punctuation-in-quote"), u8"true");
    EXPECT_EQ(style->bib_options.find(u8"entry-spacing"), u8"0");
    EXPECT_EQ(style->bib_options.find(u8"line-spacing"), u8"1");

    EXPECT_EQ(style->cite_options.find(u8"cite-group-delimiter"), u8", ");
    EXPECT_EQ(style->cite_options.find(u8"after-collapse-delimiter"), u8"; ");
    EXPECT_EQ(style->cite_options.find(u8"year-suffix-delimiter"), u8"; ");

    EXPECT_EQ(term_value(*style, u8"and"), u8"and");
    EXPECT_EQ(term_value(*style, u8"editor", Term_Form::short_), u8"ed.");
    EXPECT_EQ(term_value(*style, u8"editor", Term_Form::verb_short), u8"edited by");

    ASSERT_TRUE(style->date_text);
    ASSERT_FALSE(style->date_text->parts.empty());
    EXPECT_EQ(style->date_text->parts.front().name, u8"month");
    ASSERT_TRUE(style->date_numeric);

    EXPECT_TRUE(logger.was_logged(diagnostic::locale_merged));
    EXPECT_TRUE(logger.was_logged(diagnostic::locale_ignored));
    EXPECT_EQ(logger.count_at_least(Severity::warning), 0);
}

TEST_F(Create_Style_Test, style_terms_override_external_terms)
{
    const Result<Compiled_Style, Style_Error> style
        = create(author_date_style, { .locale = u8"de" });
    ASSERT_TRUE(style);
    EXPECT_EQ(style->locale, u8"de");

    EXPECT_EQ(term_value(*style, u8"editor", Term_Form::short_), u8"Hrsg.");
    EXPECT_EQ(term_value(*style, u8"editor"), u8"Herausgeber");
    EXPECT_EQ(term_value(*style, u8"and"), u8"und");
    EXPECT_EQ(term_value(*style, u8"et-al"), u8"u. a.");

    // Set by the style's own German locale, before the external one.
    EXPECT_EQ(style->locale_options.find(u8"punctuation-in-quote"), u8"true");

    ASSERT_TRUE(style->date_text);
    ASSERT_FALSE(style->date_text->parts.empty());
    EXPECT_EQ(style->date_text->parts.front().name, u8"day");
}

TEST_F(Create_Style_Test, default_locale_wins)
{
    const Result<Compiled_Style, Style_Error> style
        = create(note_style, { .locale = u8"en-GB" });
    ASSERT_TRUE(style);
    EXPECT_EQ(style->default_locale, u8"de-AT");
    EXPECT_EQ(style->locale, u8"de-AT");
    EXPECT_TRUE(style->cite_note);
    // There is no file for de-AT, so the en-US file is used.
    EXPECT_EQ(term_value(*style, u8"and"), u8"and");
}

TEST_F(Create_Style_Test, default_locale_without_request)
{
    const Result<Compiled_Style, Style_Error> style = create(note_style);
    ASSERT_TRUE(style);
    EXPECT_EQ(style->locale, u8"de-AT");
}

TEST_F(Create_Style_Test, force_locale)
{
    const Result<Compiled_Style, Style_Error> style
        = create(note_style, { .locale = u8"de-DE", .force_locale = true });
    ASSERT_TRUE(style);
    EXPECT_EQ(style->locale, u8"de-DE");
    EXPECT_EQ(term_value(*style, u8"and"), u8"und");
    EXPECT_EQ(style->locale_options.find(u8"punctuation-in-quote"), u8"false");
}

constexpr std::u8string_view two_locale_style
    = u8R"(<style default-locale="de-DE">)"
      u8R"(<locale xml:lang="de"><terms><term name="and">de-in-style</term></terms></locale>)"
      u8R"(<locale xml:lang="en"><terms><term name="and">en-in-style</term></terms></locale>)"
      u8R"(<citation><layout><text variable="title"/></layout></citation>)"
      u8R"(<bibliography><layout><text variable="title"/></layout></bibliography></style>)";

TEST_F(Create_Style_Test, style_locale_block_matches_effective_locale)
{
    const Result<Compiled_Style, Style_Error> style
        = create(two_locale_style, { .locale = u8"en-US" });
    ASSERT_TRUE(style);
    EXPECT_EQ(style->locale, u8"de-DE");
    EXPECT_EQ(term_value(*style, u8"and"), u8"de-in-style");
    EXPECT_EQ(term_value(*style, u8"et-al"), u8"u. a.");
}

TEST_F(Create_Style_Test, forced_locale_selects_style_locale_block)
{
    const Result<Compiled_Style, Style_Error> style
        = create(two_locale_style, { .locale = u8"en-US", .force_locale = true });
    ASSERT_TRUE(style);
    EXPECT_EQ(style->locale, u8"en-US");
    EXPECT_EQ(term_value(*style, u8"and"), u8"en-in-style");
    EXPECT_EQ(term_value(*style, u8"et-al"), u8"et al.");
}

TEST_F(Create_Style_Test, without_locale_getter)
{
    No_Locale_Getter no_locales;
    const Result<Compiled_Style, Style_Error> style
        = create_style(author_date_style, no_locales, {}, context);
    ASSERT_TRUE(style);
    EXPECT_TRUE(logger.was_logged(diagnostic::locale_load));
    EXPECT_EQ(logger.count_at_least(Severity::warning), 1);

    ASSERT_TRUE(style->terms);
    EXPECT_EQ(style->terms->size(), 1);
    EXPECT_FALSE(style->date_text);
    EXPECT_EQ(style->locale_options.find(u8"punctuation-in-quote"), u8"false");
}

TEST_F(Create_Style_Test, inline_style)
{
    const Result<Compiled_Style, Style_Error> style = create(
        u8R"(  <style><citation><layout><text variable="title"/></layout></citation>)"
        u8R"(<bibliography><layout><text variable="title"/></layout></bibliography></style>)"
    );
    ASSERT_TRUE(style);
    EXPECT_FALSE(style->uses_year_suffix_variable);
    EXPECT_EQ(style->locale, u8"en-US");
    EXPECT_FALSE(style->cite_options.contains(u8"cite-group-delimiter"));
}

TEST_F(Create_Style_Test, missing_bibliography)
{
    const Result<Compiled_Style, Style_Error> style
        = create(u8"test/styles/missing-bibliography.csl");
    ASSERT_FALSE(style);
    EXPECT_EQ(style.error(), Style_Error::structure);
    EXPECT_TRUE(logger.was_logged(diagnostic::layout_missing));
}

TEST_F(Create_Style_Test, missing_file)
{
    const Result<Compiled_Style, Style_Error> style = create(u8"test/styles/no-such-style.csl");
    ASSERT_FALSE(style);
    EXPECT_EQ(style.error(), Style_Error::input);
    EXPECT_TRUE(logger.was_logged(diagnostic::style_input));
}

TEST_F(Create_Style_Test, quiet_compilation)
{
    Compile_Context quiet { &memory, ignorant_logger };
    EXPECT_FALSE(quiet.emits(Severity::fatal));

    const Result<Compiled_Style, Style_Error> style
        = create_style(author_date_style, locales, {}, quiet);
    ASSERT_TRUE(style);
    const Result<Compiled_Style, Style_Error> missing
        = create_style(u8"test/styles/no-such-style.csl", locales, {}, quiet);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error(), Style_Error::input);
}

} // namespace
} // namespace cslc
