#include <optional>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "cslc/util/result.hpp"

#include "cslc/compile.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/render.hpp"
#include "cslc/style_error.hpp"

#include "compile_test.hpp"

namespace cslc {
namespace {

TEST(Style_Tag, names_round_trip)
{
    for (int i = 0; i <= int(Style_Tag::text); ++i) {
        const auto tag = Style_Tag(i);
        EXPECT_EQ(style_tag_by_name(style_tag_name(tag)), tag);
    }
    EXPECT_EQ(style_tag_by_name(u8"date-part"), Style_Tag::date_part);
    EXPECT_EQ(style_tag_by_name(u8"else-if"), Style_Tag::else_if);
    EXPECT_EQ(style_tag_by_name(u8"date_part"), std::nullopt);
    EXPECT_EQ(style_tag_by_name(u8"title"), std::nullopt);
}

TEST(Style_Tag, render_tags)
{
    EXPECT_EQ(style_tag_render_tag(Style_Tag::text), Render_Tag::text);
    EXPECT_EQ(style_tag_render_tag(Style_Tag::if_), Render_Tag::if_);
    EXPECT_EQ(style_tag_render_tag(Style_Tag::names), std::nullopt);
    EXPECT_EQ(style_tag_render_tag(Style_Tag::locale), std::nullopt);
    EXPECT_EQ(style_tag_render_tag(Style_Tag::macro), std::nullopt);
}

using Compile_Node_Test = Compile_Test;

TEST_F(Compile_Node_Test, text_leaf_is_constant)
{
    const Style_Node leaf = Style_Node::text(u8"abc", &memory);
    const Result<Render_Node, Style_Error> node = compile_node(leaf, context);
    ASSERT_TRUE(node);
    ASSERT_EQ(node->get_kind(), Render_Node_Kind::text);
    EXPECT_EQ(node->as_text().text, u8"abc");

    const Rendered result = render(*node);
    EXPECT_EQ(result.text, u8"abc");
    EXPECT_EQ(result.kind, Rendered_Kind::text_only);
    EXPECT_TRUE(runtime.calls.empty());
}

TEST_F(Compile_Node_Test, element_keeps_attributes_and_children)
{
    const Result<Render_Node, Style_Error> node = compile(
        u8R"(<group delimiter=", " prefix="["><text value="a"/><text variable="title"/></group>)"
    );
    ASSERT_TRUE(node);
    ASSERT_EQ(node->get_kind(), Render_Node_Kind::element);
    const Render_Element& group = node->as_element();
    EXPECT_EQ(group.tag, Render_Tag::group);
    ASSERT_EQ(group.attributes.size(), 2);
    EXPECT_EQ(group.attributes[0].name, u8"delimiter");
    EXPECT_EQ(group.attributes[1].value, u8"[");
    ASSERT_EQ(group.children.size(), 2);
    EXPECT_EQ(group.children[0].as_element().tag, Render_Tag::text);
}

TEST_F(Compile_Node_Test, blank_text_between_elements_is_skipped)
{
    const Result<Render_Node, Style_Error> node = compile(u8R"(<group delimiter=", ">
  <text value="a"/>
  <!-- b -->
  <text value="c"/>
</group>)");
    ASSERT_TRUE(node);
    const Render_Element& group = node->as_element();
    ASSERT_EQ(group.children.size(), 2);
    EXPECT_EQ(group.children[0].get_kind(), Render_Node_Kind::element);
    EXPECT_EQ(group.children[1].get_kind(), Render_Node_Kind::element);
    EXPECT_EQ(render(*node).text, u8"a, c");
}

TEST_F(Compile_Node_Test, children_are_evaluated_before_their_parent)
{
    const Result<Render_Node, Style_Error> node = compile(
        u8R"(<group delimiter=", "><text value="a"/><text variable="title"/></group>)"
    );
    ASSERT_TRUE(node);
    runtime.variables.emplace(u8"title", u8"Title");

    const Rendered result = render(*node);
    EXPECT_EQ(result.text, u8"a, Title");
    EXPECT_EQ(result.kind, Rendered_Kind::present_vars);
    const std::vector<std::u8string> expected_calls { u8"text", u8"text", u8"group" };
    EXPECT_EQ(runtime.calls, expected_calls);
}

TEST_F(Compile_Node_Test, context_is_supplied_per_evaluation)
{
    const Result<Render_Node, Style_Error> node = compile(u8R"(<text variable="title"/>)");
    ASSERT_TRUE(node);

    runtime.variables.emplace(u8"title", u8"First");
    EXPECT_EQ(render(*node).text, u8"First");
    runtime.variables[u8"title"] = u8"Second";
    EXPECT_EQ(render(*node).text, u8"Second");
    runtime.variables.clear();
    const Rendered empty = render(*node);
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.kind, Rendered_Kind::empty_vars);
}

TEST_F(Compile_Node_Test, every_render_tag_reaches_its_primitive)
{
    const Result<Render_Node, Style_Error> node = compile(
        u8"<layout>"
        u8"<choose><if type='book'><number variable='volume'/></if>"
        u8"<else-if type='chapter'><label variable='page'/></else-if>"
        u8"<else><date variable='issued'><date-part name='year'/></date></else></choose>"
        u8"</layout>"
    );
    ASSERT_TRUE(node);
    std::ignore = render(*node);
    const std::vector<std::u8string> expected_calls {
        u8"number", u8"if",        u8"label", u8"else-if", u8"date-part",
        u8"date",   u8"else",      u8"choose", u8"layout",
    };
    EXPECT_EQ(runtime.calls, expected_calls);
}

TEST_F(Compile_Node_Test, unknown_tag)
{
    const Result<Render_Node, Style_Error> node = compile(u8"<group><blink/></group>");
    ASSERT_FALSE(node);
    EXPECT_EQ(node.error(), Style_Error::unknown_tag);
    EXPECT_TRUE(logger.was_logged(diagnostic::tag_unknown));
}

TEST_F(Compile_Node_Test, misplaced_tags)
{
    for (const std::u8string_view xml : {
             u8"<group><locale/></group>",
             u8"<group><name/></group>",
             u8"<group><et-al/></group>",
             u8"<group><substitute/></group>",
             u8"<group><name-part/></group>",
             u8"<group><macro name='m'/></group>",
             u8"<info/>",
             u8"<citation/>",
         }) {
        const Result<Render_Node, Style_Error> node = compile(xml);
        ASSERT_FALSE(node);
        EXPECT_EQ(node.error(), Style_Error::structure);
    }
    EXPECT_TRUE(logger.was_logged(diagnostic::tag_misplaced));
}

TEST_F(Compile_Node_Test, macro_body_discards_macro_attributes)
{
    const Result<Render_Node, Style_Error> node
        = compile_macro(parse(u8R"(<macro name="m"><text value="x"/></macro>)"), context);
    ASSERT_TRUE(node);
    const Render_Element& macro = node->as_element();
    EXPECT_EQ(macro.tag, Render_Tag::macro);
    EXPECT_TRUE(macro.attributes.empty());
    ASSERT_EQ(macro.children.size(), 1);
    EXPECT_EQ(render(*node).text, u8"x");
}

TEST_F(Compile_Node_Test, evaluate_macro)
{
    Result<Render_Node, Style_Error> body
        = compile_macro(parse(u8R"(<macro name="m"><text variable="title"/></macro>)"), context);
    ASSERT_TRUE(body);
    style.macros.emplace(u8"m", std::move(*body));
    runtime.variables.emplace(u8"title", u8"T");

    Render_Context render_context { runtime, style, &memory };
    const std::optional<Rendered> result = evaluate_macro(u8"m", render_context);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->text, u8"T");
    EXPECT_EQ(evaluate_macro(u8"n", render_context), std::nullopt);
}

TEST_F(Compile_Node_Test, macro_call_renders_like_inlined_body)
{
    Result<Render_Node, Style_Error> body = compile_macro(
        parse(
            u8R"(<macro name="m">)"
            u8R"(<group delimiter="-"><text variable="a"/><text value="b"/></group>)"
            u8R"(</macro>)"
        ),
        context
    );
    ASSERT_TRUE(body);
    style.macros.emplace(u8"m", std::move(*body));
    runtime.variables.emplace(u8"a", u8"A");

    const Result<Render_Node, Style_Error> via_macro
        = compile(u8R"(<layout><text macro="m"/></layout>)");
    const Result<Render_Node, Style_Error> inlined = compile(
        u8R"(<layout><group delimiter="-"><text variable="a"/><text value="b"/></group></layout>)"
    );
    ASSERT_TRUE(via_macro);
    ASSERT_TRUE(inlined);
    EXPECT_EQ(render(*via_macro).text, render(*inlined).text);
    EXPECT_EQ(render(*via_macro).text, u8"A-b");
}

} // namespace
} // namespace cslc
