#include <filesystem>
#include <fstream>
#include <memory_resource>
#include <string>
#include <optional>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>

#include "cslc/util/result.hpp"

#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"
#include "cslc/xml.hpp"

#include "collecting_logger.hpp"

namespace cslc {
namespace {

struct XML_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Compile_Context context { &memory, logger };
};

TEST_F(XML_Test, elements_attributes_and_text)
{
    const Result<Style_Node, Style_Error> root
        = parse_xml(u8R"(<a x="1" y="two"><b>text</b><c/></a>)", context);
    ASSERT_TRUE(root);
    EXPECT_TRUE(logger.nothing_logged());

    EXPECT_TRUE(root->is_element(u8"a"));
    ASSERT_EQ(root->attributes.size(), 2);
    EXPECT_EQ(root->attributes[0].name, u8"x");
    EXPECT_EQ(root->attributes[0].value, u8"1");
    EXPECT_EQ(root->attribute_or(u8"y"), u8"two");
    EXPECT_EQ(root->find_attribute(u8"z"), std::nullopt);

    ASSERT_EQ(root->children.size(), 2);
    EXPECT_TRUE(root->children[0].is_element(u8"b"));
    EXPECT_EQ(root->children[0].get_text_content(&memory), u8"text");
    EXPECT_TRUE(root->children[1].is_element(u8"c"));
    EXPECT_TRUE(root->children[1].children.empty());
}

TEST_F(XML_Test, namespaced_attributes_use_local_name)
{
    const Result<Style_Node, Style_Error> root = parse_xml(
        u8R"(<locale xmlns="http://purl.org/net/xbiblio/csl" xml:lang="de"/>)", context
    );
    ASSERT_TRUE(root);
    EXPECT_TRUE(root->is_element(u8"locale"));
    EXPECT_EQ(root->attribute_or(u8"lang"), u8"de");
}

TEST_F(XML_Test, entities_and_cdata_become_text)
{
    const Result<Style_Node, Style_Error> root
        = parse_xml(u8"<t>a &amp; b<![CDATA[ <c> ]]></t>", context);
    ASSERT_TRUE(root);
    EXPECT_EQ(root->get_text_content(&memory), u8"a & b <c> ");
}

TEST_F(XML_Test, internal_entities_are_substituted)
{
    const Result<Style_Node, Style_Error> root
        = parse_xml(u8R"(<!DOCTYPE t [<!ENTITY x "ex">]><t>a&x;b</t>)", context);
    ASSERT_TRUE(root);
    EXPECT_EQ(root->get_text_content(&memory), u8"aexb");
}

TEST_F(XML_Test, external_entities_are_not_loaded)
{
    const std::filesystem::path secret_path
        = std::filesystem::temp_directory_path() / "cslc_external_entity.txt";
    {
        std::ofstream secret { secret_path };
        ASSERT_TRUE(secret);
        secret << "secret contents";
    }
    const std::string path = secret_path.string();
    std::u8string xml = u8"<!DOCTYPE t [<!ENTITY x SYSTEM \"file://";
    xml.append(path.begin(), path.end());
    xml += u8"\">]><t>[&x;]</t>";

    const Result<Style_Node, Style_Error> root = parse_xml(xml, context);
    std::filesystem::remove(secret_path);
    if (root) {
        const std::pmr::u8string text = root->get_text_content(&memory);
        EXPECT_EQ(std::u8string_view { text }.find(u8"secret"), std::u8string_view::npos);
    }
    else {
        EXPECT_EQ(root.error(), Style_Error::parse);
    }
}

TEST_F(XML_Test, comments_are_kept_until_stripped)
{
    Result<Style_Node, Style_Error> root = parse_xml(u8"<a>\n  <!-- x -->\n  <b/>\n</a>", context);
    ASSERT_TRUE(root);
    // blank text, comment, blank text, element, blank text
    ASSERT_EQ(root->children.size(), 5);
    EXPECT_EQ(root->children[1].kind, Style_Node_Kind::comment);

    const Style_Node stripped = strip_comments(std::move(*root));
    ASSERT_EQ(stripped.children.size(), 3);
    EXPECT_EQ(stripped.children[0].get_text(), u8"\n  \n  ");
    EXPECT_TRUE(stripped.children[1].is_element(u8"b"));
    EXPECT_TRUE(is_blank_text(stripped.children[2]));
}

TEST_F(XML_Test, strip_comments_is_recursive)
{
    Result<Style_Node, Style_Error> root
        = parse_xml(u8"<a><b><!--x--><c/><!--y--></b> text </a>", context);
    ASSERT_TRUE(root);
    const Style_Node stripped = strip_comments(std::move(*root));
    ASSERT_EQ(stripped.children.size(), 2);
    const Style_Node& b = stripped.children[0];
    ASSERT_EQ(b.children.size(), 1);
    EXPECT_TRUE(b.children[0].is_element(u8"c"));
    EXPECT_TRUE(stripped.children[1].is_text());
    EXPECT_EQ(stripped.children[1].get_text(), u8" text ");
}

TEST_F(XML_Test, strip_comments_joins_surrounding_text)
{
    Result<Style_Node, Style_Error> root = parse_xml(u8"<t>a<!-- x -->b <!-- y --> </t>", context);
    ASSERT_TRUE(root);
    const Style_Node stripped = strip_comments(std::move(*root));
    ASSERT_EQ(stripped.children.size(), 1);
    EXPECT_EQ(stripped.children[0].get_text(), u8"ab  ");
    EXPECT_FALSE(is_blank_text(stripped.children[0]));
    EXPECT_FALSE(is_blank_text(stripped));
}

TEST_F(XML_Test, find_child_and_first_element_child)
{
    Result<Style_Node, Style_Error> root = parse_xml(u8"<a>x<b/><c/><b id='2'/></a>", context);
    ASSERT_TRUE(root);
    ASSERT_NE(root->find_child(u8"c"), nullptr);
    EXPECT_EQ(root->find_child(u8"b")->find_attribute(u8"id"), std::nullopt);
    EXPECT_EQ(root->find_child(u8"d"), nullptr);
    ASSERT_NE(root->first_element_child(), nullptr);
    EXPECT_TRUE(root->first_element_child()->is_element(u8"b"));
}

TEST_F(XML_Test, malformed)
{
    const Result<Style_Node, Style_Error> root = parse_xml(u8"<a><b></a>", context);
    ASSERT_FALSE(root);
    EXPECT_EQ(root.error(), Style_Error::parse);
    EXPECT_TRUE(logger.was_logged(diagnostic::xml_parse));
}

TEST_F(XML_Test, empty_input_is_an_error)
{
    const Result<Style_Node, Style_Error> root = parse_xml(u8"", context);
    ASSERT_FALSE(root);
    EXPECT_EQ(root.error(), Style_Error::parse);
}

} // namespace
} // namespace cslc
