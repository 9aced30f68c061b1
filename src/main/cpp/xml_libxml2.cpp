#include <climits>
#include <cstddef>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include "cslc/util/result.hpp"
#include "cslc/util/strings.hpp"

#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/style_node.hpp"
#include "cslc/xml.hpp"

using namespace std::string_view_literals;

namespace cslc {
namespace {

struct Doc_Deleter {
    void operator()(xmlDoc* doc) const noexcept
    {
        xmlFreeDoc(doc);
    }
};

struct Parser_Context_Deleter {
    void operator()(xmlParserCtxt* context) const noexcept
    {
        xmlFreeParserCtxt(context);
    }
};

struct Xml_String_Deleter {
    void operator()(xmlChar* str) const noexcept
    {
        xmlFree(str);
    }
};

using Unique_Doc = std::unique_ptr<xmlDoc, Doc_Deleter>;
using Unique_Parser_Context = std::unique_ptr<xmlParserCtxt, Parser_Context_Deleter>;
using Unique_Xml_String = std::unique_ptr<xmlChar, Xml_String_Deleter>;

xmlParserInputPtr refuse_external_entity(const char*, const char*, xmlParserCtxtPtr)
{
    return nullptr;
}

/// @brief Replaces the external entity loader of libxml2 for the lifetime of this object.
/// Internal entities are still substituted, but `SYSTEM` and `PUBLIC` entities
/// resolve to nothing, so parsing a style never reads other files.
struct Scoped_Entity_Loader {
    xmlExternalEntityLoader previous;

    explicit Scoped_Entity_Loader(xmlExternalEntityLoader loader)
        : previous { xmlGetExternalEntityLoader() }
    {
        xmlSetExternalEntityLoader(loader);
    }

    Scoped_Entity_Loader(const Scoped_Entity_Loader&) = delete;
    Scoped_Entity_Loader& operator=(const Scoped_Entity_Loader&) = delete;

    ~Scoped_Entity_Loader()
    {
        xmlSetExternalEntityLoader(previous);
    }
};

[[nodiscard]]
std::u8string_view xml_string_view(const xmlChar* str)
{
    if (str == nullptr) {
        return {};
    }
    return reinterpret_cast<const char8_t*>(str);
}

struct Tree_Builder {
    xmlDoc* doc;
    std::pmr::memory_resource* memory;

    [[nodiscard]]
    Style_Node build_element(const xmlNode* node) const
    {
        Style_Node result = Style_Node::element(xml_string_view(node->name), memory);

        for (const xmlAttr* attribute = node->properties; attribute; attribute = attribute->next) {
            const Unique_Xml_String value { xmlNodeListGetString(doc, attribute->children, 1) };
            result.attributes.push_back({
                .name = std::pmr::u8string { xml_string_view(attribute->name), memory },
                .value = std::pmr::u8string { xml_string_view(value.get()), memory },
            });
        }

        for (const xmlNode* child = node->children; child; child = child->next) {
            switch (child->type) {
            case XML_ELEMENT_NODE: {
                result.children.push_back(build_element(child));
                break;
            }
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE: {
                append_text(result, xml_string_view(child->content));
                break;
            }
            case XML_COMMENT_NODE: {
                result.children.push_back(
                    Style_Node::comment(xml_string_view(child->content), memory)
                );
                break;
            }
            default: break;
            }
        }
        return result;
    }

    /// @brief Appends `text` to the trailing text child if there is one,
    /// so that text split by entity boundaries forms a single node.
    void append_text(Style_Node& parent, std::u8string_view text) const
    {
        if (!parent.children.empty() && parent.children.back().is_text()) {
            parent.children.back().name_or_text += text;
            return;
        }
        parent.children.push_back(Style_Node::text(text, memory));
    }
};

} // namespace

Result<Style_Node, Style_Error> parse_xml(std::u8string_view text, Compile_Context& context)
{
    if (text.size() > std::size_t(INT_MAX)) {
        context.try_error(diagnostic::xml_parse, u8"The XML document is too large."sv);
        return Style_Error::parse;
    }

    const Unique_Parser_Context parser { xmlNewParserCtxt() };
    if (!parser) {
        context.try_error(diagnostic::xml_parse, u8"Failed to create an XML parser."sv);
        return Style_Error::parse;
    }

    constexpr int options = XML_PARSE_NONET | XML_PARSE_NOENT | XML_PARSE_NOERROR
        | XML_PARSE_NOWARNING | XML_PARSE_NOCDATA;
    const Scoped_Entity_Loader loader { refuse_external_entity };
    const Unique_Doc doc { xmlCtxtReadMemory(
        parser.get(), reinterpret_cast<const char*>(text.data()), int(text.size()), nullptr,
        "UTF-8", options
    ) };

    if (!doc) {
        const xmlError* const error = xmlCtxtGetLastError(parser.get());
        if (error != nullptr && error->message != nullptr) {
            const std::u8string_view message
                = xml_string_view(reinterpret_cast<const xmlChar*>(error->message));
            const auto line = std::to_string(error->line);
            context.try_error(
                diagnostic::xml_parse, u8"Malformed XML at line "sv, as_u8string_view(line),
                u8": "sv, message
            );
        }
        else {
            context.try_error(diagnostic::xml_parse, u8"Malformed XML."sv);
        }
        return Style_Error::parse;
    }

    const xmlNode* const root = xmlDocGetRootElement(doc.get());
    if (root == nullptr) {
        context.try_error(diagnostic::xml_parse, u8"The XML document has no root element."sv);
        return Style_Error::parse;
    }

    const Tree_Builder builder { doc.get(), context.get_memory() };
    return builder.build_element(root);
}

} // namespace cslc
