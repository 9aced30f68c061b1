#ifndef CSLC_COMPILE_TEST_HPP
#define CSLC_COMPILE_TEST_HPP

#include <memory_resource>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>

#include "cslc/util/result.hpp"

#include "cslc/compile.hpp"
#include "cslc/compile_context.hpp"
#include "cslc/render.hpp"
#include "cslc/style.hpp"
#include "cslc/style_error.hpp"
#include "cslc/style_node.hpp"
#include "cslc/xml.hpp"

#include "collecting_logger.hpp"
#include "fake_runtime.hpp"

namespace cslc {

/// @brief Fixture for tests which compile XML fragments
/// and evaluate them against a `Fake_Runtime`.
struct Compile_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Compile_Context context { &memory, logger };
    Compiled_Style style { &memory };
    Fake_Runtime runtime;

    /// @brief Parses `xml` and strips comments.
    /// The XML is expected to be well-formed.
    [[nodiscard]]
    Style_Node parse(std::u8string_view xml)
    {
        Result<Style_Node, Style_Error> result = parse_xml(xml, context);
        if (!result) {
            ADD_FAILURE() << "Test XML is malformed.";
            return Style_Node::element(u8"error", &memory);
        }
        return strip_comments(std::move(*result));
    }

    [[nodiscard]]
    Result<Render_Node, Style_Error> compile(std::u8string_view xml)
    {
        return compile_node(parse(xml), context);
    }

    [[nodiscard]]
    Rendered render(const Render_Node& node)
    {
        Render_Context render_context { runtime, style, &memory };
        return evaluate(node, render_context);
    }
};

} // namespace cslc

#endif
