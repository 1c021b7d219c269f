#include <gtest/gtest.h>
#include "folio/parser/parser.hpp"
#include "folio/nodes/payloads.hpp"
#include <thread>

using namespace folio;
using namespace folio::parser;

// ============================================================================
// Parser Tests
// ============================================================================

class ParserTest : public ::testing::Test {
protected:
    nodes::Document parse_ok(std::string_view markup, bool strict = true) {
        Parser parser;
        parser.set_strict(strict);
        auto result = parser.parse(markup);
        EXPECT_TRUE(result.is_ok()) << "parse failed: "
                                    << (result.is_err() ? result.error().message : String());
        if (result.is_err()) {
            return {};
        }
        return std::move(result).value();
    }

    ParseError parse_err(std::string_view markup, const ParserOptions& options = {}) {
        Parser parser(options);
        auto result = parser.parse(markup);
        EXPECT_TRUE(result.is_err()) << "parse succeeded: " << markup;
        if (result.is_ok()) {
            return ParseError{ParseErrorKind::Tokenize, String(), {}};
        }
        return result.error();
    }
};

TEST_F(ParserTest, ParagraphsAndHeading) {
    auto document = parse_ok(
        "<p>Hello <strong>world</strong>!</p>"
        "<h1>Main Heading</h1>"
        "<p>Some paragraph text with <em>emphasis</em>.</p>");

    EXPECT_EQ(document.text(), String("Hello world!\n\nMain Heading\n\nSome paragraph text with emphasis."));
    ASSERT_NE(document.root(), nullptr);
    EXPECT_EQ(document.root()->kind(), nodes::NodeKind::Fragment);
    EXPECT_EQ(document.root()->children().size(), 3u);
    EXPECT_TRUE(document.diagnostics().empty());
}

TEST_F(ParserTest, InfoPanel) {
    auto document = parse_ok(
        "<ac:structured-macro ac:name=\"info\">"
        "<ac:rich-text-body><p>This is an info panel with important information.</p></ac:rich-text-body>"
        "</ac:structured-macro>");

    ASSERT_NE(document.root(), nullptr);
    auto panel = document.root()->as<nodes::PanelMacro>();
    ASSERT_NE(panel, nullptr);
    EXPECT_EQ(panel->kind, nodes::PanelKind::Info);
    EXPECT_EQ(document.text(), String("ℹ️ INFO: This is an info panel with important information."));
}

TEST_F(ParserTest, IndentedMarkup) {
    auto document = parse_ok(
        "<ac:layout>\n"
        "  <ac:layout-section ac:type=\"two_equal\">\n"
        "    <ac:layout-cell>\n"
        "      <p>Left</p>\n"
        "    </ac:layout-cell>\n"
        "    <ac:layout-cell>\n"
        "      <p>Right</p>\n"
        "    </ac:layout-cell>\n"
        "  </ac:layout-section>\n"
        "</ac:layout>\n");

    EXPECT_EQ(document.text(), String("Left\n\nRight"));
    EXPECT_EQ(document.find_all(nodes::NodeKind::Text).size(), 2u);
}

// ============================================================================
// Root consolidation
// ============================================================================

TEST_F(ParserTest, EmptyInput) {
    auto document = parse_ok("");

    EXPECT_TRUE(document.empty());
    EXPECT_EQ(document.text(), String(""));
    EXPECT_EQ(document.metadata().node_count, 0u);
}

TEST_F(ParserTest, WhitespaceOnlyInput) {
    auto document = parse_ok("  \n\t  \n");

    EXPECT_TRUE(document.empty());
}

TEST_F(ParserTest, CommentOnlyInput) {
    auto document = parse_ok("<!-- nothing here -->");

    EXPECT_TRUE(document.empty());
}

TEST_F(ParserTest, SingleElementIsRoot) {
    auto document = parse_ok("\n<h2>Only</h2>\n");

    ASSERT_NE(document.root(), nullptr);
    EXPECT_EQ(document.root()->kind(), nodes::NodeKind::Heading);
    EXPECT_EQ(document.root()->as<nodes::Heading>()->level, 2);
}

TEST_F(ParserTest, PlainTextIsRoot) {
    auto document = parse_ok("just text");

    ASSERT_NE(document.root(), nullptr);
    EXPECT_EQ(document.root()->kind(), nodes::NodeKind::Text);
    EXPECT_EQ(document.text(), String("just text"));
}

TEST_F(ParserTest, SiblingsAreWrappedInFragment) {
    auto document = parse_ok("<p>a</p>\n<p>b</p>");

    ASSERT_NE(document.root(), nullptr);
    EXPECT_EQ(document.root()->kind(), nodes::NodeKind::Fragment);
    EXPECT_EQ(document.root()->children().size(), 2u);
    EXPECT_EQ(document.text(), String("a\n\nb"));
}

TEST_F(ParserTest, NodeCount) {
    auto document = parse_ok("<p>a<br/>b</p>");

    EXPECT_EQ(document.metadata().node_count, 4u);
    EXPECT_EQ(document.walk().to_vector().size(), 4u);
}

// ============================================================================
// Strict and lenient policy
// ============================================================================

TEST_F(ParserTest, StrictIsDefault) {
    Parser parser;
    EXPECT_TRUE(parser.strict());
    EXPECT_TRUE(ParserOptions{}.strict);
    EXPECT_EQ(parser.max_depth(), 512u);
}

TEST_F(ParserTest, StrictFailsOnUnknownElement) {
    auto error = parse_err("<p><blink>x</blink></p>");

    EXPECT_EQ(error.kind, ParseErrorKind::Diagnostics);
    ASSERT_EQ(error.diagnostics.size(), 1u);
    EXPECT_EQ(error.diagnostics[0], String("unknown_element:blink"));
    EXPECT_EQ(error.message, String("1 diagnostic(s) recorded while parsing: unknown_element:blink"));
}

TEST_F(ParserTest, LenientKeepsUnknownElementContent) {
    auto document = parse_ok("<p><blink>x</blink></p>", false);

    EXPECT_EQ(document.text(), String("x"));
    ASSERT_EQ(document.diagnostics().size(), 1u);
    EXPECT_EQ(document.diagnostics()[0], String("unknown_element:blink"));

    auto containers = document.find_all(nodes::NodeKind::Container);
    ASSERT_EQ(containers.size(), 1u);
    EXPECT_EQ(containers[0]->as<nodes::Container>()->tag, String("blink"));
}

TEST_F(ParserTest, StrictFailsOnUnknownMacro) {
    auto error = parse_err(
        "<ac:structured-macro ac:name=\"cheese\"><ac:rich-text-body><p>b</p></ac:rich-text-body></ac:structured-macro>"
        "<p><marquee>m</marquee></p>");

    EXPECT_EQ(error.kind, ParseErrorKind::Diagnostics);
    ASSERT_EQ(error.diagnostics.size(), 2u);
    EXPECT_EQ(error.diagnostics[0], String("unknown_macro:cheese"));
    EXPECT_EQ(error.diagnostics[1], String("unknown_element:marquee"));
    EXPECT_EQ(error.message,
              String("2 diagnostic(s) recorded while parsing: unknown_macro:cheese, unknown_element:marquee"));
}

TEST_F(ParserTest, LenientUnknownMacroBecomesContainer) {
    auto document = parse_ok(
        "<ac:structured-macro ac:name=\"cheese\"><ac:rich-text-body><p>body</p></ac:rich-text-body></ac:structured-macro>",
        false);

    ASSERT_NE(document.root(), nullptr);
    auto container = document.root()->as<nodes::Container>();
    ASSERT_NE(container, nullptr);
    EXPECT_EQ(container->tag, String("ac:structured-macro"));
    EXPECT_EQ(document.text(), String("body"));
    EXPECT_EQ(document.diagnostics(), std::vector<String>{"unknown_macro:cheese"_s});
}

TEST_F(ParserTest, DiagnosticsNameConstructsAsWritten) {
    auto document = parse_ok(
        "<ac:structured-macro ac:name=\"MyCustomMacro\"></ac:structured-macro><MyWidget>x</MyWidget>",
        false);

    EXPECT_EQ(document.diagnostics(), (std::vector<String>{
        "unknown_macro:MyCustomMacro"_s, "unknown_element:MyWidget"_s}));
    EXPECT_EQ(document.text(), String("x"));
}

TEST_F(ParserTest, PrettyPrintedInlineMarkupKeepsWordBoundaries) {
    auto document = parse_ok("<p><strong>Hello</strong>\n<em>world</em></p>");

    EXPECT_EQ(document.text(), String("Hello world"));
}

TEST_F(ParserTest, PrettyPrintedBlocksStaySeparated) {
    auto document = parse_ok(
        "<h1>Title</h1>\n"
        "<ul>\n"
        "  <li>one</li>\n"
        "  <li><p>two</p>\n<p>more</p></li>\n"
        "</ul>\n");

    EXPECT_EQ(document.text(), String("Title\n\n• one\n• two\n  more"));
}

TEST_F(ParserTest, RecoveriesDoNotFailStrictParse) {
    auto document = parse_ok("<h1>Unclosed heading");

    EXPECT_EQ(document.text(), String("Unclosed heading"));
    EXPECT_TRUE(document.diagnostics().empty());
    ASSERT_EQ(document.metadata().recoveries.size(), 1u);
    EXPECT_EQ(document.metadata().recoveries[0], String("unclosed_element:h1"));
}

TEST_F(ParserTest, LenientRecoveriesAndDiagnosticsAreSeparate) {
    auto document = parse_ok("<p>a</span><blink>b", false);

    EXPECT_EQ(document.diagnostics(), std::vector<String>{"unknown_element:blink"_s});
    ASSERT_EQ(document.metadata().recoveries.size(), 3u);
    EXPECT_EQ(document.metadata().recoveries[0], String("stray_end_tag:span"));
    EXPECT_EQ(document.metadata().recoveries[1], String("unclosed_element:blink"));
    EXPECT_EQ(document.metadata().recoveries[2], String("unclosed_element:p"));
    EXPECT_EQ(document.text(), String("ab"));
}

TEST_F(ParserTest, SetStrictToggles) {
    Parser parser;
    parser.set_strict(false);
    EXPECT_TRUE(parser.parse("<blink/>").is_ok());

    parser.set_strict(true);
    EXPECT_TRUE(parser.parse("<blink/>").is_err());
}

TEST_F(ParserTest, FreeFunction) {
    ParserOptions options;
    options.strict = false;

    auto result = parse("<p>x</p><unknown/>", options);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().diagnostics().size(), 1u);

    EXPECT_TRUE(parse("<unknown/>").is_err());
}

// ============================================================================
// Tokenize errors
// ============================================================================

TEST_F(ParserTest, MalformedUtf8) {
    auto error = parse_err("<p>\xC3</p>");

    EXPECT_EQ(error.kind, ParseErrorKind::Tokenize);
    EXPECT_TRUE(error.diagnostics.empty());
    EXPECT_EQ(error.message, String("malformed UTF-8 sequence at byte 3"));
}

TEST_F(ParserTest, NulCharacter) {
    auto error = parse_err(std::string_view("<p>\0</p>", 8));

    EXPECT_EQ(error.kind, ParseErrorKind::Tokenize);
}

TEST_F(ParserTest, NestingTooDeep) {
    ParserOptions options;
    options.max_depth = 3;

    auto error = parse_err("<div><div><div><div>x</div></div></div></div>", options);
    EXPECT_EQ(error.kind, ParseErrorKind::Tokenize);

    Parser parser(options);
    EXPECT_TRUE(parser.parse("<div><div><div>x</div></div></div>").is_ok());
}

TEST_F(ParserTest, TokenizeErrorsIgnoreStrictness) {
    ParserOptions options;
    options.strict = false;

    auto error = parse_err("\xFF", options);
    EXPECT_EQ(error.kind, ParseErrorKind::Tokenize);
}

TEST_F(ParserTest, ErrorKindNames) {
    EXPECT_EQ(parse_error_kind_name(ParseErrorKind::Tokenize), "tokenize");
    EXPECT_EQ(parse_error_kind_name(ParseErrorKind::Diagnostics), "diagnostics");
}

// ============================================================================
// Independence of parse calls
// ============================================================================

TEST_F(ParserTest, DiagnosticsDoNotLeakBetweenCalls) {
    Parser parser;
    parser.set_strict(false);

    auto first = parser.parse("<blink/>");
    auto second = parser.parse("<p>clean</p>");

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().diagnostics().size(), 1u);
    EXPECT_TRUE(second.value().diagnostics().empty());
}

TEST_F(ParserTest, SharedParserAcrossThreads) {
    const Parser parser(ParserOptions{false, 512});
    const std::string_view markup =
        "<h1>Title</h1>"
        "<ac:structured-macro ac:name=\"note\"><ac:rich-text-body><p>Careful</p></ac:rich-text-body></ac:structured-macro>"
        "<ul><li>one</li><li>two</li></ul><blink/>";
    const String expected = "Title\n\n📝 NOTE: Careful\n\n• one\n• two"_s;

    std::vector<std::thread> threads;
    std::vector<int> failures(4, 0);
    for (usize t = 0; t < failures.size(); ++t) {
        threads.emplace_back([&parser, &markup, &expected, &failures, t]() {
            for (int i = 0; i < 50; ++i) {
                auto result = parser.parse(markup);
                if (result.is_err() || result.value().text() != expected ||
                    result.value().diagnostics().size() != 1) {
                    ++failures[t];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int count : failures) {
        EXPECT_EQ(count, 0);
    }
}
