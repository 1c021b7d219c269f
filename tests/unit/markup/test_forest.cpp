#include <gtest/gtest.h>
#include "folio/markup/forest.hpp"

using namespace folio;
using namespace folio::markup;

// ============================================================================
// Element Forest Tests
// ============================================================================

class ElementForestTest : public ::testing::Test {
protected:
    ParsedForest parse(std::string_view markup, usize max_depth = 512) {
        ForestOptions options;
        options.max_depth = max_depth;
        auto result = parse_forest(markup, options);
        EXPECT_TRUE(result.is_ok()) << "parse failed: " << markup;
        if (result.is_err()) {
            return {};
        }
        return std::move(result).value();
    }

    MarkupError parse_failure(std::string_view markup, usize max_depth = 512) {
        ForestOptions options;
        options.max_depth = max_depth;
        auto result = parse_forest(markup, options);
        EXPECT_TRUE(result.is_err()) << "parse succeeded: " << markup;
        if (result.is_ok()) {
            return MarkupError{MarkupErrorKind::InvalidUtf8, String(), 0};
        }
        return result.error();
    }
};

TEST_F(ElementForestTest, EmptyInput) {
    auto forest = parse("");

    EXPECT_TRUE(forest.elements.empty());
    EXPECT_TRUE(forest.recoveries.empty());
}

TEST_F(ElementForestTest, SourceNameKeepsCase) {
    auto forest = parse("<Ac:Task-List><Ac:Task>x</ac:task></AC:TASK-LIST><p/>");

    ASSERT_EQ(forest.elements.size(), 2u);
    const auto& list = forest.elements[0];
    EXPECT_EQ(list.name(), String("ac:task-list"));
    EXPECT_EQ(list.source_name(), String("Ac:Task-List"));
    ASSERT_EQ(list.children().size(), 1u);
    EXPECT_EQ(list.children()[0].source_name(), String("Ac:Task"));
    EXPECT_EQ(forest.elements[1].source_name(), String("p"));
    EXPECT_TRUE(forest.recoveries.empty());
}

TEST_F(ElementForestTest, NestedElements) {
    auto forest = parse("<p>Hello <strong>world</strong>!</p>");

    ASSERT_EQ(forest.elements.size(), 1u);
    const auto& p = forest.elements[0];
    EXPECT_TRUE(p.is_named("p"));
    ASSERT_EQ(p.children().size(), 3u);
    EXPECT_EQ(p.children()[0].data(), String("Hello "));
    EXPECT_TRUE(p.children()[1].is_named("strong"));
    EXPECT_EQ(p.children()[1].text_content(), String("world"));
    EXPECT_EQ(p.children()[2].data(), String("!"));
    EXPECT_EQ(p.text_content(), String("Hello world!"));
    EXPECT_TRUE(forest.recoveries.empty());
}

TEST_F(ElementForestTest, MultipleTopLevelItems) {
    auto forest = parse("<h1>A</h1>\n<p>B</p>");

    ASSERT_EQ(forest.elements.size(), 3u);
    EXPECT_TRUE(forest.elements[0].is_named("h1"));
    EXPECT_TRUE(forest.elements[1].is_whitespace());
    EXPECT_TRUE(forest.elements[2].is_named("p"));
}

TEST_F(ElementForestTest, NamespacedElementAccessors) {
    auto forest = parse(
        "<ac:link><ri:page ri:content-title=\"Home\" ri:space-key=\"DOC\"/>"
        "<ac:plain-text-link-body><![CDATA[Go home]]></ac:plain-text-link-body></ac:link>");

    ASSERT_EQ(forest.elements.size(), 1u);
    const auto& link = forest.elements[0];
    EXPECT_EQ(link.prefix(), "ac");
    EXPECT_EQ(link.local_name(), "link");

    const auto* page = link.first_child_with_prefix("ri");
    ASSERT_NE(page, nullptr);
    EXPECT_EQ(page->name(), String("ri:page"));
    EXPECT_EQ(page->get_attribute("ri:space-key"), String("DOC"));
    EXPECT_TRUE(page->has_attribute("ri:content-title"));
    EXPECT_FALSE(page->has_attribute("ri:version-at-save"));

    const auto* body = link.first_child("ac:plain-text-link-body");
    ASSERT_NE(body, nullptr);
    ASSERT_EQ(body->children().size(), 1u);
    EXPECT_TRUE(body->children()[0].is_cdata());
    EXPECT_EQ(body->text_content(), String("Go home"));
}

TEST_F(ElementForestTest, ChildrenNamed) {
    auto forest = parse(
        "<ac:structured-macro ac:name=\"jira\">"
        "<ac:parameter ac:name=\"key\">DOC-1</ac:parameter>"
        "<ac:parameter ac:name=\"server\">Jira</ac:parameter>"
        "</ac:structured-macro>");

    ASSERT_EQ(forest.elements.size(), 1u);
    auto parameters = forest.elements[0].children_named("ac:parameter");
    ASSERT_EQ(parameters.size(), 2u);
    EXPECT_EQ(parameters[1]->get_attribute("ac:name"), String("server"));
    EXPECT_EQ(parameters[1]->text_content(), String("Jira"));
}

TEST_F(ElementForestTest, AdjacentTextIsMerged) {
    auto forest = parse("<p>a &amp; b<!-- gone --> c</p>");

    ASSERT_EQ(forest.elements.size(), 1u);
    ASSERT_EQ(forest.elements[0].children().size(), 1u);
    EXPECT_EQ(forest.elements[0].children()[0].data(), String("a & b c"));
}

TEST_F(ElementForestTest, CdataIsNotMergedWithText) {
    auto forest = parse("<p>x<![CDATA[y]]>z</p>");

    const auto& children = forest.elements[0].children();
    ASSERT_EQ(children.size(), 3u);
    EXPECT_FALSE(children[0].is_cdata());
    EXPECT_TRUE(children[1].is_cdata());
    EXPECT_FALSE(children[2].is_cdata());
}

// ============================================================================
// Void and self-closing elements
// ============================================================================

TEST_F(ElementForestTest, VoidElementsTakeNoChildren) {
    auto forest = parse("<p>one<br>two<hr>three</p>");

    ASSERT_EQ(forest.elements.size(), 1u);
    const auto& children = forest.elements[0].children();
    ASSERT_EQ(children.size(), 5u);
    EXPECT_TRUE(children[1].is_named("br"));
    EXPECT_FALSE(children[1].has_children());
    EXPECT_TRUE(children[3].is_named("hr"));
    EXPECT_TRUE(forest.recoveries.empty());
}

TEST_F(ElementForestTest, VoidEndTagIsIgnoredSilently) {
    auto forest = parse("<p>a<br></br>b</p>");

    EXPECT_TRUE(forest.recoveries.empty());
    EXPECT_EQ(forest.elements[0].children().size(), 3u);
}

TEST_F(ElementForestTest, SelfClosingElement) {
    auto forest = parse("<ac:emoticon ac:name=\"smile\" />after");

    ASSERT_EQ(forest.elements.size(), 2u);
    EXPECT_TRUE(forest.elements[0].is_named("ac:emoticon"));
    EXPECT_FALSE(forest.elements[0].has_children());
    EXPECT_EQ(forest.elements[1].data(), String("after"));
}

TEST_F(ElementForestTest, VoidNames) {
    EXPECT_TRUE(TreeBuilder::is_void_element("br"));
    EXPECT_TRUE(TreeBuilder::is_void_element("img"));
    EXPECT_TRUE(TreeBuilder::is_void_element("col"));
    EXPECT_FALSE(TreeBuilder::is_void_element("p"));
    EXPECT_FALSE(TreeBuilder::is_void_element("ac:image"));
}

// ============================================================================
// Recovery
// ============================================================================

TEST_F(ElementForestTest, UnclosedElementAtEnd) {
    auto forest = parse("<h1>Heading");

    ASSERT_EQ(forest.elements.size(), 1u);
    EXPECT_EQ(forest.elements[0].text_content(), String("Heading"));
    ASSERT_EQ(forest.recoveries.size(), 1u);
    EXPECT_EQ(forest.recoveries[0], String("unclosed_element:h1"));
}

TEST_F(ElementForestTest, EndTagClosesIntermediateElements) {
    auto forest = parse("<div><p><em>x</div>y");

    ASSERT_EQ(forest.elements.size(), 2u);
    const auto& div = forest.elements[0];
    ASSERT_EQ(div.children().size(), 1u);
    EXPECT_TRUE(div.children()[0].is_named("p"));
    EXPECT_TRUE(div.children()[0].children()[0].is_named("em"));
    EXPECT_EQ(forest.elements[1].data(), String("y"));

    ASSERT_EQ(forest.recoveries.size(), 2u);
    EXPECT_EQ(forest.recoveries[0], String("unclosed_element:em"));
    EXPECT_EQ(forest.recoveries[1], String("unclosed_element:p"));
}

TEST_F(ElementForestTest, StrayEndTagIsDropped) {
    auto forest = parse("<p>a</span>b</p>");

    ASSERT_EQ(forest.elements.size(), 1u);
    EXPECT_EQ(forest.elements[0].text_content(), String("ab"));
    ASSERT_EQ(forest.recoveries.size(), 1u);
    EXPECT_EQ(forest.recoveries[0], String("stray_end_tag:span"));
}

TEST_F(ElementForestTest, TokenizerRepairsAreRecorded) {
    auto forest = parse("<p>1 < 2</p>");

    EXPECT_EQ(forest.elements[0].text_content(), String("1 < 2"));
    ASSERT_EQ(forest.recoveries.size(), 1u);
    EXPECT_EQ(forest.recoveries[0], String("invalid_first_character_of_tag_name"));
}

TEST_F(ElementForestTest, ByteOrderMarkIsStripped) {
    auto forest = parse("\xEF\xBB\xBF<p>x</p>");

    ASSERT_EQ(forest.elements.size(), 1u);
    EXPECT_TRUE(forest.elements[0].is_named("p"));
}

TEST_F(ElementForestTest, MultibyteTextPassesThrough) {
    auto forest = parse("<p>caf\xC3\xA9 \xE2\x9C\x93</p>");

    EXPECT_EQ(forest.elements[0].text_content(), String("caf\xC3\xA9 \xE2\x9C\x93"));
}

// ============================================================================
// Fatal errors
// ============================================================================

TEST_F(ElementForestTest, InvalidUtf8) {
    auto error = parse_failure("<p>ab\xFF</p>");

    EXPECT_EQ(error.kind, MarkupErrorKind::InvalidUtf8);
    EXPECT_EQ(error.offset, 5u);
    EXPECT_EQ(markup_error_kind_name(error.kind), "invalid_utf8");
}

TEST_F(ElementForestTest, NulCharacter) {
    auto error = parse_failure(std::string_view("<p>a\0b</p>", 10));

    EXPECT_EQ(error.kind, MarkupErrorKind::NullCharacter);
    EXPECT_EQ(error.offset, 4u);
}

TEST_F(ElementForestTest, NestingTooDeep) {
    auto error = parse_failure("<a><b><c>x</c></b></a>", 2);

    EXPECT_EQ(error.kind, MarkupErrorKind::NestingTooDeep);
    EXPECT_EQ(error.offset, 6u);
}

TEST_F(ElementForestTest, NestingAtLimitSucceeds) {
    auto forest = parse("<a><b>x</b></a>", 2);

    ASSERT_EQ(forest.elements.size(), 1u);
    EXPECT_TRUE(forest.recoveries.empty());
}

TEST_F(ElementForestTest, DeepNestingDefaultLimit) {
    std::string markup;
    for (int i = 0; i < 600; ++i) {
        markup += "<div>";
    }
    auto error = parse_failure(markup);

    EXPECT_EQ(error.kind, MarkupErrorKind::NestingTooDeep);
    EXPECT_EQ(error.offset, 512u * 5u);
}
