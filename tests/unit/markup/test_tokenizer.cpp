#include <gtest/gtest.h>
#include "folio/markup/tokenizer.hpp"

using namespace folio;
using namespace folio::markup;

// ============================================================================
// Markup Tokenizer Tests
// ============================================================================

class MarkupTokenizerTest : public ::testing::Test {
protected:
    std::vector<Token> tokenize(std::string_view markup) {
        std::vector<Token> tokens;
        errors.clear();
        Tokenizer tokenizer;
        tokenizer.set_input(markup);
        tokenizer.set_token_callback([&tokens](Token token) {
            tokens.push_back(std::move(token));
        });
        tokenizer.set_error_callback([this](const String& message) {
            errors.push_back(message);
        });
        tokenizer.run();
        return tokens;
    }

    static const TagToken* tag(const Token& token) {
        return std::get_if<TagToken>(&token);
    }

    static const TextToken* text(const Token& token) {
        return std::get_if<TextToken>(&token);
    }

    std::vector<String> errors;
};

TEST_F(MarkupTokenizerTest, EmptyInput) {
    auto tokens = tokenize("");

    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(is_eof(tokens[0]));
}

TEST_F(MarkupTokenizerTest, PlainText) {
    auto tokens = tokenize("Hello");

    ASSERT_EQ(tokens.size(), 2u);
    ASSERT_TRUE(is_text(tokens[0]));
    EXPECT_EQ(text(tokens[0])->data, String("Hello"));
    EXPECT_FALSE(text(tokens[0])->cdata);
    EXPECT_TRUE(is_eof(tokens[1]));
}

TEST_F(MarkupTokenizerTest, SimpleStartAndEndTag) {
    auto tokens = tokenize("<p>Hi</p>");

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(is_start_tag(tokens[0]));
    EXPECT_EQ(tag(tokens[0])->name, String("p"));
    EXPECT_TRUE(is_text(tokens[1]));
    EXPECT_TRUE(is_end_tag(tokens[2]));
    EXPECT_EQ(tag(tokens[2])->name, String("p"));
    EXPECT_TRUE(errors.empty());
}

TEST_F(MarkupTokenizerTest, NamespacedNamesAreLowercased) {
    auto tokens = tokenize("<AC:Structured-Macro AC:Name=\"Info\">");

    ASSERT_GE(tokens.size(), 1u);
    auto* start = tag(tokens[0]);
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->name, String("ac:structured-macro"));
    // Values keep their case
    EXPECT_EQ(start->get_attribute("ac:name"), String("Info"));
}

TEST_F(MarkupTokenizerTest, AttributeQuoting) {
    auto tokens = tokenize("<td rowspan=\"2\" colspan='3' class=wide>");

    auto* start = tag(tokens[0]);
    ASSERT_NE(start, nullptr);
    ASSERT_EQ(start->attributes.size(), 3u);
    EXPECT_EQ(start->get_attribute("rowspan"), String("2"));
    EXPECT_EQ(start->get_attribute("colspan"), String("3"));
    EXPECT_EQ(start->get_attribute("class"), String("wide"));
}

TEST_F(MarkupTokenizerTest, AttributeWithoutValue) {
    auto tokens = tokenize("<input disabled>");

    auto* start = tag(tokens[0]);
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->get_attribute("disabled"), String(""));
}

TEST_F(MarkupTokenizerTest, SelfClosingTag) {
    auto tokens = tokenize("<ri:page ri:content-title=\"Home\" />");

    auto* start = tag(tokens[0]);
    ASSERT_NE(start, nullptr);
    EXPECT_TRUE(start->self_closing);
    EXPECT_EQ(start->get_attribute("ri:content-title"), String("Home"));
}

TEST_F(MarkupTokenizerTest, TagOffset) {
    auto tokens = tokenize("ab<p>");

    ASSERT_GE(tokens.size(), 2u);
    auto* start = tag(tokens[1]);
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->offset, 2u);
}

TEST_F(MarkupTokenizerTest, DuplicateAttributeKeepsFirst) {
    auto tokens = tokenize("<a href=\"one\" href=\"two\">");

    auto* start = tag(tokens[0]);
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->attributes.size(), 1u);
    EXPECT_EQ(start->get_attribute("href"), String("one"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], String("duplicate_attribute:href"));
}

// ============================================================================
// Character references
// ============================================================================

TEST_F(MarkupTokenizerTest, NamedAndNumericReferences) {
    auto tokens = tokenize("a &amp; b &lt;&#65;&#x42;&nbsp;&hellip;");

    ASSERT_TRUE(is_text(tokens[0]));
    EXPECT_EQ(text(tokens[0])->data, String("a & b <AB\xC2\xA0\xE2\x80\xA6"));
    EXPECT_TRUE(errors.empty());
}

TEST_F(MarkupTokenizerTest, ReferenceInAttributeValue) {
    auto tokens = tokenize("<a href=\"/x?a=1&amp;b=2\">");

    auto* start = tag(tokens[0]);
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->get_attribute("href"), String("/x?a=1&b=2"));
}

TEST_F(MarkupTokenizerTest, BareAmpersandIsText) {
    auto tokens = tokenize("Fish & Chips");

    EXPECT_EQ(text(tokens[0])->data, String("Fish & Chips"));
    EXPECT_TRUE(errors.empty());
}

TEST_F(MarkupTokenizerTest, UnknownNamedReferenceKeptLiterally) {
    auto tokens = tokenize("&bogus;");

    EXPECT_EQ(text(tokens[0])->data, String("&bogus;"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], String("unknown_character_reference:bogus"));
}

TEST_F(MarkupTokenizerTest, InvalidNumericReferenceBecomesReplacement) {
    auto tokens = tokenize("&#xD800;");

    EXPECT_EQ(text(tokens[0])->data, String("\xEF\xBF\xBD"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(errors[0].starts_with("invalid_character_reference:"_s));
}

TEST_F(MarkupTokenizerTest, NumericReferenceWithoutSemicolon) {
    auto tokens = tokenize("&#65 x");

    EXPECT_EQ(text(tokens[0])->data, String("A x"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], String("missing_semicolon_after_character_reference"));
}

// ============================================================================
// Comments, CDATA and declarations
// ============================================================================

TEST_F(MarkupTokenizerTest, CdataSection) {
    auto tokens = tokenize("<![CDATA[if (a < b && c) {}]]>");

    ASSERT_TRUE(is_text(tokens[0]));
    EXPECT_EQ(text(tokens[0])->data, String("if (a < b && c) {}"));
    EXPECT_TRUE(text(tokens[0])->cdata);
}

TEST_F(MarkupTokenizerTest, UnterminatedCdata) {
    auto tokens = tokenize("<![CDATA[open");

    ASSERT_TRUE(is_text(tokens[0]));
    EXPECT_EQ(text(tokens[0])->data, String("open"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], String("eof_in_cdata"));
}

TEST_F(MarkupTokenizerTest, Comment) {
    auto tokens = tokenize("<!-- note -->");

    ASSERT_TRUE(is_comment(tokens[0]));
    EXPECT_EQ(std::get<CommentToken>(tokens[0]).data, String(" note "));
}

TEST_F(MarkupTokenizerTest, UnterminatedComment) {
    auto tokens = tokenize("<!-- never closed");

    EXPECT_TRUE(is_comment(tokens[0]));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], String("eof_in_comment"));
}

TEST_F(MarkupTokenizerTest, DoctypeAndProcessingInstructionAreSilent) {
    auto tokens = tokenize("<?xml version=\"1.0\"?><!DOCTYPE html><p>");

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(is_comment(tokens[0]));
    EXPECT_TRUE(is_comment(tokens[1]));
    EXPECT_TRUE(is_start_tag(tokens[2]));
    EXPECT_TRUE(errors.empty());
}

// ============================================================================
// Recovery
// ============================================================================

TEST_F(MarkupTokenizerTest, LessThanFollowedBySpaceIsText) {
    auto tokens = tokenize("a < b");

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(text(tokens[0])->data, String("a < b"));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], String("invalid_first_character_of_tag_name"));
}

TEST_F(MarkupTokenizerTest, EofInsideTag) {
    auto tokens = tokenize("text<p class=\"x");

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(text(tokens[0])->data, String("text"));
    EXPECT_TRUE(is_eof(tokens[1]));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], String("eof_in_tag:p"));
}

TEST_F(MarkupTokenizerTest, PullInterface) {
    Tokenizer tokenizer;
    tokenizer.set_input("<b>x</b>");

    std::vector<Token> tokens;
    while (auto token = tokenizer.next_token()) {
        tokens.push_back(std::move(*token));
    }

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(is_start_tag(tokens[0]));
    EXPECT_TRUE(is_text(tokens[1]));
    EXPECT_TRUE(is_end_tag(tokens[2]));
    EXPECT_TRUE(is_eof(tokens[3]));
    EXPECT_FALSE(tokenizer.next_token().has_value());
}
