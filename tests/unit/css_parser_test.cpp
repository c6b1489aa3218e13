#include <lolite/css/parser/selector.h>
#include <lolite/css/parser/stylesheet.h>
#include <lolite/css/parser/tokenizer.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace lolite::css;

namespace {

std::vector<CSSToken::Type> token_types(std::string_view input) {
    std::vector<CSSToken::Type> types;
    for (const auto& tok : CSSTokenizer::tokenize_all(input)) {
        types.push_back(tok.type);
    }
    return types;
}

ComplexSelector parse_single(std::string_view text) {
    auto list = parse_selector_list(text);
    EXPECT_TRUE(list.has_value()) << text;
    if (!list || list->selectors.empty()) return {};
    return list->selectors.front();
}

std::string selector_error(std::string_view text) {
    std::string error;
    auto list = parse_selector_list(text, &error);
    EXPECT_FALSE(list.has_value()) << text;
    return error;
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Tokenizer: basic rule
// ---------------------------------------------------------------------------
TEST(CSSTokenizerTest, BasicRuleTokens) {
    auto types = token_types("div { color: red; }");
    std::vector<CSSToken::Type> expected = {
        CSSToken::Ident, CSSToken::Whitespace, CSSToken::LeftBrace,
        CSSToken::Whitespace, CSSToken::Ident, CSSToken::Colon,
        CSSToken::Whitespace, CSSToken::Ident, CSSToken::Semicolon,
        CSSToken::Whitespace, CSSToken::RightBrace, CSSToken::EndOfFile};
    EXPECT_EQ(types, expected);
}

TEST(CSSTokenizerTest, TokensCarryByteOffsets) {
    auto tokens = CSSTokenizer::tokenize_all("a  b");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].position, 0u);
    EXPECT_EQ(tokens[1].position, 1u);
    EXPECT_EQ(tokens[2].position, 3u);
    EXPECT_EQ(tokens[3].position, 4u);
}

// ---------------------------------------------------------------------------
// 2. Tokenizer: hash, at-keyword, numbers
// ---------------------------------------------------------------------------
TEST(CSSTokenizerTest, HashTokenDropsPrefix) {
    auto tokens = CSSTokenizer::tokenize_all("#main");
    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, CSSToken::Hash);
    EXPECT_EQ(tokens[0].value, "main");
}

TEST(CSSTokenizerTest, AtKeywordDropsPrefix) {
    auto tokens = CSSTokenizer::tokenize_all("@media");
    EXPECT_EQ(tokens[0].type, CSSToken::AtKeyword);
    EXPECT_EQ(tokens[0].value, "media");
}

TEST(CSSTokenizerTest, DimensionPercentageAndNumber) {
    auto tokens = CSSTokenizer::tokenize_all("10px 50% 1.5 -3");
    ASSERT_GE(tokens.size(), 8u);

    EXPECT_EQ(tokens[0].type, CSSToken::Dimension);
    EXPECT_EQ(tokens[0].value, "10px");
    EXPECT_DOUBLE_EQ(tokens[0].numeric_value, 10.0);
    EXPECT_EQ(tokens[0].unit, "px");
    EXPECT_TRUE(tokens[0].is_integer);

    EXPECT_EQ(tokens[2].type, CSSToken::Percentage);
    EXPECT_DOUBLE_EQ(tokens[2].numeric_value, 50.0);

    EXPECT_EQ(tokens[4].type, CSSToken::Number);
    EXPECT_DOUBLE_EQ(tokens[4].numeric_value, 1.5);
    EXPECT_FALSE(tokens[4].is_integer);

    EXPECT_EQ(tokens[6].type, CSSToken::Number);
    EXPECT_DOUBLE_EQ(tokens[6].numeric_value, -3.0);
}

// ---------------------------------------------------------------------------
// 3. Tokenizer: comments, strings, HTML markers
// ---------------------------------------------------------------------------
TEST(CSSTokenizerTest, CommentReadsAsWhitespace) {
    auto tokens = CSSTokenizer::tokenize_all("a/* note */b");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].value, "a");
    EXPECT_EQ(tokens[1].type, CSSToken::Whitespace);
    EXPECT_EQ(tokens[1].value, " ");
    EXPECT_EQ(tokens[2].value, "b");
}

TEST(CSSTokenizerTest, UnterminatedCommentIsFlagged) {
    auto tokens = CSSTokenizer::tokenize_all("a /* open");
    bool flagged = false;
    for (const auto& tok : tokens) flagged = flagged || tok.unterminated;
    EXPECT_TRUE(flagged);
}

TEST(CSSTokenizerTest, StringsWithEitherQuote) {
    auto tokens = CSSTokenizer::tokenize_all("'one' \"two\"");
    EXPECT_EQ(tokens[0].type, CSSToken::String);
    EXPECT_EQ(tokens[0].value, "one");
    EXPECT_FALSE(tokens[0].unterminated);
    EXPECT_EQ(tokens[2].type, CSSToken::String);
    EXPECT_EQ(tokens[2].value, "two");
}

TEST(CSSTokenizerTest, UnterminatedStringIsFlagged) {
    auto tokens = CSSTokenizer::tokenize_all("\"abc");
    EXPECT_EQ(tokens[0].type, CSSToken::String);
    EXPECT_TRUE(tokens[0].unterminated);
}

TEST(CSSTokenizerTest, HtmlCommentMarkers) {
    auto types = token_types("<!-- -->");
    std::vector<CSSToken::Type> expected = {
        CSSToken::CDO, CSSToken::Whitespace, CSSToken::CDC, CSSToken::EndOfFile};
    EXPECT_EQ(types, expected);
}

TEST(CSSTokenizerTest, FunctionToken) {
    auto tokens = CSSTokenizer::tokenize_all("rgb(1,2,3)");
    EXPECT_EQ(tokens[0].type, CSSToken::Function);
    EXPECT_EQ(tokens[0].value, "rgb");
}

// ---------------------------------------------------------------------------
// 4. Selectors: structure
// ---------------------------------------------------------------------------
TEST(SelectorParserTest, CompoundOfClasses) {
    auto sel = parse_single(".a.b");
    ASSERT_EQ(sel.parts.size(), 1u);
    const auto& simple = sel.parts[0].compound.simple_selectors;
    ASSERT_EQ(simple.size(), 2u);
    EXPECT_EQ(simple[0].type, SimpleSelectorType::Class);
    EXPECT_EQ(simple[0].value, "a");
    EXPECT_EQ(simple[1].value, "b");
}

TEST(SelectorParserTest, AllCombinators) {
    auto sel = parse_single("div > p + span ~ em strong");
    ASSERT_EQ(sel.parts.size(), 5u);
    EXPECT_FALSE(sel.parts[0].combinator.has_value());
    EXPECT_EQ(sel.parts[1].combinator, Combinator::Child);
    EXPECT_EQ(sel.parts[2].combinator, Combinator::NextSibling);
    EXPECT_EQ(sel.parts[3].combinator, Combinator::SubsequentSibling);
    EXPECT_EQ(sel.parts[4].combinator, Combinator::Descendant);
}

TEST(SelectorParserTest, SelectorList) {
    auto list = parse_selector_list("a, .b ,#c");
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(list->selectors.size(), 3u);
    EXPECT_EQ(list->selectors[2].parts[0].compound.simple_selectors[0].type,
              SimpleSelectorType::Id);
}

TEST(SelectorParserTest, TypeSelectorIsLowercased) {
    auto sel = parse_single("CARD");
    EXPECT_EQ(sel.parts[0].compound.simple_selectors[0].value, "card");
}

TEST(SelectorParserTest, AttributeOperators) {
    struct Case {
        const char* text;
        AttributeMatch match;
    };
    const Case cases[] = {
        {"[lang]", AttributeMatch::Exists},
        {"[lang=en]", AttributeMatch::Exact},
        {"[lang~=en]", AttributeMatch::Includes},
        {"[lang|=\"en\"]", AttributeMatch::DashMatch},
        {"[lang^=en]", AttributeMatch::Prefix},
        {"[lang$=en]", AttributeMatch::Suffix},
        {"[lang*=en]", AttributeMatch::Substring},
    };
    for (const auto& c : cases) {
        auto sel = parse_single(c.text);
        ASSERT_EQ(sel.parts.size(), 1u) << c.text;
        const auto& ss = sel.parts[0].compound.simple_selectors[0];
        EXPECT_EQ(ss.type, SimpleSelectorType::Attribute) << c.text;
        EXPECT_EQ(ss.attr_match, c.match) << c.text;
        EXPECT_EQ(ss.attr_name, "lang") << c.text;
        if (c.match != AttributeMatch::Exists) {
            EXPECT_EQ(ss.attr_value, "en") << c.text;
        }
    }
}

TEST(SelectorParserTest, NthChildArgument) {
    auto sel = parse_single("li:nth-child(2n+1)");
    const auto& ss = sel.parts[0].compound.simple_selectors[1];
    EXPECT_EQ(ss.type, SimpleSelectorType::PseudoClass);
    EXPECT_EQ(ss.value, "nth-child");
    EXPECT_EQ(ss.nth.a, 2);
    EXPECT_EQ(ss.nth.b, 1);
}

// ---------------------------------------------------------------------------
// 5. Selectors: rejected input
// ---------------------------------------------------------------------------
TEST(SelectorParserTest, RejectsUnsupportedSyntax) {
    EXPECT_NE(selector_error("a::before").find("pseudo-element"), std::string::npos);
    EXPECT_EQ(selector_error("a:hover"), "unsupported pseudo-class ':hover'");
    EXPECT_EQ(selector_error("a,"), "trailing comma in selector list");
    EXPECT_EQ(selector_error(".a >"), "combinator without a following selector");
    EXPECT_EQ(selector_error(""), "empty selector");
    EXPECT_EQ(selector_error("."), "expected class name after '.'");
    EXPECT_EQ(selector_error("li:nth-child(x)"), "invalid argument 'x' for ':nth-child'");
}

TEST(SelectorParserTest, ErrorPointerIsOptional) {
    EXPECT_FALSE(parse_selector_list("a:hover").has_value());
}

// ---------------------------------------------------------------------------
// 6. Specificity
// ---------------------------------------------------------------------------
TEST(SpecificityTest, CountsEachCategory) {
    auto s = compute_specificity(parse_single("#a .b c"));
    EXPECT_EQ(s, (Specificity{1, 1, 1}));

    EXPECT_EQ(compute_specificity(parse_single("*")), (Specificity{0, 0, 0}));
    EXPECT_EQ(compute_specificity(parse_single("div:first-child[data-x]")),
              (Specificity{0, 2, 1}));
}

TEST(SpecificityTest, OrderingIsLexicographic) {
    EXPECT_LT((Specificity{0, 0, 9}), (Specificity{0, 1, 0}));
    EXPECT_LT((Specificity{0, 9, 9}), (Specificity{1, 0, 0}));
    EXPECT_GT((Specificity{0, 1, 1}), (Specificity{0, 1, 0}));
}

// ---------------------------------------------------------------------------
// 7. an+b expressions
// ---------------------------------------------------------------------------
TEST(NthExpressionTest, ParsesKeywordsAndForms) {
    auto odd = parse_nth_expression("odd");
    ASSERT_TRUE(odd.has_value());
    EXPECT_EQ(odd->a, 2);
    EXPECT_EQ(odd->b, 1);

    auto even = parse_nth_expression("even");
    ASSERT_TRUE(even.has_value());
    EXPECT_EQ(even->b, 0);

    auto three = parse_nth_expression("3");
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(three->a, 0);
    EXPECT_EQ(three->b, 3);

    auto neg = parse_nth_expression("-n + 3");
    ASSERT_TRUE(neg.has_value());
    EXPECT_EQ(neg->a, -1);
    EXPECT_EQ(neg->b, 3);

    auto n = parse_nth_expression("n");
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->a, 1);

    EXPECT_FALSE(parse_nth_expression("abc").has_value());
    EXPECT_FALSE(parse_nth_expression("2n1").has_value());
}

TEST(NthExpressionTest, Matches) {
    NthExpression odd{2, 1};
    EXPECT_TRUE(odd.matches(1));
    EXPECT_FALSE(odd.matches(2));
    EXPECT_TRUE(odd.matches(3));

    NthExpression first_three{-1, 3};
    EXPECT_TRUE(first_three.matches(1));
    EXPECT_TRUE(first_three.matches(3));
    EXPECT_FALSE(first_three.matches(4));

    NthExpression only_second{0, 2};
    EXPECT_TRUE(only_second.matches(2));
    EXPECT_FALSE(only_second.matches(4));
}

// ---------------------------------------------------------------------------
// 8. Canonical selector text
// ---------------------------------------------------------------------------
TEST(SelectorParserTest, ToStringNormalizesSpacing) {
    EXPECT_EQ(to_string(parse_single("div>.a:first-child")), "div > .a:first-child");
    EXPECT_EQ(to_string(parse_single("[data-x=v]")), "[data-x=\"v\"]");
    EXPECT_EQ(to_string(parse_single("li:nth-child(2n+1)")), "li:nth-child(2n+1)");
}

// ---------------------------------------------------------------------------
// 9. Stylesheet: rules and declarations
// ---------------------------------------------------------------------------
TEST(StyleSheetParserTest, SingleRule) {
    auto sheet = parse_stylesheet(".blue-bg { background-color: #7777FF; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_FALSE(sheet.fatal.has_value());
    EXPECT_TRUE(sheet.issues.empty());

    const auto& rule = sheet.rules[0];
    EXPECT_EQ(rule.selector_text, ".blue-bg");
    ASSERT_EQ(rule.declarations.size(), 1u);
    EXPECT_EQ(rule.declarations[0].property, "background-color");
    ASSERT_EQ(rule.declarations[0].values.size(), 1u);
    EXPECT_EQ(rule.declarations[0].values[0].value, "#7777FF");
}

TEST(StyleSheetParserTest, ImportantAndPropertyCase) {
    auto sheet = parse_stylesheet("a { COLOR: red !important; margin: 0 }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    const auto& decls = sheet.rules[0].declarations;
    ASSERT_EQ(decls.size(), 2u);
    EXPECT_EQ(decls[0].property, "color");
    EXPECT_TRUE(decls[0].important);
    ASSERT_EQ(decls[0].values.size(), 1u);
    EXPECT_EQ(decls[0].values[0].value, "red");
    EXPECT_FALSE(decls[1].important);
}

TEST(StyleSheetParserTest, SelectorListAndEmptyBlock) {
    auto sheet = parse_stylesheet("h1, h2 { }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_EQ(sheet.rules[0].selectors.selectors.size(), 2u);
    EXPECT_TRUE(sheet.rules[0].declarations.empty());
    EXPECT_TRUE(sheet.issues.empty());
}

TEST(StyleSheetParserTest, ValueSerialization) {
    auto sheet = parse_stylesheet("a { margin: 1px 2px; color: rgb(1,2,3); }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    const auto& decls = sheet.rules[0].declarations;
    ASSERT_EQ(decls.size(), 2u);
    EXPECT_EQ(component_values_to_string(decls[0].values), "1px 2px");
    EXPECT_EQ(component_values_to_string(decls[1].values), "rgb(1, 2, 3)");
}

// ---------------------------------------------------------------------------
// 10. Stylesheet: recoverable problems
// ---------------------------------------------------------------------------
TEST(StyleSheetParserTest, MissingColonDropsDeclaration) {
    auto sheet = parse_stylesheet("a { color red; margin: 0 }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    ASSERT_EQ(sheet.rules[0].declarations.size(), 1u);
    EXPECT_EQ(sheet.rules[0].declarations[0].property, "margin");
    ASSERT_EQ(sheet.issues.size(), 1u);
    EXPECT_EQ(sheet.issues[0].message, "expected ':' after 'color'");
}

TEST(StyleSheetParserTest, EmptyValueIsReported) {
    auto sheet = parse_stylesheet("a { color: ; }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_TRUE(sheet.rules[0].declarations.empty());
    ASSERT_EQ(sheet.issues.size(), 1u);
    EXPECT_EQ(sheet.issues[0].message, "empty value for 'color'");
}

TEST(StyleSheetParserTest, StrayClosingBrace) {
    auto sheet = parse_stylesheet("} a { color: red }");
    EXPECT_EQ(sheet.rules.size(), 1u);
    ASSERT_EQ(sheet.issues.size(), 1u);
    EXPECT_EQ(sheet.issues[0].message, "unexpected '}'");
    EXPECT_EQ(sheet.issues[0].column, 1u);
}

TEST(StyleSheetParserTest, InvalidSelectorDropsOnlyThatRule) {
    auto sheet = parse_stylesheet("a::before { color: red } b { color: blue }");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_EQ(sheet.rules[0].selector_text, "b");
    ASSERT_EQ(sheet.issues.size(), 1u);
    EXPECT_EQ(sheet.issues[0].message.rfind("invalid selector 'a::before': ", 0), 0u);
}

TEST(StyleSheetParserTest, IssueLineAndColumn) {
    auto sheet = parse_stylesheet("a { color: red }\n\nb { color }");
    ASSERT_EQ(sheet.issues.size(), 1u);
    EXPECT_EQ(sheet.issues[0].line, 3u);
    EXPECT_EQ(sheet.issues[0].column, 5u);
}

TEST(StyleSheetParserTest, AtRulesAreSkipped) {
    auto sheet = parse_stylesheet(
        "@import url(x.css);\n"
        "@media screen { a { color: red } }\n"
        "b { color: blue }");
    ASSERT_EQ(sheet.ignored_at_rules.size(), 2u);
    EXPECT_EQ(sheet.ignored_at_rules[0].name, "import");
    EXPECT_EQ(sheet.ignored_at_rules[1].name, "media");
    ASSERT_EQ(sheet.rules.size(), 1u);
    EXPECT_EQ(sheet.rules[0].selector_text, "b");
}

// ---------------------------------------------------------------------------
// 11. Stylesheet: unrecoverable input
// ---------------------------------------------------------------------------
TEST(StyleSheetParserTest, UnclosedBlockIsFatal) {
    auto sheet = parse_stylesheet("a { color: red;");
    ASSERT_TRUE(sheet.fatal.has_value());
    EXPECT_EQ(sheet.fatal->message, "unterminated block");
    EXPECT_EQ(sheet.fatal->line, 1u);
    EXPECT_EQ(sheet.fatal->column, 3u);
    EXPECT_TRUE(sheet.rules.empty());
}

TEST(StyleSheetParserTest, UnterminatedStringIsFatal) {
    auto sheet = parse_stylesheet("a { content: \"abc }");
    ASSERT_TRUE(sheet.fatal.has_value());
    EXPECT_EQ(sheet.fatal->message, "unterminated string");
    EXPECT_EQ(sheet.fatal->column, 14u);
}

TEST(StyleSheetParserTest, UnterminatedCommentIsFatal) {
    auto sheet = parse_stylesheet("/* open");
    ASSERT_TRUE(sheet.fatal.has_value());
    EXPECT_EQ(sheet.fatal->message, "unterminated comment");
    EXPECT_EQ(sheet.fatal->line, 1u);
    EXPECT_EQ(sheet.fatal->column, 1u);
}
