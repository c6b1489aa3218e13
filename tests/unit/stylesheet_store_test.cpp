#include <lolite/css/style/property_registry.h>
#include <lolite/css/style/stylesheet_store.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using namespace lolite::css;
using lolite::core::ErrorCode;

namespace {

std::vector<Declaration> declarations_of(const std::string& css_block) {
    auto sheet = parse_stylesheet("x { " + css_block + " }");
    if (sheet.rules.empty()) return {};
    return sheet.rules[0].declarations;
}

std::map<std::string, std::string> longhands_of(const std::string& css_block) {
    std::map<std::string, std::string> out;
    auto decls = declarations_of(css_block);
    EXPECT_EQ(decls.size(), 1u) << css_block;
    if (decls.empty()) return out;
    std::string error;
    auto expanded = expand_declaration(decls[0], error);
    EXPECT_TRUE(expanded.has_value()) << css_block << ": " << error;
    if (!expanded) return out;
    for (const auto& lh : *expanded) out[lh.property] = lh.value;
    return out;
}

std::string expansion_error(const std::string& css_block) {
    auto decls = declarations_of(css_block);
    EXPECT_EQ(decls.size(), 1u) << css_block;
    if (decls.empty()) return {};
    std::string error;
    EXPECT_FALSE(expand_declaration(decls[0], error).has_value()) << css_block;
    return error;
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Property table
// ---------------------------------------------------------------------------
TEST(PropertyRegistryTest, KnownPropertiesAndDefaults) {
    const PropertySpec* display = find_property("display");
    ASSERT_NE(display, nullptr);
    EXPECT_EQ(display->initial, "flex");
    EXPECT_FALSE(display->inherited);

    const PropertySpec* color = find_property("color");
    ASSERT_NE(color, nullptr);
    EXPECT_TRUE(color->inherited);

    const PropertySpec* background = find_property("background-color");
    ASSERT_NE(background, nullptr);
    EXPECT_EQ(background->initial, "transparent");
    EXPECT_FALSE(background->inherited);

    EXPECT_EQ(find_property("margin"), nullptr);
    EXPECT_EQ(find_property("no-such-property"), nullptr);
}

TEST(PropertyRegistryTest, NamesAreUnique) {
    const auto& props = all_properties();
    for (size_t i = 0; i < props.size(); ++i) {
        EXPECT_EQ(find_property(props[i].name), &props[i]) << props[i].name;
    }
}

TEST(PropertyRegistryTest, ShorthandsAndWideKeywords) {
    EXPECT_TRUE(is_shorthand("margin"));
    EXPECT_TRUE(is_shorthand("flex"));
    EXPECT_FALSE(is_shorthand("margin-top"));

    EXPECT_TRUE(is_css_wide_keyword("inherit"));
    EXPECT_TRUE(is_css_wide_keyword("initial"));
    EXPECT_TRUE(is_css_wide_keyword("unset"));
    EXPECT_FALSE(is_css_wide_keyword("auto"));
}

// ---------------------------------------------------------------------------
// 2. Longhand validation
// ---------------------------------------------------------------------------
TEST(PropertyRegistryTest, ColorKeepsHexTextAndLowercasesNames) {
    EXPECT_EQ(longhands_of("background-color: #7777FF")["background-color"], "#7777FF");
    EXPECT_EQ(longhands_of("color: RED")["color"], "red");
    EXPECT_EQ(longhands_of("color: rgb(1,2,3)")["color"], "rgb(1, 2, 3)");
}

TEST(PropertyRegistryTest, KeywordsAreLowercased) {
    EXPECT_EQ(longhands_of("display: BLOCK")["display"], "block");
    EXPECT_EQ(longhands_of("width: AUTO")["width"], "auto");
}

TEST(PropertyRegistryTest, RejectsInvalidValues) {
    EXPECT_EQ(expansion_error("display: sideways"), "invalid value 'sideways' for 'display'");
    EXPECT_EQ(expansion_error("colr: red"), "unknown property 'colr'");
    EXPECT_EQ(expansion_error("width: -5px"), "invalid value '-5px' for 'width'");
    EXPECT_EQ(expansion_error("opacity: 1px"), "invalid value '1px' for 'opacity'");
    EXPECT_EQ(expansion_error("order: 1.5"), "invalid value '1.5' for 'order'");
    EXPECT_EQ(expansion_error("color: red blue"),
              "'color' takes a single value, got 'red blue'");
}

TEST(PropertyRegistryTest, FontValues) {
    EXPECT_EQ(longhands_of("font-family: \"Fira Sans\", serif")["font-family"],
              "\"Fira Sans\", serif");
    EXPECT_EQ(longhands_of("font-weight: 700")["font-weight"], "700");
    EXPECT_EQ(longhands_of("font-size: large")["font-size"], "large");
    EXPECT_EQ(longhands_of("line-height: 1.5")["line-height"], "1.5");

    expansion_error("font-weight: 1001");
    expansion_error("font-family: serif,");
}

TEST(PropertyRegistryTest, WideKeywordsPassThrough) {
    EXPECT_EQ(longhands_of("color: INHERIT")["color"], "inherit");

    auto margin = longhands_of("margin: unset");
    ASSERT_EQ(margin.size(), 4u);
    EXPECT_EQ(margin["margin-left"], "unset");
}

// ---------------------------------------------------------------------------
// 3. Shorthand expansion
// ---------------------------------------------------------------------------
TEST(PropertyRegistryTest, BoxShorthands) {
    auto one = longhands_of("margin: 4px");
    EXPECT_EQ(one["margin-top"], "4px");
    EXPECT_EQ(one["margin-left"], "4px");

    auto two = longhands_of("padding: 1px 2px");
    EXPECT_EQ(two["padding-top"], "1px");
    EXPECT_EQ(two["padding-right"], "2px");
    EXPECT_EQ(two["padding-bottom"], "1px");
    EXPECT_EQ(two["padding-left"], "2px");

    auto three = longhands_of("margin: 1px auto 3px");
    EXPECT_EQ(three["margin-right"], "auto");
    EXPECT_EQ(three["margin-bottom"], "3px");
    EXPECT_EQ(three["margin-left"], "auto");

    auto four = longhands_of("border-radius: 1px 2px 3px 4px");
    EXPECT_EQ(four["border-bottom-left-radius"], "4px");

    EXPECT_NE(expansion_error("margin: 1px 2px 3px 4px 5px").find("margin"),
              std::string::npos);
}

TEST(PropertyRegistryTest, GapAndBackground) {
    auto gap = longhands_of("gap: 8px");
    EXPECT_EQ(gap["row-gap"], "8px");
    EXPECT_EQ(gap["column-gap"], "8px");

    auto both = longhands_of("gap: 8px 4px");
    EXPECT_EQ(both["column-gap"], "4px");

    EXPECT_EQ(longhands_of("background: #fff")["background-color"], "#fff");
    expansion_error("background: url(x.png)");
}

TEST(PropertyRegistryTest, BorderInAnyOrder) {
    auto border = longhands_of("border: red 2px dashed");
    EXPECT_EQ(border["border-width"], "2px");
    EXPECT_EQ(border["border-style"], "dashed");
    EXPECT_EQ(border["border-color"], "red");

    auto style_only = longhands_of("border: solid");
    EXPECT_EQ(style_only["border-width"], "0px");
    EXPECT_EQ(style_only["border-color"], "currentcolor");

    expansion_error("border: solid solid");
}

TEST(PropertyRegistryTest, FlexShorthand) {
    auto one = longhands_of("flex: 1");
    EXPECT_EQ(one["flex-grow"], "1");
    EXPECT_EQ(one["flex-shrink"], "1");
    EXPECT_EQ(one["flex-basis"], "0%");

    auto none = longhands_of("flex: none");
    EXPECT_EQ(none["flex-grow"], "0");
    EXPECT_EQ(none["flex-shrink"], "0");
    EXPECT_EQ(none["flex-basis"], "auto");

    auto full = longhands_of("flex: 2 3 10px");
    EXPECT_EQ(full["flex-grow"], "2");
    EXPECT_EQ(full["flex-shrink"], "3");
    EXPECT_EQ(full["flex-basis"], "10px");

    auto basis = longhands_of("flex: 30%");
    EXPECT_EQ(basis["flex-grow"], "1");
    EXPECT_EQ(basis["flex-basis"], "30%");
}

// ---------------------------------------------------------------------------
// 4. Store: appending stylesheets
// ---------------------------------------------------------------------------
TEST(StylesheetStoreTest, OriginsRunAcrossStylesheets) {
    StylesheetStore store;

    auto first = store.add(".a { color: red } .b { color: blue }");
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.rules_added, 2u);

    auto second = store.add(".c { color: green }");
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.rules_added, 1u);

    ASSERT_EQ(store.rule_count(), 3u);
    EXPECT_EQ(store.stylesheet_count(), 2u);
    for (size_t i = 0; i < store.rules().size(); ++i) {
        EXPECT_EQ(store.rules()[i].origin, i);
    }
    EXPECT_EQ(store.rules()[2].selector_text, ".c");
}

TEST(StylesheetStoreTest, ShorthandsAreExpandedWithImportance) {
    StylesheetStore store;
    auto result = store.add(".a { margin: 1px 2px !important; }");
    ASSERT_TRUE(result.ok());

    const auto& decls = store.rules()[0].declarations;
    ASSERT_EQ(decls.size(), 4u);
    EXPECT_EQ(decls[0].property, "margin-top");
    EXPECT_EQ(decls[0].value, "1px");
    EXPECT_EQ(decls[3].property, "margin-left");
    EXPECT_EQ(decls[3].value, "2px");
    for (const auto& d : decls) EXPECT_TRUE(d.important);
}

TEST(StylesheetStoreTest, EmptyStylesheetIsFine) {
    StylesheetStore store;
    auto result = store.add("");
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.rules_added, 0u);
    EXPECT_EQ(store.stylesheet_count(), 1u);
}

// ---------------------------------------------------------------------------
// 5. Store: recoverable problems
// ---------------------------------------------------------------------------
TEST(StylesheetStoreTest, InvalidDeclarationsBecomeIssues) {
    StylesheetStore store;
    auto result = store.add(".a { colr: red; display: sideways; color: blue }");
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.issues.size(), 2u);
    EXPECT_EQ(result.issues[0].message, "unknown property 'colr'");
    EXPECT_EQ(result.issues[1].message, "invalid value 'sideways' for 'display'");
    EXPECT_LT(result.issues[0].position, result.issues[1].position);

    ASSERT_EQ(store.rule_count(), 1u);
    ASSERT_EQ(store.rules()[0].declarations.size(), 1u);
    EXPECT_EQ(store.rules()[0].declarations[0].value, "blue");
}

TEST(StylesheetStoreTest, RuleWithNoValidDeclarationsKeepsItsOrigin) {
    StylesheetStore store;
    ASSERT_TRUE(store.add(".a { colr: red } .b { color: blue }").ok());
    ASSERT_EQ(store.rule_count(), 2u);
    EXPECT_TRUE(store.rules()[0].declarations.empty());
    EXPECT_EQ(store.rules()[1].origin, 1u);
}

TEST(StylesheetStoreTest, IssuesAreSortedByPosition) {
    StylesheetStore store;
    // Selector issues come from the parser, declaration issues from
    // expansion; both end up in source order.
    auto result = store.add(".a { colr: red }\na:hover { color: red }\n.b { x: 1 }");
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.issues.size(), 3u);
    EXPECT_TRUE(std::is_sorted(result.issues.begin(), result.issues.end(),
                               [](const ParseIssue& a, const ParseIssue& b) {
                                   return a.position < b.position;
                               }));
    EXPECT_EQ(result.issues[1].line, 2u);
}

TEST(StylesheetStoreTest, AtRulesAreListed) {
    StylesheetStore store;
    auto result = store.add("@charset \"utf-8\"; @font-face { font-family: x } .a { color: red }");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.ignored_at_rules, (std::vector<std::string>{"charset", "font-face"}));
    EXPECT_EQ(result.rules_added, 1u);
}

// ---------------------------------------------------------------------------
// 6. Store: fatal input leaves the store untouched
// ---------------------------------------------------------------------------
TEST(StylesheetStoreTest, FatalInputAppendsNothing) {
    StylesheetStore store;
    ASSERT_TRUE(store.add(".a { color: red }").ok());

    auto result = store.add(".b { color: blue }\n.c { color: green");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status.code, ErrorCode::ParseError);
    EXPECT_EQ(result.status.message, "unterminated block at line 2, column 4");
    EXPECT_EQ(result.status.position, 22u);
    EXPECT_EQ(result.rules_added, 0u);
    ASSERT_EQ(result.issues.size(), 1u);

    EXPECT_EQ(store.rule_count(), 1u);
    EXPECT_EQ(store.stylesheet_count(), 1u);

    auto next = store.add(".d { color: black }");
    ASSERT_TRUE(next.ok());
    EXPECT_EQ(store.rules().back().origin, 1u);
}
