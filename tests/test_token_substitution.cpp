#include <gtest/gtest.h>
#include "templating/token_substitution.hpp"

using namespace scaffkit;

// ─── Token Map Tests ───────────────────────────────────────────

TEST(TokenMapTest, BindAndLookup) {
    TokenMap tokens;
    EXPECT_TRUE(tokens.empty());

    tokens.bind("NAME", "Cart");
    EXPECT_EQ(tokens.size(), 1);
    EXPECT_TRUE(tokens.contains("NAME"));
    EXPECT_FALSE(tokens.contains("OTHER"));
    ASSERT_NE(tokens.lookup("NAME"), nullptr);
    EXPECT_EQ(*tokens.lookup("NAME"), "Cart");
    EXPECT_EQ(tokens.lookup("OTHER"), nullptr);
}

TEST(TokenMapTest, RebindReplacesValue) {
    TokenMap tokens{{"NAME", "Cart"}};
    tokens.bind("NAME", "Checkout");
    EXPECT_EQ(tokens.size(), 1);
    EXPECT_EQ(*tokens.lookup("NAME"), "Checkout");
}

TEST(TokenMapTest, MarkersLongestFirst) {
    TokenMap tokens{{"A", "1"}, {"ABC", "3"}, {"AB", "2"}};
    const auto& markers = tokens.markers();
    ASSERT_EQ(markers.size(), 3);
    EXPECT_EQ(markers[0].first, "{{ABC}}");
    EXPECT_EQ(markers[1].first, "{{AB}}");
    EXPECT_EQ(markers[2].first, "{{A}}");
}

// ─── Substitution Tests ────────────────────────────────────────

TEST(SubstitutionTest, ReplacesEveryOccurrence) {
    TokenMap tokens{{"NAME", "Cart"}};
    EXPECT_EQ(substitute("{{NAME}}Screen and {{NAME}}ViewModel", tokens),
              "CartScreen and CartViewModel");
}

TEST(SubstitutionTest, TextWithoutTokensUnchanged) {
    TokenMap tokens{{"NAME", "Cart"}};
    std::string text = "fun main() {\n    println(\"{ not a token }\")\n}\n";
    EXPECT_EQ(substitute(text, tokens), text);
    EXPECT_EQ(substitute("", tokens), "");
}

TEST(SubstitutionTest, EmptyMapIsIdentity) {
    TokenMap tokens;
    EXPECT_EQ(substitute("{{NAME}}", tokens), "{{NAME}}");
}

TEST(SubstitutionTest, UnknownTokenLeftIntact) {
    TokenMap tokens{{"NAME", "Cart"}};
    EXPECT_EQ(substitute("{{NAME}} {{UNKNOWN}}", tokens), "Cart {{UNKNOWN}}");
}

TEST(SubstitutionTest, LongestMarkerWins) {
    // FEATURE_NAME_CAMEL must not be consumed as FEATURE_NAME + "_CAMEL}}".
    TokenMap tokens{{"FEATURE_NAME", "UserProfile"}, {"FEATURE_NAME_CAMEL", "user_profile"}};
    EXPECT_EQ(substitute("{{FEATURE_NAME}}/{{FEATURE_NAME_CAMEL}}", tokens),
              "UserProfile/user_profile");
}

TEST(SubstitutionTest, PrefixNamesResolveIndependently) {
    TokenMap tokens{{"PACKAGE", "com.example.feature.cart"}, {"PACKAGE_PATH", "com/example/feature/cart"}};
    EXPECT_EQ(substitute("package {{PACKAGE}} // {{PACKAGE_PATH}}", tokens),
              "package com.example.feature.cart // com/example/feature/cart");
}

TEST(SubstitutionTest, ReplacementIsNotRescanned) {
    TokenMap tokens{{"A", "{{B}}"}, {"B", "boom"}};
    EXPECT_EQ(substitute("{{A}}", tokens), "{{B}}");
}

TEST(SubstitutionTest, ResubstitutionIsStable) {
    TokenMap tokens{{"FEATURE_NAME", "ShoppingCart"}, {"PACKAGE", "com.example.shoppingcart"}};
    std::string once = substitute("package {{PACKAGE}}\nclass {{FEATURE_NAME}}Screen {{OTHER}}", tokens);
    EXPECT_EQ(substitute(once, tokens), once);
}

TEST(SubstitutionTest, ExtraBraceBeforeMarker) {
    TokenMap tokens{{"A", "x"}};
    EXPECT_EQ(substitute("{{{A}}", tokens), "{x");
    EXPECT_EQ(substitute("{{A}}}", tokens), "x}");
}

TEST(SubstitutionTest, UnterminatedMarker) {
    TokenMap tokens{{"A", "x"}};
    EXPECT_EQ(substitute("{{A", tokens), "{{A");
    EXPECT_EQ(substitute("tail {{", tokens), "tail {{");
}

// ─── Unresolved Token Tests ────────────────────────────────────

TEST(SubstitutionTest, UnresolvedTokensInFirstAppearanceOrder) {
    TokenMap tokens{{"NAME", "Cart"}};
    auto names = unresolvedTokens("{{ZED}} {{NAME}} {{ALPHA}} {{ZED}}", tokens);
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0], "ZED");
    EXPECT_EQ(names[1], "ALPHA");
}

TEST(SubstitutionTest, MalformedMarkersAreNotReported) {
    TokenMap tokens;
    EXPECT_TRUE(unresolvedTokens("{{}} {{ spaced }} {{a-b}}", tokens).empty());
    EXPECT_TRUE(unresolvedTokens("plain text", tokens).empty());
}
