#include <gtest/gtest.h>
#include "canon/Matcher.hpp"

#include <optional>
#include <vector>

using namespace canon;

class MatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        index = build_index({
            {"garlic",      "garlic",      {"garlic clove"}, std::nullopt},
            {"olive-oil",   "olive oil",   {}, std::nullopt},
            {"tomatoes",    "tomatoes",    {}, std::nullopt},
            {"onion",       "onion",       {}, std::nullopt},
            {"red-onion",   "red onion",   {}, std::nullopt},
            {"bell-pepper", "bell pepper", {}, std::nullopt},
            {"scallions",   "scallions",   {"green onion"}, std::nullopt},
            {"egg",         "egg",         {}, std::nullopt},
            {"watermelon",  "watermelon",  {}, std::nullopt},
            {"water",       "water",       {}, std::nullopt},
        });
    }

    std::optional<MatchResult> match(const std::string& raw) const {
        return find_match(normalize(raw), index);
    }

    CatalogIndex index;
};

TEST_F(MatcherTest, ExactName) {
    auto r = match("olive oil");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "olive-oil");
    EXPECT_EQ(r->confidence, Confidence::Exact);
    EXPECT_EQ(r->strategy, Strategy::ExactName);
    EXPECT_EQ(r->matched_label, "olive oil");
    EXPECT_DOUBLE_EQ(r->score, 1.0);
}

TEST_F(MatcherTest, ExactAlias) {
    auto r = match("Green Onion");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "scallions");
    EXPECT_EQ(r->confidence, Confidence::Alias);
    EXPECT_EQ(r->strategy, Strategy::ExactAlias);
    EXPECT_EQ(r->matched_label, "scallions");
    EXPECT_EQ(r->matched_term, "green onion");
}

TEST_F(MatcherTest, SingularPluralSymmetry) {
    auto plural = match("tomatoes");
    auto singular = match("tomato");
    ASSERT_TRUE(plural.has_value());
    ASSERT_TRUE(singular.has_value());

    EXPECT_EQ(plural->canonical_id, "tomatoes");
    EXPECT_EQ(singular->canonical_id, "tomatoes");
    EXPECT_EQ(plural->confidence, Confidence::Exact);
    EXPECT_EQ(singular->confidence, Confidence::Fuzzy);
    EXPECT_EQ(singular->strategy, Strategy::PluralName);
}

TEST_F(MatcherTest, PluralViaAliasIsAliasTier) {
    auto r = match("green onions");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "scallions");
    EXPECT_EQ(r->confidence, Confidence::Alias);
    EXPECT_EQ(r->strategy, Strategy::PluralAlias);
}

TEST_F(MatcherTest, ContainmentPrefersLongest) {
    auto r = match("red onion wedges");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "red-onion");
    EXPECT_EQ(r->confidence, Confidence::Fuzzy);
    EXPECT_EQ(r->strategy, Strategy::Containment);

    auto w = match("watermelon juice");
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(w->canonical_id, "watermelon");
}

TEST_F(MatcherTest, DicedRedOnionResolvesToRedOnion) {
    auto r = match("diced red onion, finely chopped");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "red-onion");
}

TEST_F(MatcherTest, ContainmentInReverseDirection) {
    auto r = match("pepper");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "bell-pepper");
    EXPECT_EQ(r->strategy, Strategy::Containment);
    EXPECT_DOUBLE_EQ(r->score, 0.75);
}

TEST_F(MatcherTest, ShortWordAllowList) {
    auto r = match("egg yolks");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "egg");
    EXPECT_EQ(r->strategy, Strategy::Containment);

    MatchConfig cfg;
    cfg.short_words.clear();
    Matcher strict(cfg);
    EXPECT_FALSE(strict.find_match("egg yolks", index).has_value());
}

TEST_F(MatcherTest, BoundedFuzzyAcceptance) {
    auto r = match("bell papper");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "bell-pepper");
    EXPECT_EQ(r->confidence, Confidence::Fuzzy);
    EXPECT_EQ(r->strategy, Strategy::EditDistance);
    EXPECT_NEAR(r->score, 0.70 * (1.0 - 1.0 / 11.0), 1e-9);

    EXPECT_FALSE(match("completely unrelated text").has_value());
}

TEST_F(MatcherTest, NoSignalSkipsAllStrategies) {
    CatalogIndex tiny = build_index({{"x", "ab", {}, std::nullopt}});
    EXPECT_FALSE(find_match("ab", tiny).has_value());
    EXPECT_FALSE(find_match("", index).has_value());
}

TEST_F(MatcherTest, EmptyCatalogNeverMatches) {
    CatalogIndex empty = build_index({});
    EXPECT_FALSE(find_match("olive oil", empty).has_value());
}

TEST_F(MatcherTest, Deterministic) {
    const std::string q = normalize("2 cloves garlic, minced");
    auto first = find_match(q, index);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(find_match(q, index), first);
    }
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->canonical_id, "garlic");
}

TEST(MatcherPrecedenceTest, ExactBeatsEverythingElse) {
    // "onion" is also a plural/containment/edit-distance candidate of "onions"
    CatalogIndex idx = build_index({
        {"plural", "onions", {}, std::nullopt},
        {"single", "onion", {}, std::nullopt},
    });

    auto r = find_match("onion", idx);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "single");
    EXPECT_EQ(r->confidence, Confidence::Exact);
}

TEST(MatcherPrecedenceTest, NameBeatsEarlierAlias) {
    CatalogIndex idx = build_index({
        {"dip", "dip", {"salsa"}, std::nullopt},
        {"salsa", "salsa", {}, std::nullopt},
    });

    auto r = find_match("salsa", idx);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "salsa");
    EXPECT_EQ(r->confidence, Confidence::Exact);
}

TEST(MatcherTieBreakTest, EditDistanceTieKeepsCatalogOrder) {
    CatalogIndex idx = build_index({
        {"bread", "bread", {}, std::nullopt},
        {"broad", "broad", {}, std::nullopt},
    });

    auto r = find_match("brxad", idx);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "bread");
    EXPECT_EQ(r->strategy, Strategy::EditDistance);
}

TEST(MatcherTieBreakTest, ContainmentTieKeepsCatalogOrder) {
    CatalogIndex idx = build_index({
        {"lime", "lime", {}, std::nullopt},
        {"mint", "mint", {}, std::nullopt},
    });

    auto r = find_match("lime mint soda", idx);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->canonical_id, "lime");
}

TEST(ConfidenceTest, TiersAreOrdered) {
    EXPECT_GT(Confidence::Exact, Confidence::Alias);
    EXPECT_GT(Confidence::Alias, Confidence::Fuzzy);
    EXPECT_STREQ(confidence_str(Confidence::Exact), "exact");
    EXPECT_STREQ(strategy_str(Strategy::PluralAlias), "plural_alias");
}
