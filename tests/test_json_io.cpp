#include <gtest/gtest.h>
#include "io/JsonIO.hpp"
#include "io/ResultsArtifact.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace canon;
using namespace canon::io;

class JsonIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("pantry_canon_") + info->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& body) {
        const fs::path p = dir_ / name;
        std::ofstream out(p, std::ios::out | std::ios::trunc);
        out << body;
        return p.string();
    }

    fs::path dir_;
};

TEST_F(JsonIOTest, LoadCatalogAcceptsExportVariants) {
    const std::string path = write_file("catalog.json", R"({
      "items": [
        {"id": "a1", "name": "Garlic", "aliases": ["garlic clove"], "category": "produce"},
        {"id": 42, "canonical_name": "Olive Oil", "aliases": null, "category": null}
      ]
    })");

    auto items = load_catalog(path);
    ASSERT_EQ(items.size(), 2u);

    EXPECT_EQ(items[0].id, "a1");
    EXPECT_EQ(items[0].name, "Garlic");
    ASSERT_EQ(items[0].aliases.size(), 1u);
    ASSERT_TRUE(items[0].category.has_value());
    EXPECT_EQ(*items[0].category, "produce");

    EXPECT_EQ(items[1].id, "42");
    EXPECT_EQ(items[1].name, "Olive Oil");
    EXPECT_TRUE(items[1].aliases.empty());
    EXPECT_FALSE(items[1].category.has_value());
}

TEST_F(JsonIOTest, LoadCatalogRejectsBadFields) {
    const std::string bad_name = write_file("bad_name.json", R"([{"id": "1", "name": 7}])");
    EXPECT_THROW(load_catalog(bad_name), std::runtime_error);

    const std::string bad_alias = write_file("bad_alias.json", R"([{"id": "1", "name": "x", "aliases": ["ok", 3]}])");
    EXPECT_THROW(load_catalog(bad_alias), std::runtime_error);

    const std::string no_id = write_file("no_id.json", R"([{"name": "garlic"}])");
    EXPECT_THROW(load_catalog(no_id), std::runtime_error);

    EXPECT_THROW(load_catalog((dir_ / "missing.json").string()), std::runtime_error);
}

TEST_F(JsonIOTest, LoadCatalogErrorNamesTheField) {
    const std::string path = write_file("bad.json", R"([{"id": "1", "name": "ok"}, {"id": "2", "name": []}])");
    try {
        load_catalog(path);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("root[1].name"), std::string::npos) << e.what();
    }
}

TEST_F(JsonIOTest, LoadRulesOverlaysOnlyPresentKeys) {
    const std::string path = write_file("rules.json", R"({
      "or_alternative": "keep_last",
      "matching": {"fuzzy_ratio": 0.2, "short_words": ["Egg", "rye"]}
    })");

    const RuleSet defaults = default_rules();
    RuleSet r = load_rules(path);

    EXPECT_EQ(r.or_alternative, OrAlternative::KeepLast);
    EXPECT_DOUBLE_EQ(r.matching.fuzzy_ratio, 0.2);
    ASSERT_EQ(r.matching.short_words.size(), 2u);
    EXPECT_EQ(r.matching.short_words[0], "egg");

    EXPECT_EQ(r.units, defaults.units);
    EXPECT_EQ(r.prep_words, defaults.prep_words);
    EXPECT_EQ(r.matching.min_signal_length, defaults.matching.min_signal_length);
}

TEST_F(JsonIOTest, LoadRulesRejectsInvalidValues) {
    const std::string bad_or = write_file("bad_or.json", R"({"or_alternative": "keep_both"})");
    EXPECT_THROW(load_rules(bad_or), std::runtime_error);

    const std::string bad_ratio = write_file("bad_ratio.json", R"({"matching": {"fuzzy_ratio": 1.5}})");
    EXPECT_THROW(load_rules(bad_ratio), std::runtime_error);

    const std::string bad_len = write_file("bad_len.json", R"({"matching": {"min_signal_length": -1}})");
    EXPECT_THROW(load_rules(bad_len), std::runtime_error);
}

TEST_F(JsonIOTest, LoadIngredientsFromText) {
    const std::string path = write_file("ingredients.txt", "2 cloves garlic\r\n\n   \nolive oil\n");

    auto inputs = load_ingredients(path);
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0].id, "line:1");
    EXPECT_EQ(inputs[0].name, "2 cloves garlic");
    EXPECT_EQ(inputs[1].id, "line:4");
    EXPECT_EQ(inputs[1].name, "olive oil");
}

TEST_F(JsonIOTest, LoadIngredientsFromJsonl) {
    const std::string path = write_file("rows.jsonl",
        "{\"id\": \"r1\", \"name\": \"garlic\"}\n"
        "{\"id\": 7, \"ingredient_name\": \"basil leaves\"}\n"
        "{\"id\": \"r3\", \"ingredient_name\": \"\", \"notes\": \"salt to taste\"}\n");

    auto inputs = load_ingredients(path);
    ASSERT_EQ(inputs.size(), 3u);
    EXPECT_EQ(inputs[0].name, "garlic");
    EXPECT_EQ(inputs[1].id, "7");
    EXPECT_EQ(inputs[1].name, "basil leaves");
    EXPECT_EQ(inputs[2].name, "salt to taste");

    const std::string broken = write_file("broken.jsonl", "{\"id\": \"r1\", \"name\": \n");
    EXPECT_THROW(load_ingredients(broken), std::runtime_error);
}

TEST_F(JsonIOTest, ResultsArtifactRecords) {
    Canonicalizer canon;
    CatalogIndex index = canon.build_index({
        {"oil-1", "Olive Oil", {}, std::nullopt},
    });

    ResultsArtifact art;
    art.inputs = {{"r1", "2 tbsp extra-virgin olive oil"}, {"r2", "dragon fruit"}};
    for (const auto& in : art.inputs) art.resolutions.push_back(canon.resolve(in.name, index));
    art.summary = summarize(art.resolutions, art.policy);

    nlohmann::json hit = art.record_json(0);
    EXPECT_EQ(hit["canonical_item_id"], "oil-1");
    EXPECT_EQ(hit["confidence"], "exact");
    EXPECT_EQ(hit["strategy"], "exact_name");
    EXPECT_EQ(hit["accepted"], true);

    nlohmann::json miss = art.record_json(1);
    EXPECT_TRUE(miss["canonical_item_id"].is_null());
    EXPECT_EQ(miss["outcome"], "unmatched");
    EXPECT_EQ(miss["accepted"], false);

    const fs::path out = dir_ / "out" / "matches.jsonl";
    art.write_jsonl(out);

    std::ifstream in(out);
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) ++n;
    EXPECT_EQ(n, 2u);

    nlohmann::json summary = art.summary_json();
    EXPECT_EQ(summary["counts"]["exact"], 1);
    EXPECT_EQ(summary["counts"]["unmatched"], 1);
}
