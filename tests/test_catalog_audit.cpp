#include <gtest/gtest.h>
#include "canon/CatalogAudit.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace canon;

static size_t count_code(const AuditReport& rep, const std::string& code) {
    return (size_t)std::count_if(rep.issues.begin(), rep.issues.end(),
                                 [&](const AuditIssue& e) { return e.code == code; });
}

TEST(CatalogAuditTest, CleanCatalogPasses) {
    const Normalizer normalizer;
    AuditReport rep = audit_catalog({
        {"1", "garlic", {"garlic clove"}, std::nullopt},
        {"2", "olive oil", {}, std::nullopt},
    }, normalizer);

    EXPECT_TRUE(rep.pass);
    EXPECT_EQ(rep.items, 2u);
    EXPECT_TRUE(rep.issues.empty());
}

TEST(CatalogAuditTest, FlagsDataQualityDefects) {
    const Normalizer normalizer;
    AuditReport rep = audit_catalog({
        {"1", "Garlic", {"garlic"}, std::nullopt},                          // self alias
        {"2", "tomatoes", {"roma tomatoes", "Roma Tomatoes"}, std::nullopt}, // duplicate alias
        {"3", "Tomatoes", {}, std::nullopt},                                // shares "tomatoes" with 2
        {"4", "Cups", {}, std::nullopt},                                    // normalizes to nothing
        {"1", "basil", {}, std::nullopt},                                   // id reused
        {"", "thyme", {}, std::nullopt},
    }, normalizer);

    EXPECT_FALSE(rep.pass);
    EXPECT_EQ(count_code(rep, "self_alias"), 1u);
    EXPECT_EQ(count_code(rep, "duplicate_alias"), 1u);
    EXPECT_EQ(count_code(rep, "duplicate_term"), 1u);
    EXPECT_EQ(count_code(rep, "empty_term"), 1u);
    EXPECT_EQ(count_code(rep, "duplicate_id"), 1u);
    EXPECT_EQ(count_code(rep, "empty_id"), 1u);

    auto it = std::find_if(rep.issues.begin(), rep.issues.end(),
                           [](const AuditIssue& e) { return e.code == "duplicate_term"; });
    ASSERT_NE(it, rep.issues.end());
    EXPECT_EQ(it->item_id, "3");
}

TEST(CatalogAuditTest, DoesNotMutateInput) {
    const Normalizer normalizer;
    const std::vector<CanonicalItem> items = {
        {"1", "Garlic", {"garlic"}, std::nullopt},
    };

    audit_catalog(items, normalizer);
    ASSERT_EQ(items[0].aliases.size(), 1u);
    EXPECT_EQ(items[0].name, "Garlic");
}
