#pragma once
#include "canon/CatalogIndex.hpp"
#include "canon/Models.hpp"
#include "canon/RuleSet.hpp"

#include <optional>
#include <string>
#include <unordered_set>

namespace canon {

// Resolves an already-normalized string against a catalog index. Strategies
// run in a fixed order and the first one with any candidate wins:
//   exact name -> exact alias -> singular/plural -> containment -> edit distance
class Matcher {
public:
    Matcher();
    explicit Matcher(MatchConfig cfg);

    std::optional<MatchResult> find_match(const std::string& normalized, const CatalogIndex& index) const;

    const MatchConfig& config() const { return m_cfg; }

private:
    MatchConfig m_cfg;
    std::unordered_set<std::string> m_short_words;

    std::optional<MatchResult> match_exact(const std::string& q, const CatalogIndex& index) const;
    std::optional<MatchResult> match_plural(const std::string& q, const CatalogIndex& index) const;
    std::optional<MatchResult> match_containment(const std::string& q, const CatalogIndex& index) const;
    std::optional<MatchResult> match_edit_distance(const std::string& q, const CatalogIndex& index) const;

    bool containment_eligible(const std::string& term) const;
};

// Matches with the default MatchConfig.
std::optional<MatchResult> find_match(const std::string& normalized, const CatalogIndex& index);

}  // namespace canon
