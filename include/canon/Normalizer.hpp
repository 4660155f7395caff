#pragma once
#include "canon/RuleSet.hpp"

#include <string>
#include <vector>

namespace canon {

// Deterministic, total string cleanup. The rule pass is repeated until the
// output stops changing, so normalize(normalize(s)) == normalize(s).
class Normalizer {
public:
    Normalizer();
    explicit Normalizer(RuleSet rules);

    std::string normalize(const std::string& raw) const;

    const RuleSet& rules() const { return m_rules; }

private:
    RuleSet m_rules;

    std::string apply_pass(const std::string& s) const;

    std::string strip_parse_artifact(const std::string& s) const;
    std::string collapse_varietals(std::string s) const;
    std::string strip_leading_words(const std::string& s, const std::vector<std::string>& words, bool eat_of) const;
    std::string strip_parentheticals(const std::string& s) const;
    std::string resolve_alternatives(const std::string& s) const;
    std::string strip_quantities(const std::string& s) const;
    static std::string clean_punctuation(const std::string& s);

    bool is_quantity_token(const std::string& tok) const;
};

// Normalizes with default_rules().
std::string normalize(const std::string& raw);

}  // namespace canon
