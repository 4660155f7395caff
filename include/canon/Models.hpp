#pragma once
#include <optional>
#include <string>
#include <vector>

namespace canon {

struct CanonicalItem {
    std::string id;                       // opaque, stable
    std::string name;                     // authoritative label
    std::vector<std::string> aliases;     // never contains name itself
    std::optional<std::string> category;
};

// Declared weakest first so that Exact > Alias > Fuzzy.
enum class Confidence {
    Fuzzy,
    Alias,
    Exact
};

enum class Strategy {
    ExactName,
    ExactAlias,
    PluralName,
    PluralAlias,
    Containment,
    EditDistance
};

struct MatchResult {
    std::string canonical_id;
    Confidence confidence = Confidence::Fuzzy;
    std::string matched_label;   // item.name of the winning item
    std::string matched_term;    // normalized name/alias that actually matched
    Strategy strategy = Strategy::ExactName;
    double score = 0.0;          // 0..1
};

bool operator==(const MatchResult& a, const MatchResult& b);
inline bool operator!=(const MatchResult& a, const MatchResult& b) { return !(a == b); }

const char* confidence_str(Confidence c);
const char* strategy_str(Strategy s);

}  // namespace canon
