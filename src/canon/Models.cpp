#include "canon/Models.hpp"

namespace canon {

bool operator==(const MatchResult& a, const MatchResult& b) {
    return a.canonical_id == b.canonical_id &&
           a.confidence == b.confidence &&
           a.matched_label == b.matched_label &&
           a.matched_term == b.matched_term &&
           a.strategy == b.strategy &&
           a.score == b.score;
}

const char* confidence_str(Confidence c) {
    switch (c) {
        case Confidence::Exact: return "exact";
        case Confidence::Alias: return "alias";
        case Confidence::Fuzzy: return "fuzzy";
        default: return "unknown";
    }
}

const char* strategy_str(Strategy s) {
    switch (s) {
        case Strategy::ExactName: return "exact_name";
        case Strategy::ExactAlias: return "exact_alias";
        case Strategy::PluralName: return "plural_name";
        case Strategy::PluralAlias: return "plural_alias";
        case Strategy::Containment: return "containment";
        case Strategy::EditDistance: return "edit_distance";
        default: return "unknown";
    }
}

}  // namespace canon
