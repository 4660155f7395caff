#include "canon/Matcher.hpp"
#include "canon/EditDistance.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace canon {

// per-strategy strength, 0..1
static constexpr double kScoreExactName = 1.00;
static constexpr double kScoreExactAlias = 0.95;
static constexpr double kScorePluralName = 0.90;
static constexpr double kScorePluralAlias = 0.88;
static constexpr double kScoreContainsTerm = 0.80;
static constexpr double kScoreContainedInTerm = 0.75;
static constexpr double kScoreEditDistanceMax = 0.70;

static MatchResult make_result(const CanonicalItem& item,
                               const std::string& term,
                               Confidence confidence,
                               Strategy strategy,
                               double score) {
    MatchResult r;
    r.canonical_id = item.id;
    r.confidence = confidence;
    r.matched_label = item.name;
    r.matched_term = term;
    r.strategy = strategy;
    r.score = score;
    return r;
}

// a == b + "s" / "es", or the other way round
static bool is_plural_pair(const std::string& a, const std::string& b) {
    auto adds_suffix = [](const std::string& longer, const std::string& shorter, const char* suffix) {
        const std::string sfx(suffix);
        return longer.size() == shorter.size() + sfx.size() &&
               longer.compare(0, shorter.size(), shorter) == 0 &&
               longer.compare(shorter.size(), sfx.size(), sfx) == 0;
    };
    return adds_suffix(a, b, "s") || adds_suffix(b, a, "s") ||
           adds_suffix(a, b, "es") || adds_suffix(b, a, "es");
}

Matcher::Matcher() : Matcher(MatchConfig{}) {}

Matcher::Matcher(MatchConfig cfg)
    : m_cfg(std::move(cfg)),
      m_short_words(m_cfg.short_words.begin(), m_cfg.short_words.end()) {}

bool Matcher::containment_eligible(const std::string& term) const {
    if (term.size() >= m_cfg.min_containment_length) return true;
    return m_short_words.count(term) > 0;
}

std::optional<MatchResult> Matcher::match_exact(const std::string& q, const CatalogIndex& index) const {
    if (const CanonicalItem* item = index.find_name(q)) {
        return make_result(*item, q, Confidence::Exact, Strategy::ExactName, kScoreExactName);
    }
    if (const CanonicalItem* item = index.find_alias(q)) {
        return make_result(*item, q, Confidence::Alias, Strategy::ExactAlias, kScoreExactAlias);
    }
    return std::nullopt;
}

std::optional<MatchResult> Matcher::match_plural(const std::string& q, const CatalogIndex& index) const {
    for (const auto& term : index.terms()) {
        if (!is_plural_pair(term.text, q)) continue;

        const CanonicalItem& item = index.items()[term.item];
        if (term.is_alias) {
            return make_result(item, term.text, Confidence::Alias, Strategy::PluralAlias, kScorePluralAlias);
        }
        return make_result(item, term.text, Confidence::Fuzzy, Strategy::PluralName, kScorePluralName);
    }
    return std::nullopt;
}

std::optional<MatchResult> Matcher::match_containment(const std::string& q, const CatalogIndex& index) const {
    const CatalogTerm* best = nullptr;
    size_t best_len = 0;
    double best_score = 0.0;

    const bool query_eligible = containment_eligible(q);

    for (const auto& term : index.terms()) {
        if (!containment_eligible(term.text)) continue;

        // strict ">" keeps the first candidate on ties
        if (term.text.size() > best_len && q.find(term.text) != std::string::npos) {
            best = &term;
            best_len = term.text.size();
            best_score = kScoreContainsTerm;
        }
        if (query_eligible && q.size() > best_len && term.text.find(q) != std::string::npos) {
            best = &term;
            best_len = q.size();
            best_score = kScoreContainedInTerm;
        }
    }

    if (!best) return std::nullopt;
    return make_result(index.items()[best->item], best->text, Confidence::Fuzzy, Strategy::Containment, best_score);
}

std::optional<MatchResult> Matcher::match_edit_distance(const std::string& q, const CatalogIndex& index) const {
    const CatalogTerm* best = nullptr;
    size_t best_distance = std::numeric_limits<size_t>::max();

    for (const auto& term : index.terms()) {
        const size_t budget = edit_budget(q.size(), term.text.size(), m_cfg.fuzzy_ratio);
        const size_t d = bounded_levenshtein(q, term.text, budget);
        if (d > budget) continue;

        if (d < best_distance) {
            best = &term;
            best_distance = d;
        }
    }

    if (!best) return std::nullopt;

    const double longest = (double)std::max(q.size(), best->text.size());
    const double score = kScoreEditDistanceMax * (1.0 - (double)best_distance / longest);
    return make_result(index.items()[best->item], best->text, Confidence::Fuzzy, Strategy::EditDistance, score);
}

std::optional<MatchResult> Matcher::find_match(const std::string& normalized, const CatalogIndex& index) const {
    if (normalized.size() < m_cfg.min_signal_length) return std::nullopt;

    if (auto r = match_exact(normalized, index)) return r;
    if (auto r = match_plural(normalized, index)) return r;
    if (auto r = match_containment(normalized, index)) return r;
    return match_edit_distance(normalized, index);
}

std::optional<MatchResult> find_match(const std::string& normalized, const CatalogIndex& index) {
    static const Matcher matcher;
    return matcher.find_match(normalized, index);
}

}  // namespace canon
