#pragma once
#include "canon/AcceptancePolicy.hpp"
#include "canon/CatalogIndex.hpp"
#include "canon/JunkClassifier.hpp"
#include "canon/Matcher.hpp"
#include "canon/Models.hpp"
#include "canon/Normalizer.hpp"
#include "canon/RuleSet.hpp"

#include <optional>
#include <string>
#include <vector>

namespace canon {

enum class Outcome {
    Junk,       // not an ingredient; never normalized or matched
    NoSignal,   // normalized to fewer than min_signal_length chars
    Unmatched,  // defer to manual / LLM resolution
    Matched
};

struct Resolution {
    std::string raw;
    std::string normalized;
    Outcome outcome = Outcome::Unmatched;
    std::optional<MatchResult> match;
};

struct BatchSummary {
    size_t total = 0;
    size_t junk = 0;
    size_t no_signal = 0;
    size_t unmatched = 0;
    size_t exact = 0;
    size_t alias = 0;
    size_t fuzzy = 0;
    size_t accepted = 0;

    size_t matched() const { return exact + alias + fuzzy; }

    // matched / non-junk inputs
    double match_rate() const;
};

// Full pipeline for one catalog snapshot: junk check -> normalize -> match.
// Holds no per-ingredient state; persisting results is up to the caller.
class Canonicalizer {
public:
    Canonicalizer();
    explicit Canonicalizer(const RuleSet& rules);

    CatalogIndex build_index(std::vector<CanonicalItem> items) const;

    Resolution resolve(const std::string& raw, const CatalogIndex& index) const;

    // Output order equals input order for any thread count.
    std::vector<Resolution> resolve_batch(const std::vector<std::string>& raws,
                                          const CatalogIndex& index,
                                          size_t threads = 1) const;

    const Normalizer& normalizer() const { return m_normalizer; }
    const JunkClassifier& junk() const { return m_junk; }
    const Matcher& matcher() const { return m_matcher; }

private:
    Normalizer m_normalizer;
    JunkClassifier m_junk;
    Matcher m_matcher;
};

BatchSummary summarize(const std::vector<Resolution>& resolutions, const AcceptancePolicy& policy = {});

const char* outcome_str(Outcome o);

}  // namespace canon
