#include "canon/Canonicalizer.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace canon {

double BatchSummary::match_rate() const {
    const size_t considered = total - junk;
    if (considered == 0) return 0.0;
    return (double)matched() / (double)considered;
}

Canonicalizer::Canonicalizer() : Canonicalizer(default_rules()) {}

Canonicalizer::Canonicalizer(const RuleSet& rules)
    : m_normalizer(rules), m_junk(rules), m_matcher(rules.matching) {}

CatalogIndex Canonicalizer::build_index(std::vector<CanonicalItem> items) const {
    return CatalogIndex::build(std::move(items), m_normalizer);
}

Resolution Canonicalizer::resolve(const std::string& raw, const CatalogIndex& index) const {
    Resolution r;
    r.raw = raw;

    if (m_junk.is_junk(raw)) {
        r.outcome = Outcome::Junk;
        return r;
    }

    r.normalized = m_normalizer.normalize(raw);
    if (r.normalized.size() < m_matcher.config().min_signal_length) {
        r.outcome = Outcome::NoSignal;
        return r;
    }

    r.match = m_matcher.find_match(r.normalized, index);
    r.outcome = r.match ? Outcome::Matched : Outcome::Unmatched;
    return r;
}

std::vector<Resolution> Canonicalizer::resolve_batch(const std::vector<std::string>& raws,
                                                     const CatalogIndex& index,
                                                     size_t threads) const {
    std::vector<Resolution> out(raws.size());
    if (raws.empty()) return out;

    const size_t workers = std::max<size_t>(1, std::min(threads, raws.size()));
    const size_t chunk = (raws.size() + workers - 1) / workers;

    auto run_range = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) out[i] = resolve(raws[i], index);
    };

    if (workers == 1) {
        run_range(0, raws.size());
        return out;
    }

    // each worker owns a disjoint slice of out
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t t = 0; t < workers; ++t) {
        const size_t begin = t * chunk;
        const size_t end = std::min(begin + chunk, raws.size());
        if (begin >= end) break;
        pool.emplace_back(run_range, begin, end);
    }
    for (auto& th : pool) th.join();

    return out;
}

BatchSummary summarize(const std::vector<Resolution>& resolutions, const AcceptancePolicy& policy) {
    BatchSummary s;
    s.total = resolutions.size();

    for (const auto& r : resolutions) {
        switch (r.outcome) {
            case Outcome::Junk: s.junk++; break;
            case Outcome::NoSignal: s.no_signal++; break;
            case Outcome::Unmatched: s.unmatched++; break;
            case Outcome::Matched:
                if (!r.match) break;
                if (r.match->confidence == Confidence::Exact) s.exact++;
                else if (r.match->confidence == Confidence::Alias) s.alias++;
                else s.fuzzy++;
                if (policy.accepts(*r.match)) s.accepted++;
                break;
        }
    }
    return s;
}

const char* outcome_str(Outcome o) {
    switch (o) {
        case Outcome::Junk: return "junk";
        case Outcome::NoSignal: return "no_signal";
        case Outcome::Unmatched: return "unmatched";
        case Outcome::Matched: return "matched";
        default: return "unknown";
    }
}

}  // namespace canon
