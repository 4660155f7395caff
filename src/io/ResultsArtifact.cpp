#include "io/ResultsArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace canon::io {

static std::ofstream open_for_write(const std::filesystem::path& out_path) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());
    return out;
}

nlohmann::json ResultsArtifact::record_json(size_t i) const {
    const IngredientInput& in = inputs.at(i);
    const Resolution& r = resolutions.at(i);

    nlohmann::json j;
    j["id"] = in.id;
    j["raw"] = r.raw;
    j["normalized"] = r.normalized;
    j["outcome"] = outcome_str(r.outcome);

    if (r.match) {
        j["canonical_item_id"] = r.match->canonical_id;
        j["matched_name"] = r.match->matched_label;
        j["matched_term"] = r.match->matched_term;
        j["confidence"] = confidence_str(r.match->confidence);
        j["strategy"] = strategy_str(r.match->strategy);
        j["score"] = r.match->score;
        j["accepted"] = policy.accepts(*r.match);
    } else {
        j["canonical_item_id"] = nullptr;
        j["accepted"] = false;
    }
    return j;
}

nlohmann::json ResultsArtifact::summary_json() const {
    nlohmann::json j;
    j["catalog_path"] = catalog_path;
    j["input_path"] = input_path;
    j["rules_path"] = rules_path;
    j["catalog_items"] = catalog_items;

    j["policy"] = {
        {"min_score", policy.min_score},
        {"min_tier", confidence_str(policy.min_tier)},
    };

    j["counts"] = {
        {"total", summary.total},
        {"junk", summary.junk},
        {"no_signal", summary.no_signal},
        {"unmatched", summary.unmatched},
        {"exact", summary.exact},
        {"alias", summary.alias},
        {"fuzzy", summary.fuzzy},
        {"matched", summary.matched()},
        {"accepted", summary.accepted},
    };
    j["match_rate"] = summary.match_rate();

    return j;
}

void ResultsArtifact::write_jsonl(const std::filesystem::path& out_path) const {
    if (inputs.size() != resolutions.size()) {
        throw std::runtime_error("results artifact: inputs and resolutions differ in size");
    }

    std::ofstream out = open_for_write(out_path);
    for (size_t i = 0; i < resolutions.size(); ++i) {
        out << record_json(i).dump() << "\n";
    }
}

void ResultsArtifact::write_summary(const std::filesystem::path& out_path) const {
    std::ofstream out = open_for_write(out_path);
    out << summary_json().dump(2) << "\n";
}

}  // namespace canon::io
