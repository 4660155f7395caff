#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "canon/AcceptancePolicy.hpp"
#include "canon/Canonicalizer.hpp"
#include "io/JsonIO.hpp"

namespace canon::io {

// Everything a caller needs to persist one batch run: one JSONL line per
// input (canonical id + tier for auditability) and a summary document.
struct ResultsArtifact {
    std::string catalog_path;
    std::string input_path;
    std::string rules_path;
    size_t catalog_items = 0;

    AcceptancePolicy policy;

    std::vector<IngredientInput> inputs;
    std::vector<Resolution> resolutions;  // parallel to inputs
    BatchSummary summary;

    nlohmann::json record_json(size_t i) const;
    nlohmann::json summary_json() const;

    void write_jsonl(const std::filesystem::path& out_path) const;
    void write_summary(const std::filesystem::path& out_path) const;
};

}  // namespace canon::io
