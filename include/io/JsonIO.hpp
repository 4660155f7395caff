#pragma once
#include <string>
#include <vector>

#include "canon/Models.hpp"
#include "canon/RuleSet.hpp"

namespace canon::io {

struct IngredientInput {
    std::string id;    // record id, or "line:<n>" for plain text input
    std::string name;  // raw ingredient text
};

// JSON array of {id, name, aliases, category}, or an object with such an
// array under "items". Throws std::runtime_error with a path to the bad field.
std::vector<CanonicalItem> load_catalog(const std::string& path);

// Overlays the keys present in a rules JSON file onto base.
RuleSet load_rules(const std::string& path, RuleSet base = default_rules());

// *.jsonl: one {id, name} object per line; anything else: one raw string per line.
std::vector<IngredientInput> load_ingredients(const std::string& path);

}  // namespace canon::io
