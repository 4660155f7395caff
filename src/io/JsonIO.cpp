#include "io/JsonIO.hpp"
#include "canon/TextUtil.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace canon::io {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + path + ": " + e.what());
    }
    return j;
}

// ids are uuids in practice but numeric keys show up in exports
static std::string require_id(const json& j, const std::string& where) {
    if (!j.contains("id")) {
        throw std::runtime_error(where + " missing required field: id");
    }
    const json& v = j.at("id");
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    throw std::runtime_error(where + ".id must be a string or integer");
}

static std::vector<std::string> string_array(const json& arr, const std::string& where) {
    require_array(arr, where);

    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static CanonicalItem parse_item(const json& j, const std::string& where) {
    require_object(j, where);

    CanonicalItem item;
    item.id = require_id(j, where);

    // older exports call it canonical_name
    const char* name_key = j.contains("name") ? "name" : "canonical_name";
    if (!j.contains(name_key)) {
        throw std::runtime_error(where + " missing required field: name");
    }
    if (!j.at(name_key).is_string()) {
        throw std::runtime_error(where + "." + name_key + " must be a string");
    }
    item.name = j.at(name_key).get<std::string>();

    if (j.contains("aliases") && !j.at("aliases").is_null()) {
        item.aliases = string_array(j.at("aliases"), where + ".aliases");
    }

    if (j.contains("category") && !j.at("category").is_null()) {
        if (!j.at("category").is_string()) {
            throw std::runtime_error(where + ".category must be a string or null");
        }
        item.category = j.at("category").get<std::string>();
    }

    return item;
}

std::vector<CanonicalItem> load_catalog(const std::string& path) {
    json j = read_json_file(path, "catalog");

    std::string where = "root";
    if (j.is_object() && j.contains("items")) {
        j = j.at("items");
        where = "root.items";
    }
    require_array(j, where);

    std::vector<CanonicalItem> items;
    items.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        items.push_back(parse_item(j.at(i), oss.str()));
    }
    return items;
}

// ---------- rules ----------

static void override_list(const json& j, const char* key, const std::string& where,
                          std::vector<std::string>& dst, bool lowercase) {
    if (!j.contains(key)) return;
    dst = string_array(j.at(key), where + "." + key);
    if (lowercase) {
        for (auto& s : dst) s = textutil::to_lower_ascii(s);
    }
}

static size_t require_size(const json& j, const char* key, const std::string& where) {
    const json& v = j.at(key);
    if (!v.is_number_integer() || v.get<long long>() < 0) {
        throw std::runtime_error(where + "." + key + " must be a non-negative integer");
    }
    return (size_t)v.get<long long>();
}

static OrAlternative parse_or_alternative(const json& v, const std::string& where) {
    if (!v.is_string()) throw std::runtime_error(where + " must be a string");
    const std::string s = v.get<std::string>();
    if (s == "keep_first") return OrAlternative::KeepFirst;
    if (s == "keep_last") return OrAlternative::KeepLast;
    throw std::runtime_error(where + " must be \"keep_first\" or \"keep_last\", got \"" + s + "\"");
}

RuleSet load_rules(const std::string& path, RuleSet base) {
    const json j = read_json_file(path, "rules");
    require_object(j, "rules");

    RuleSet r = std::move(base);

    override_list(j, "modifiers", "rules", r.modifiers, true);
    override_list(j, "prep_adverbs", "rules", r.prep_adverbs, true);
    override_list(j, "prep_words", "rules", r.prep_words, true);
    override_list(j, "container_nouns", "rules", r.container_nouns, true);
    override_list(j, "units", "rules", r.units, true);

    if (j.contains("varietals")) {
        const json& v = j.at("varietals");
        require_object(v, "rules.varietals");
        r.varietals.clear();
        for (auto it = v.begin(); it != v.end(); ++it) {
            std::vector<std::string> names = string_array(it.value(), "rules.varietals." + it.key());
            for (auto& s : names) s = textutil::to_lower_ascii(s);
            r.varietals.emplace_back(textutil::to_lower_ascii(it.key()), std::move(names));
        }
    }

    if (j.contains("or_alternative")) {
        r.or_alternative = parse_or_alternative(j.at("or_alternative"), "rules.or_alternative");
    }

    if (j.contains("junk")) {
        const json& jj = j.at("junk");
        require_object(jj, "rules.junk");
        // header rules are case-sensitive on purpose ("For " vs "for frying")
        override_list(jj, "header_prefixes", "rules.junk", r.header_prefixes, false);
        override_list(jj, "header_markers", "rules.junk", r.header_markers, false);
        override_list(jj, "fragment_prefixes", "rules.junk", r.fragment_prefixes, true);
        override_list(jj, "exact", "rules.junk", r.junk_exact, true);
        override_list(jj, "equipment", "rules.junk", r.equipment, true);
        override_list(jj, "note_prefixes", "rules.junk", r.note_prefixes, true);
        override_list(jj, "note_markers", "rules.junk", r.note_markers, true);
    }

    if (j.contains("matching")) {
        const json& m = j.at("matching");
        require_object(m, "rules.matching");

        if (m.contains("min_signal_length")) {
            r.matching.min_signal_length = require_size(m, "min_signal_length", "rules.matching");
        }
        if (m.contains("min_containment_length")) {
            r.matching.min_containment_length = require_size(m, "min_containment_length", "rules.matching");
        }
        override_list(m, "short_words", "rules.matching", r.matching.short_words, true);

        if (m.contains("fuzzy_ratio")) {
            const json& v = m.at("fuzzy_ratio");
            if (!v.is_number()) throw std::runtime_error("rules.matching.fuzzy_ratio must be a number");
            const double ratio = v.get<double>();
            if (ratio < 0.0 || ratio >= 1.0) {
                throw std::runtime_error("rules.matching.fuzzy_ratio must be in [0, 1)");
            }
            r.matching.fuzzy_ratio = ratio;
        }
    }

    return r;
}

// ---------- ingredient inputs ----------

static bool is_jsonl_path(const std::string& path) {
    return textutil::ends_with(textutil::to_lower_ascii(path), ".jsonl");
}

static IngredientInput parse_input_record(const json& j, const std::string& where) {
    require_object(j, where);

    IngredientInput in;
    in.id = require_id(j, where);

    // recipe rows carry ingredient_name, falling back to notes
    for (const char* key : {"name", "ingredient_name", "notes"}) {
        if (j.contains(key) && j.at(key).is_string() && !j.at(key).get<std::string>().empty()) {
            in.name = j.at(key).get<std::string>();
            break;
        }
    }
    return in;
}

std::vector<IngredientInput> load_ingredients(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open input file: " + path);
    }

    const bool jsonl = is_jsonl_path(path);

    std::vector<IngredientInput> out;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (textutil::trim(line).empty()) continue;

        std::ostringstream where;
        where << path << ":" << line_no;

        if (jsonl) {
            json j;
            try {
                j = json::parse(line);
            } catch (const std::exception& e) {
                throw std::runtime_error("failed to parse JSON: " + where.str() + ": " + e.what());
            }
            out.push_back(parse_input_record(j, where.str()));
        } else {
            out.push_back({"line:" + std::to_string(line_no), line});
        }
    }

    return out;
}

}  // namespace canon::io
