#include "commands/match.hpp"

#include "canon/Canonicalizer.hpp"
#include "io/JsonIO.hpp"
#include "io/ResultsArtifact.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static constexpr size_t kProgressEvery = 500;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        std::cerr << "warning: " << key << " expects an integer, got '" << s << "', using " << def << "\n";
        return def;
    }
}

static double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        std::cerr << "warning: " << key << " expects a number, got '" << s << "', using " << def << "\n";
        return def;
    }
}

static int match_usage() {
    std::cerr
        << "usage:\n"
        << "  pantry-canon match --catalog <catalog.json> --input <ingredients.txt|.jsonl> [options]\n";
    return 2;
}

static std::string pct(double r) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (r * 100.0) << "%";
    return oss.str();
}

int cmd_match(int argc, char** argv) {
    const std::string catalog_path = get_arg(argc, argv, "--catalog", "");
    const std::string input_path   = get_arg(argc, argv, "--input", "");
    const std::string rules_path   = get_arg(argc, argv, "--rules", "");
    const std::string out_path     = get_arg(argc, argv, "--out", "out/matches.jsonl");
    const std::string summary_path = get_arg(argc, argv, "--summary", "out/match_summary.json");

    const int threads        = std::max(1, get_arg_int(argc, argv, "--threads", 1));
    const int show_unmatched = std::max(0, get_arg_int(argc, argv, "--show_unmatched", 20));

    if (catalog_path.empty()) {
        std::cerr << "error: missing --catalog\n";
        return match_usage();
    }
    if (input_path.empty()) {
        std::cerr << "error: missing --input\n";
        return match_usage();
    }

    canon::AcceptancePolicy policy;
    policy.min_score = get_arg_double(argc, argv, "--min_score", policy.min_score);

    canon::io::ResultsArtifact art;
    art.catalog_path = catalog_path;
    art.input_path = input_path;
    art.rules_path = rules_path;
    art.policy = policy;

    canon::RuleSet rules = canon::default_rules();
    std::vector<canon::CanonicalItem> items;

    try {
        if (!rules_path.empty()) rules = canon::io::load_rules(rules_path);
        items = canon::io::load_catalog(catalog_path);
        art.inputs = canon::io::load_ingredients(input_path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    if (items.empty()) {
        std::cerr << "error: no canonical items in " << catalog_path << "\n";
        return 1;
    }

    const canon::Canonicalizer canonicalizer(rules);
    const canon::CatalogIndex index = canonicalizer.build_index(std::move(items));
    art.catalog_items = index.size();

    std::cout << "loaded " << index.size() << " canonical items (" << index.terms().size() << " terms)\n";
    std::cout << "loaded " << art.inputs.size() << " ingredients\n";

    std::vector<std::string> raws;
    raws.reserve(art.inputs.size());
    for (const auto& in : art.inputs) raws.push_back(in.name);

    // batches only pace the progress output; results do not depend on them
    art.resolutions.reserve(raws.size());
    for (size_t i = 0; i < raws.size(); i += kProgressEvery) {
        const size_t end = std::min(i + kProgressEvery, raws.size());
        const std::vector<std::string> slice(raws.begin() + (long)i, raws.begin() + (long)end);

        auto part = canonicalizer.resolve_batch(slice, index, (size_t)threads);
        for (auto& r : part) art.resolutions.push_back(std::move(r));

        std::cout << "  processed " << end << " / " << raws.size()
                  << " (" << pct((double)end / (double)raws.size()) << ")\n";
    }

    art.summary = canon::summarize(art.resolutions, policy);
    const canon::BatchSummary& s = art.summary;

    std::cout << "\nRESULTS\n";
    std::cout << "  exact:      " << s.exact << "\n";
    std::cout << "  alias:      " << s.alias << "\n";
    std::cout << "  fuzzy:      " << s.fuzzy << "\n";
    std::cout << "  junk:       " << s.junk << "\n";
    std::cout << "  no signal:  " << s.no_signal << "\n";
    std::cout << "  unmatched:  " << s.unmatched << "\n";
    std::cout << "  accepted:   " << s.accepted << " (min_score=" << policy.min_score << ")\n";
    std::cout << "  match rate: " << pct(s.match_rate()) << "\n";

    if (s.unmatched > 0 && show_unmatched > 0) {
        std::cout << "\nunmatched (defer to manual or LLM resolution), first " << show_unmatched << ":\n";
        int shown = 0;
        for (const auto& r : art.resolutions) {
            if (r.outcome != canon::Outcome::Unmatched) continue;
            std::cout << "  - \"" << r.raw << "\" -> \"" << r.normalized << "\"\n";
            if (++shown >= show_unmatched) break;
        }
    }

    try {
        art.write_jsonl(fs::path(out_path));
        art.write_summary(fs::path(summary_path));
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nOUT_MATCHES: " << out_path << "\n";
    std::cout << "OUT_SUMMARY: " << summary_path << "\n";
    return 0;
}
