#pragma once
#include <string>
#include <utility>
#include <vector>

namespace canon {

// How "x or y" phrases are resolved during normalization.
enum class OrAlternative {
    KeepFirst,  // "grapeseed or vegetable oil" -> "grapeseed oil"
    KeepLast    // "grapeseed or vegetable oil" -> "vegetable oil"
};

struct MatchConfig {
    // normalized input shorter than this carries no usable signal
    size_t min_signal_length = 3;

    // containment only considers terms at least this long...
    size_t min_containment_length = 4;
    // ...unless the term is one of these
    std::vector<std::string> short_words = {
        "egg", "oil", "ham", "jam", "tea", "ice", "yam", "pea", "cod", "pie"
    };

    // edit distance accepted if distance <= ceil(fuzzy_ratio * max(len_a, len_b))
    double fuzzy_ratio = 0.3;
};

struct RuleSet {
    // --- normalization, in the order they are applied ---

    // dietary/quality modifiers and store brands; never change identity
    std::vector<std::string> modifiers;

    // base noun -> varietal names collapsed into it ("granny smith apple" -> "apple")
    std::vector<std::pair<std::string, std::vector<std::string>>> varietals;

    // adverbs removed only when another word follows ("finely chopped")
    std::vector<std::string> prep_adverbs;

    // preparation verbs, state words and recipe notes removed as whole words
    std::vector<std::string> prep_words;

    // quantity/container nouns removed (with a following "of") only when another word follows
    std::vector<std::string> container_nouns;

    OrAlternative or_alternative = OrAlternative::KeepFirst;

    // measurement unit words; also stripped when glued to a number ("14oz")
    std::vector<std::string> units;

    // --- junk classification (matched against the raw string) ---

    std::vector<std::string> header_prefixes;   // case-sensitive, on trimmed raw
    std::vector<std::string> header_markers;    // case-sensitive substrings
    std::vector<std::string> fragment_prefixes; // lowercase prefixes, e.g. "s)"
    std::vector<std::string> junk_exact;        // whole lowercase string, e.g. "fresh"
    std::vector<std::string> equipment;         // lowercase substrings
    std::vector<std::string> note_prefixes;     // lowercase prefixes
    std::vector<std::string> note_markers;      // lowercase substrings

    // --- matching ---
    MatchConfig matching;
};

// The consolidated rule set used when no rules file is given.
RuleSet default_rules();

const char* or_alternative_str(OrAlternative o);

}  // namespace canon
