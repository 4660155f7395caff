#include "canon/Normalizer.hpp"
#include "canon/TextUtil.hpp"

#include <cctype>
#include <unordered_set>
#include <utility>

namespace canon {

using namespace textutil;

Normalizer::Normalizer() : m_rules(default_rules()) {}

Normalizer::Normalizer(RuleSet rules) : m_rules(std::move(rules)) {}

std::string Normalizer::normalize(const std::string& raw) const {
    // Every pass only deletes text, lowercases, or turns punctuation into
    // spaces, so a changing pass always shrinks the string or its
    // punctuation/uppercase count. The cap is never reached in practice.
    const size_t max_passes = 4 * raw.size() + 4;

    std::string cur = raw;
    for (size_t pass = 0; pass < max_passes; ++pass) {
        std::string next = apply_pass(cur);
        if (next == cur) break;
        cur = std::move(next);
    }
    return cur;
}

std::string Normalizer::apply_pass(const std::string& s) const {
    // 1. lowercase + trim
    std::string t = collapse_spaces(to_lower_ascii(s));

    // 2. "s " left behind by the old ingredient parser
    t = strip_parse_artifact(t);

    // 3. dietary/quality modifiers, brands
    t = remove_phrases(std::move(t), m_rules.modifiers);

    // 4. "granny smith apple" -> "apple"
    t = collapse_varietals(std::move(t));

    // 5. preparation + state
    t = strip_leading_words(t, m_rules.prep_adverbs, false);
    t = remove_phrases(std::move(t), m_rules.prep_words);

    // 6. "2 cloves of garlic" -> "2 garlic"
    t = strip_leading_words(t, m_rules.container_nouns, true);

    // 7. parentheticals, then "x or y"
    t = strip_parentheticals(t);
    t = resolve_alternatives(t);

    // 8. units, then numbers
    t = remove_phrases(std::move(t), m_rules.units);
    t = strip_quantities(t);

    // 9. punctuation + whitespace
    return clean_punctuation(t);
}

std::string Normalizer::strip_parse_artifact(const std::string& s) const {
    size_t i = 0;
    while (s.compare(i, 2, "s ") == 0) i += 2;
    return s.substr(i);
}

std::string Normalizer::collapse_varietals(std::string s) const {
    for (const auto& entry : m_rules.varietals) {
        const std::string& base = entry.first;

        for (const auto& name : entry.second) {
            size_t pos = find_phrase(s, name);
            while (pos != std::string::npos) {
                size_t j = pos + name.size();
                while (j < s.size() && s[j] == ' ') ++j;

                bool followed_by_base = j > pos + name.size() && s.compare(j, base.size(), base) == 0;
                if (followed_by_base) {
                    // allow the plural ("gala apples", "russet potatoes")
                    size_t k = j + base.size();
                    if (s.compare(k, 2, "es") == 0) k += 2;
                    else if (k < s.size() && s[k] == 's') ++k;
                    followed_by_base = (k == s.size()) || !is_word_char(s[k]);
                }

                if (followed_by_base) {
                    s.erase(pos, j - pos);
                    pos = find_phrase(s, name, pos);
                } else {
                    pos = find_phrase(s, name, pos + 1);
                }
            }
        }
    }
    return s;
}

std::string Normalizer::strip_leading_words(const std::string& s,
                                            const std::vector<std::string>& words,
                                            bool eat_of) const {
    const std::unordered_set<std::string> set(words.begin(), words.end());
    const std::vector<std::string> in = split_words(s);

    std::vector<std::string> out;
    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); ++i) {
        // only strip when another word follows
        if (i + 1 < in.size() && set.count(in[i])) {
            if (eat_of && in[i + 1] == "of" && i + 2 < in.size()) ++i;
            continue;
        }
        out.push_back(in[i]);
    }
    return join_words(out);
}

std::string Normalizer::strip_parentheticals(const std::string& s) const {
    std::string out;
    out.reserve(s.size());
    int depth = 0;

    for (char c : s) {
        if (c == '(') {
            if (depth == 0) out.push_back(' ');
            ++depth;
            continue;
        }
        if (c == ')' && depth > 0) {
            --depth;
            continue;
        }
        // an unclosed "(" swallows the rest of the string
        if (depth == 0) out.push_back(c);
    }
    return out;
}

std::string Normalizer::resolve_alternatives(const std::string& s) const {
    std::vector<std::string> words = split_words(s);

    size_t i = 0;
    while (i < words.size()) {
        if (words[i] != "or") {
            ++i;
            continue;
        }

        const bool has_prev = i > 0;
        const bool has_next = i + 1 < words.size();

        if (has_prev && has_next) {
            if (m_rules.or_alternative == OrAlternative::KeepFirst) {
                words.erase(words.begin() + (long)i, words.begin() + (long)i + 2);
            } else {
                words.erase(words.begin() + (long)i - 1, words.begin() + (long)i + 1);
                --i;
            }
        } else {
            // dangling "or" at either end
            words.erase(words.begin() + (long)i);
        }
    }
    return join_words(words);
}

bool Normalizer::is_quantity_token(const std::string& tok) const {
    size_t i = 0;
    bool has_digit = false;

    while (i < tok.size()) {
        const unsigned char c = (unsigned char)tok[i];

        if (c >= '0' && c <= '9') {
            has_digit = true;
            ++i;
            continue;
        }
        if (c == '.' || c == '/' || c == '%' || c == '-') {
            ++i;
            continue;
        }
        // U+00BC..U+00BE (1/4, 1/2, 3/4)
        if (c == 0xC2 && i + 1 < tok.size()) {
            const unsigned char c1 = (unsigned char)tok[i + 1];
            if (c1 >= 0xBC && c1 <= 0xBE) {
                has_digit = true;
                i += 2;
                continue;
            }
        }
        // U+2150..U+215E (1/7 .. 7/8)
        if (c == 0xE2 && i + 2 < tok.size() && (unsigned char)tok[i + 1] == 0x85) {
            const unsigned char c2 = (unsigned char)tok[i + 2];
            if (c2 >= 0x90 && c2 <= 0x9E) {
                has_digit = true;
                i += 3;
                continue;
            }
        }
        break;
    }

    if (!has_digit) return false;
    if (i == tok.size()) return true;

    // "14oz", "2lb"
    const std::string rest = tok.substr(i);
    for (const auto& u : m_rules.units) {
        if (rest == u) return true;
    }
    return false;
}

std::string Normalizer::strip_quantities(const std::string& s) const {
    std::vector<std::string> out;
    for (auto& w : split_words(s)) {
        if (!is_quantity_token(w)) out.push_back(std::move(w));
    }
    return join_words(out);
}

std::string Normalizer::clean_punctuation(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        const unsigned char c = (unsigned char)s[i];

        bool keep = c >= 0x80 || is_word_char((char)c) || c == ' ' || c == '&';
        if (c == '\'') {
            // keep only inside a word ("member's")
            keep = i > 0 && i + 1 < s.size() && is_word_char(s[i - 1]) && is_word_char(s[i + 1]);
        }

        out.push_back(keep ? (char)c : ' ');
    }
    return collapse_spaces(out);
}

std::string normalize(const std::string& raw) {
    static const Normalizer normalizer;
    return normalizer.normalize(raw);
}

}  // namespace canon
