#include "canon/JunkClassifier.hpp"
#include "canon/TextUtil.hpp"

#include <cctype>
#include <utility>

namespace canon {

using namespace textutil;

JunkClassifier::JunkClassifier() : m_rules(default_rules()) {}

JunkClassifier::JunkClassifier(RuleSet rules) : m_rules(std::move(rules)) {}

bool JunkClassifier::is_header(const std::string& trimmed) const {
    // "For the Dressing:", "Topping:"
    for (const auto& p : m_rules.header_prefixes) {
        if (starts_with(trimmed, p)) return true;
    }
    if (ends_with(trimmed, ":")) return true;
    return contains_any(trimmed, m_rules.header_markers);
}

bool JunkClassifier::is_fragment(const std::string& lower) const {
    bool has_alnum = false;
    for (unsigned char c : lower) {
        if (c < 0x80 && std::isalnum(c)) {
            has_alnum = true;
            break;
        }
    }
    if (!has_alnum) return true;

    for (const auto& p : m_rules.fragment_prefixes) {
        if (starts_with(lower, p)) return true;
    }
    for (const auto& w : m_rules.junk_exact) {
        if (lower == w) return true;
    }
    return false;
}

bool JunkClassifier::is_equipment(const std::string& lower) const {
    return contains_any(lower, m_rules.equipment);
}

bool JunkClassifier::is_note(const std::string& lower) const {
    for (const auto& p : m_rules.note_prefixes) {
        if (starts_with(lower, p)) return true;
    }
    return contains_any(lower, m_rules.note_markers);
}

bool JunkClassifier::is_junk(const std::string& raw) const {
    const std::string trimmed = trim(raw);
    if (trimmed.size() <= 2) return true;

    if (is_header(trimmed)) return true;

    const std::string lower = to_lower_ascii(trimmed);
    return is_fragment(lower) || is_equipment(lower) || is_note(lower);
}

bool is_junk(const std::string& raw) {
    static const JunkClassifier classifier;
    return classifier.is_junk(raw);
}

}  // namespace canon
