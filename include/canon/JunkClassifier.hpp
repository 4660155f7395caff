#pragma once
#include "canon/RuleSet.hpp"

#include <string>

namespace canon {

// Rejects text that is not an ingredient at all (section headers, equipment,
// formatting debris). Runs on the raw string, before normalization.
class JunkClassifier {
public:
    JunkClassifier();
    explicit JunkClassifier(RuleSet rules);

    bool is_junk(const std::string& raw) const;

private:
    RuleSet m_rules;

    bool is_header(const std::string& trimmed) const;
    bool is_fragment(const std::string& lower) const;
    bool is_equipment(const std::string& lower) const;
    bool is_note(const std::string& lower) const;
};

// Classifies with default_rules().
bool is_junk(const std::string& raw);

}  // namespace canon
