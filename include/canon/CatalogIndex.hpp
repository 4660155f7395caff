#pragma once
#include "canon/Models.hpp"
#include "canon/Normalizer.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace canon {

struct CatalogTerm {
    std::string text;      // normalized name or alias
    size_t item = 0;       // index into CatalogIndex::items()
    bool is_alias = false;
};

// Immutable lookup structure over one catalog snapshot. Safe to share across
// threads by const reference; catalog edits mean building a new index.
class CatalogIndex {
public:
    static CatalogIndex build(std::vector<CanonicalItem> items, const Normalizer& normalizer);

    const std::vector<CanonicalItem>& items() const { return m_items; }

    // every indexed term in catalog order: item name, then its aliases
    const std::vector<CatalogTerm>& terms() const { return m_terms; }

    // item owning an exact normalized name / alias (first in catalog order), or nullptr
    const CanonicalItem* find_name(const std::string& normalized) const;
    const CanonicalItem* find_alias(const std::string& normalized) const;

    size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }

private:
    std::vector<CanonicalItem> m_items;
    std::vector<CatalogTerm> m_terms;
    std::unordered_map<std::string, size_t> m_by_name;
    std::unordered_map<std::string, size_t> m_by_alias;
};

// Builds with default_rules().
CatalogIndex build_index(const std::vector<CanonicalItem>& items);

}  // namespace canon
