#include "canon/CatalogIndex.hpp"

#include <utility>

namespace canon {

CatalogIndex CatalogIndex::build(std::vector<CanonicalItem> items, const Normalizer& normalizer) {
    CatalogIndex idx;
    idx.m_items = std::move(items);

    for (size_t i = 0; i < idx.m_items.size(); ++i) {
        const CanonicalItem& item = idx.m_items[i];

        std::string name = normalizer.normalize(item.name);
        if (!name.empty()) {
            idx.m_by_name.emplace(name, i);  // keeps the first
            idx.m_terms.push_back({std::move(name), i, false});
        }

        for (const auto& alias : item.aliases) {
            std::string a = normalizer.normalize(alias);
            if (a.empty()) continue;
            idx.m_by_alias.emplace(a, i);
            idx.m_terms.push_back({std::move(a), i, true});
        }
    }

    return idx;
}

const CanonicalItem* CatalogIndex::find_name(const std::string& normalized) const {
    auto it = m_by_name.find(normalized);
    if (it == m_by_name.end()) return nullptr;
    return &m_items[it->second];
}

const CanonicalItem* CatalogIndex::find_alias(const std::string& normalized) const {
    auto it = m_by_alias.find(normalized);
    if (it == m_by_alias.end()) return nullptr;
    return &m_items[it->second];
}

CatalogIndex build_index(const std::vector<CanonicalItem>& items) {
    static const Normalizer normalizer;
    return CatalogIndex::build(items, normalizer);
}

}  // namespace canon
