#include "canon/CatalogAudit.hpp"

#include "nlohmann/json.hpp"

#include <fstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace canon {

static void add_issue(AuditReport& rep, const std::string& code, const std::string& msg, const std::string& item_id = "") {
    rep.pass = false;
    AuditIssue e;
    e.code = code;
    e.message = msg;
    e.item_id = item_id;
    rep.issues.push_back(std::move(e));
}

AuditReport audit_catalog(const std::vector<CanonicalItem>& items, const Normalizer& normalizer) {
    AuditReport rep;
    rep.items = items.size();

    const size_t min_len = normalizer.rules().matching.min_signal_length;

    std::unordered_set<std::string> seen_ids;
    // normalized term -> id of the first item that owns it
    std::unordered_map<std::string, std::string> term_owner;

    auto claim_term = [&](const std::string& term, const std::string& raw, const CanonicalItem& item) {
        auto it = term_owner.find(term);
        if (it == term_owner.end()) {
            term_owner.emplace(term, item.id);
            return;
        }
        if (it->second != item.id) {
            add_issue(rep, "duplicate_term",
                      "'" + raw + "' normalizes to '" + term + "', already used by item " + it->second,
                      item.id);
        }
    };

    for (const auto& item : items) {
        if (item.id.empty()) {
            add_issue(rep, "empty_id", "item '" + item.name + "' has no id");
        } else if (!seen_ids.insert(item.id).second) {
            add_issue(rep, "duplicate_id", "id appears more than once", item.id);
        }

        const std::string name = normalizer.normalize(item.name);
        if (item.name.empty()) {
            add_issue(rep, "empty_name", "item has no name", item.id);
        } else if (name.size() < min_len) {
            add_issue(rep, "empty_term", "name '" + item.name + "' normalizes to '" + name + "' and can never match", item.id);
        } else {
            claim_term(name, item.name, item);
        }

        std::unordered_set<std::string> own_aliases;
        for (const auto& alias : item.aliases) {
            const std::string a = normalizer.normalize(alias);

            if (a.size() < min_len) {
                add_issue(rep, "empty_term", "alias '" + alias + "' normalizes to '" + a + "' and can never match", item.id);
                continue;
            }
            if (a == name) {
                add_issue(rep, "self_alias", "alias '" + alias + "' is the item's own name", item.id);
                continue;
            }
            if (!own_aliases.insert(a).second) {
                add_issue(rep, "duplicate_alias", "alias '" + alias + "' listed more than once", item.id);
                continue;
            }
            claim_term(a, alias, item);
        }
    }

    return rep;
}

void write_audit_report(const fs::path& path, const AuditReport& rep) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    nlohmann::json j;
    j["pass"] = rep.pass;
    j["items"] = rep.items;
    j["issues"] = nlohmann::json::array();

    for (const auto& e : rep.issues) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.item_id.empty()) ej["item_id"] = e.item_id;
        j["issues"].push_back(ej);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

}  // namespace canon
