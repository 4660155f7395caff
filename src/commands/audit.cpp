#include "commands/audit.hpp"

#include "canon/CatalogAudit.hpp"
#include "canon/Normalizer.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int audit_usage() {
    std::cerr
        << "usage:\n"
        << "  pantry-canon audit --catalog <catalog.json> [--rules <rules.json>] [--out <report.json>]\n";
    return 2;
}

int cmd_audit(int argc, char** argv) {
    const std::string catalog_path = get_arg(argc, argv, "--catalog", "");
    const std::string rules_path   = get_arg(argc, argv, "--rules", "");
    const std::string out_path     = get_arg(argc, argv, "--out", "");

    if (catalog_path.empty()) {
        std::cerr << "error: missing --catalog\n";
        return audit_usage();
    }

    canon::AuditReport rep;
    try {
        canon::RuleSet rules = canon::default_rules();
        if (!rules_path.empty()) rules = canon::io::load_rules(rules_path);

        const canon::Normalizer normalizer(rules);
        rep = canon::audit_catalog(canon::io::load_catalog(catalog_path), normalizer);

        if (!out_path.empty()) canon::write_audit_report(fs::path(out_path), rep);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    if (!rep.pass) {
        std::cerr << "audit found " << rep.issues.size() << " issue(s) in " << rep.items << " items\n";
        for (const auto& e : rep.issues) {
            std::cerr << "- " << e.code << ": " << e.message;
            if (!e.item_id.empty()) std::cerr << " (item_id=" << e.item_id << ")";
            std::cerr << "\n";
        }
        if (!out_path.empty()) std::cerr << "wrote " << out_path << "\n";
        return 1;
    }

    std::cout << "AUDIT: pass (" << rep.items << " items)\n";
    if (!out_path.empty()) std::cout << "OUT_AUDIT: " << out_path << "\n";
    return 0;
}
