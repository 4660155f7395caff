#include "commands/normalize.hpp"

#include "canon/Canonicalizer.hpp"
#include "io/JsonIO.hpp"

#include <iostream>
#include <string>
#include <vector>

static int normalize_usage() {
    std::cerr
        << "usage:\n"
        << "  pantry-canon normalize [--rules <rules.json>] \"<ingredient text>\" ...\n";
    return 2;
}

int cmd_normalize(int argc, char** argv) {
    std::string rules_path;
    std::vector<std::string> texts;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--help") return normalize_usage();

        if (a == "--rules") {
            if (i + 1 >= argc) {
                std::cerr << "error: --rules requires a value\n";
                return 2;
            }
            rules_path = argv[++i];
            continue;
        }

        texts.push_back(a);
    }

    if (texts.empty()) {
        std::cerr << "error: nothing to normalize\n";
        return normalize_usage();
    }

    canon::RuleSet rules = canon::default_rules();
    if (!rules_path.empty()) {
        try {
            rules = canon::io::load_rules(rules_path);
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
            return 1;
        }
    }

    const canon::Canonicalizer canonicalizer(rules);

    for (const auto& t : texts) {
        std::cout << "\"" << t << "\"\n";
        if (canonicalizer.junk().is_junk(t)) {
            std::cout << "  junk\n";
            continue;
        }
        std::cout << "  -> \"" << canonicalizer.normalizer().normalize(t) << "\"\n";
    }
    return 0;
}
