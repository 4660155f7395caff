#include "commands/audit.hpp"
#include "commands/match.hpp"
#include "commands/normalize.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  pantry-canon match [args]\n"
        << "  pantry-canon normalize [args]\n"
        << "  pantry-canon audit [args]\n"
        << "  pantry-canon help\n";
    return 1;
}

static int print_match_help() {
    std::cerr
        << "usage:\n"
        << "  pantry-canon match --catalog <path> --input <path> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --catalog <path>             (required) JSON array of canonical items\n"
        << "  --input <path>               (required) one ingredient per line, or .jsonl of {id, name}\n"
        << "  --out <path>                 default: out/matches.jsonl\n"
        << "  --summary <path>             default: out/match_summary.json\n"
        << "  --rules <path>               optional: rules JSON overlaid on the built-in rules\n"
        << "\n"
        << "matching:\n"
        << "  --threads <n>                default: 1\n"
        << "  --min_score <f>              default: 0.70 (acceptance cutoff, reporting only)\n"
        << "  --show_unmatched <n>         default: 20\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "match" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_match_help();

    if (cmd == "match")     return cmd_match(argc - 1, argv + 1);
    if (cmd == "normalize") return cmd_normalize(argc - 1, argv + 1);
    if (cmd == "audit")     return cmd_audit(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
