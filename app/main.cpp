#include "commands/config.hpp"
#include "commands/explain.hpp"
#include "commands/rank.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  talentmatch rank [args]\n"
        << "  talentmatch explain [args]\n"
        << "  talentmatch config [args]\n"
        << "  talentmatch help\n";
    return 1;
}

static void print_common_help() {
    std::cerr
        << "\n"
        << "configuration:\n"
        << "  --config <path>              JSON {weights, cache, ranking}; env overrides apply on top\n"
        << "  --parallelism <n>            default: 1\n"
        << "  --time_budget_ms <n>         default: 0 (unbounded)\n"
        << "  --max_pool <n>               default: 1000\n"
        << "  --out <path>                 write JSON here instead of stdout\n";
}

static int print_rank_help() {
    std::cerr
        << "usage:\n"
        << "  talentmatch rank --entities <file> --tenant <id> --anchor <id> [options]\n"
        << "\n"
        << "options:\n"
        << "  --topk <n>                   default: 5 (0 = all)\n"
        << "  --no_city_filter             keep members whose known city differs\n"
        << "  --max_km <f>                 skip members farther than this\n"
        << "  --keep_zero                  keep members scoring 0\n"
        << "  --explain                    attach a full explanation to each result\n";
    print_common_help();
    return 0;
}

static int print_explain_help() {
    std::cerr
        << "usage:\n"
        << "  talentmatch explain --entities <file> --tenant <id> --anchor <id> --counterpart <id> [options]\n";
    print_common_help();
    return 0;
}

static int print_config_help() {
    std::cerr
        << "usage:\n"
        << "  talentmatch config [--config <path>] [--update <weights.json>]\n"
        << "\n"
        << "prints the effective configuration; exit code 2 when --update is rejected\n";
    print_common_help();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    const bool wants_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "rank"    && wants_help) return print_rank_help();
    if (cmd == "explain" && wants_help) return print_explain_help();
    if (cmd == "config"  && wants_help) return print_config_help();

    if (cmd == "rank")    return cmd_rank(argc - 1, argv + 1);
    if (cmd == "explain") return cmd_explain(argc - 1, argv + 1);
    if (cmd == "config")  return cmd_config(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
