#include "commands/api.hpp"
#include "commands/batch.hpp"
#include "commands/index.hpp"
#include "commands/recommend.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  assess-rec index [args]       build or refresh the catalog embedding index\n"
        << "  assess-rec recommend [args]   recommend assessments for one query\n"
        << "  assess-rec batch [args]       recommend for every line of a file (JSON lines out)\n"
        << "  assess-rec api [args]         run one request through the service handlers\n"
        << "  assess-rec help\n"
        << "\n"
        << "run 'assess-rec <command> --help' for options\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") return print_usage();

    if (cmd == "index")     return cmd_index(argc - 1, argv + 1);
    if (cmd == "recommend") return cmd_recommend(argc - 1, argv + 1);
    if (cmd == "batch")     return cmd_batch(argc - 1, argv + 1);
    if (cmd == "api")       return cmd_api(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
