#include "commands/index.hpp"
#include "commands/CommandSupport.hpp"
#include "rec/Errors.hpp"
#include "rec/Recommender.hpp"

#include <iostream>
#include <string>

static int index_usage() {
    std::cerr
        << "usage:\n"
        << "  assess-rec index [options]\n"
        << "\n"
        << "Loads the catalog and builds the embedding index if it is missing\n"
        << "(or always, with --rebuild), then reports its size.\n"
        << "\n"
        << common_flags_help();
    return 1;
}

int cmd_index(int argc, char** argv) {
    if (wants_help(argc, argv)) return index_usage();

    try {
        auto embedder = make_embedder(argc, argv);
        const rec::ContextOptions opts = context_options(argc, argv);
        auto ctx = rec::build_context(opts, embedder);

        std::cout << "index: " << opts.index_path
                  << " (n=" << ctx->index().size() << ", dim=" << ctx->index().dim()
                  << ", model=" << ctx->embedder().model_name() << ")\n";
        return 0;
    } catch (const rec::ConfigurationError& e) {
        std::cerr << "error: configuration: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
