#include "commands/api.hpp"
#include "api/ServiceApi.hpp"
#include "commands/CommandSupport.hpp"
#include "rec/Errors.hpp"

#include <iostream>
#include <string>

static int api_usage() {
    std::cerr
        << "usage:\n"
        << "  assess-rec api --path <path> [--method GET|POST] [--body <json>] [options]\n"
        << "\n"
        << "Dispatches one request through the service handlers and prints\n"
        << "the status line and JSON body. Paths: /recommend (POST), /health, /\n"
        << "\n"
        << common_flags_help();
    return 1;
}

int cmd_api(int argc, char** argv) {
    if (wants_help(argc, argv)) return api_usage();

    const std::string path = get_arg(argc, argv, "--path", "");
    if (path.empty()) {
        std::cerr << "error: missing --path\n";
        return api_usage();
    }
    const std::string method = get_arg(argc, argv, "--method", path == "/recommend" ? "POST" : "GET");
    const std::string body = get_arg(argc, argv, "--body", "");

    try {
        const rec::RankingConfig cfg = ranking_config(argc, argv);
        auto ctx = rec::build_context(context_options(argc, argv), make_embedder(argc, argv));

        const api::ApiResponse r = api::handle(*ctx, method, path, body, api::ServiceInfo{}, cfg);
        std::cout << "status: " << r.status << "\n" << r.body.dump(2) << "\n";
        return r.status < 400 ? 0 : 1;
    } catch (const rec::ConfigurationError& e) {
        std::cerr << "error: configuration: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
