#include "commands/recommend.hpp"
#include "api/ServiceApi.hpp"
#include "commands/CommandSupport.hpp"
#include "rec/Errors.hpp"
#include "rec/Recommender.hpp"

#include <iomanip>
#include <iostream>
#include <string>

static int recommend_usage() {
    std::cerr
        << "usage:\n"
        << "  assess-rec recommend --query \"<text>\" [options]\n"
        << "\n"
        << "output:\n"
        << "  --json                       print the /recommend response payload\n"
        << "  --explain                    print extracted requirements first\n"
        << "\n"
        << common_flags_help();
    return 1;
}

static void print_requirements(const rec::RecommendationResult& res) {
    const auto& r = res.requirements;
    std::cout << "requirements:"
              << " max_duration=" << (r.max_duration ? std::to_string(*r.max_duration) : std::string("none"))
              << " tech=" << r.needs_tech
              << " soft=" << r.needs_soft
              << " cognitive=" << r.needs_cognitive
              << " balanced=" << r.needs_balanced
              << " entry=" << r.is_entry_level;
    if (res.duration_relaxed) std::cout << " (duration relaxed)";
    std::cout << "\n\n";
}

int cmd_recommend(int argc, char** argv) {
    if (wants_help(argc, argv)) return recommend_usage();

    const std::string query = get_arg(argc, argv, "--query", "");
    if (!has_flag(argc, argv, "--query")) {
        std::cerr << "error: missing --query\n";
        return recommend_usage();
    }

    try {
        const rec::RankingConfig cfg = ranking_config(argc, argv);
        auto ctx = rec::build_context(context_options(argc, argv), make_embedder(argc, argv));

        const rec::RecommendationResult res = rec::recommend(*ctx, query, cfg);

        if (has_flag(argc, argv, "--explain")) print_requirements(res);

        if (has_flag(argc, argv, "--json")) {
            std::cout << api::recommendation_payload(res).dump(2) << "\n";
            return 0;
        }

        std::cout << "query: " << query << "\n";
        for (size_t i = 0; i < res.items.size(); ++i) {
            const auto& it = res.items[i];
            std::cout << std::setw(2) << (i + 1) << ". [" << it.record->test_type_raw << "] "
                      << std::setw(4) << it.record->duration_mins << "min  "
                      << std::fixed << std::setprecision(4) << it.score << "  "
                      << it.record->name << "\n"
                      << "    " << it.record->url << "\n";
        }
        return 0;
    } catch (const rec::ValidationError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const rec::ConfigurationError& e) {
        std::cerr << "error: configuration: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
