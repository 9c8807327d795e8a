#include "commands/batch.hpp"
#include "commands/CommandSupport.hpp"
#include "rec/BatchRunner.hpp"
#include "rec/Errors.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static int batch_usage() {
    std::cerr
        << "usage:\n"
        << "  assess-rec batch --queries <file> [options]\n"
        << "\n"
        << "  --queries <file>             one query per non-empty line (required)\n"
        << "  --out <path>                 default: out/recommendations.jsonl\n"
        << "  --workers <n>                default: hardware concurrency\n"
        << "\n"
        << common_flags_help();
    return 1;
}

static std::vector<std::string> read_queries(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open queries file: " + path);

    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (rec::is_blank(line)) continue;
        out.push_back(line);
    }
    return out;
}

static nlohmann::json outcome_to_json(const rec::BatchOutcome& o) {
    nlohmann::json j;
    j["query"] = o.query;
    j["ok"] = o.ok;
    j["error"] = o.error;

    nlohmann::json recs = nlohmann::json::array();
    for (const auto& it : o.result.items) {
        recs.push_back({
            {"url", it.record->url},
            {"name", it.record->name},
            {"test_type", it.record->test_type_raw},
            {"duration_mins", it.record->duration_mins},
            {"score", it.score},
        });
    }
    j["recommendations"] = std::move(recs);
    return j;
}

int cmd_batch(int argc, char** argv) {
    if (wants_help(argc, argv)) return batch_usage();

    const std::string queries_path = get_arg(argc, argv, "--queries", "");
    const std::string out_path = get_arg(argc, argv, "--out", "out/recommendations.jsonl");
    if (queries_path.empty()) {
        std::cerr << "error: missing --queries\n";
        return batch_usage();
    }

    try {
        const size_t hw = std::max(1u, std::thread::hardware_concurrency());
        const size_t workers = get_size_arg(argc, argv, "--workers", hw);
        const rec::RankingConfig cfg = ranking_config(argc, argv);

        const auto queries = read_queries(queries_path);
        auto ctx = rec::build_context(context_options(argc, argv), make_embedder(argc, argv));

        const auto outcomes = rec::run_batch(*ctx, queries, workers, cfg);

        const fs::path outp(out_path);
        if (outp.has_parent_path()) fs::create_directories(outp.parent_path());
        std::ofstream out(outp, std::ios::out | std::ios::trunc);
        if (!out) throw std::runtime_error("failed to open output: " + out_path);

        size_t failed = 0;
        for (const auto& o : outcomes) {
            if (!o.ok) {
                ++failed;
                std::cerr << "warning: query failed: " << o.query << ": " << o.error << "\n";
            }
            out << outcome_to_json(o).dump() << "\n";
        }

        std::cout << "saved: " << out_path << " (queries=" << outcomes.size()
                  << ", failed=" << failed << ")\n";
        return failed == 0 ? 0 : 2;
    } catch (const rec::ConfigurationError& e) {
        std::cerr << "error: configuration: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
