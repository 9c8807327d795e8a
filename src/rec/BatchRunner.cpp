#include "rec/BatchRunner.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace rec {

std::vector<BatchOutcome> run_batch(const RecommenderContext& ctx,
                                    const std::vector<std::string>& queries,
                                    size_t workers,
                                    const RankingConfig& cfg) {
    std::vector<BatchOutcome> outcomes(queries.size());
    if (queries.empty()) return outcomes;

    workers = std::max<size_t>(1, std::min(workers, queries.size()));
    std::atomic<size_t> next{0};

    // each worker owns the slots it claims, so no further synchronization is needed
    auto work = [&]() {
        for (;;) {
            const size_t i = next.fetch_add(1);
            if (i >= queries.size()) return;

            BatchOutcome& out = outcomes[i];
            out.query = queries[i];
            try {
                out.result = recommend(ctx, queries[i], cfg);
                out.ok = true;
            } catch (const std::exception& e) {
                out.ok = false;
                out.error = e.what();
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) pool.emplace_back(work);
    for (auto& t : pool) t.join();

    return outcomes;
}

}  // namespace rec
