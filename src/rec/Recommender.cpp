#include "rec/Recommender.hpp"
#include "rec/Balancer.hpp"
#include "rec/ConstraintFilter.hpp"
#include "rec/Errors.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace rec {

RecommenderContext::RecommenderContext(catalog::AssessmentCatalog catalog,
                                       catalog::EmbeddingIndex index,
                                       std::shared_ptr<const emb::Embedder> embedder)
    : m_catalog(std::move(catalog)), m_index(std::move(index)), m_embedder(std::move(embedder)) {
    if (!m_embedder) throw ConfigurationError("no embedder configured");
    if (m_catalog.empty()) throw ConfigurationError("catalog has no assessments");

    if (m_index.dim() != m_embedder->dim()) {
        throw ConfigurationError("embedding dimension mismatch: index has " + std::to_string(m_index.dim()) +
                                 ", embedder " + m_embedder->model_name() + " produces " +
                                 std::to_string(m_embedder->dim()));
    }
    if (m_index.keys() != m_catalog.urls()) {
        throw ConfigurationError("embedding index does not match the catalog (" +
                                 std::to_string(m_index.size()) + " rows for " +
                                 std::to_string(m_catalog.size()) + " assessments); rebuild it");
    }
}

catalog::EmbeddingIndex build_index(const catalog::AssessmentCatalog& catalog, const emb::Embedder& embedder) {
    const size_t dim = embedder.dim();
    std::vector<std::string> keys;
    std::vector<float> vecs;
    keys.reserve(catalog.size());
    vecs.reserve(catalog.size() * dim);

    size_t done = 0;
    for (const auto& a : catalog.assessments()) {
        std::vector<float> v;
        try {
            v = embedder.embed(catalog::search_text(a));
        } catch (const std::exception& e) {
            throw ConfigurationError("failed to embed '" + a.name + "': " + e.what());
        }
        if (v.size() != dim) {
            throw ConfigurationError("embedder returned " + std::to_string(v.size()) +
                                     " floats for '" + a.name + "', expected " + std::to_string(dim));
        }

        keys.push_back(a.url);
        vecs.insert(vecs.end(), v.begin(), v.end());

        if (++done % 50 == 0) std::cerr << "index: embedded " << done << "/" << catalog.size() << "\n";
    }

    catalog::EmbeddingIndex idx;
    idx.set(std::move(keys), std::move(vecs), dim);
    return idx;
}

std::shared_ptr<const RecommenderContext> build_context(const ContextOptions& opts,
                                                       std::shared_ptr<const emb::Embedder> embedder) {
    if (!embedder) throw ConfigurationError("no embedder configured");

    catalog::AssessmentCatalog cat;
    try {
        cat = catalog::AssessmentCatalog::load_from_csv(opts.catalog_path);
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }
    std::cerr << "catalog: loaded " << cat.size() << " assessments from " << opts.catalog_path << "\n";

    catalog::EmbeddingIndex idx;
    bool loaded = false;
    if (!opts.index_path.empty() && !opts.rebuild_index && fs::exists(opts.index_path)) {
        if (!idx.load(opts.index_path)) {
            throw ConfigurationError("failed to read embedding index: " + opts.index_path);
        }
        loaded = true;
        std::cerr << "index: loaded " << opts.index_path << " (n=" << idx.size() << ", dim=" << idx.dim() << ")\n";
    }

    if (!loaded) {
        std::cerr << "index: building with " << embedder->model_name() << "\n";
        idx = build_index(cat, *embedder);

        if (!opts.index_path.empty()) {
            std::error_code ec;
            const fs::path p(opts.index_path);
            if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
            if (ec || !idx.save(opts.index_path)) {
                std::cerr << "index: warning: failed to save " << opts.index_path << "\n";
            } else {
                std::cerr << "index: saved " << opts.index_path << " (n=" << idx.size() << ", dim=" << idx.dim() << ")\n";
            }
        }
    }

    return std::make_shared<const RecommenderContext>(std::move(cat), std::move(idx), std::move(embedder));
}

bool is_blank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

RecommendationResult recommend(const RecommenderContext& ctx,
                               const std::string& query,
                               const RankingConfig& cfg) {
    if (is_blank(query)) throw ValidationError("Query cannot be empty");

    RecommendationResult res;
    res.requirements = analyze_query(query);

    std::vector<float> qvec;
    try {
        qvec = ctx.embedder().embed(query);
    } catch (const std::exception& e) {
        throw ComputationError(std::string("query embedding failed: ") + e.what());
    }
    if (qvec.size() != ctx.index().dim()) {
        throw ComputationError("query embedding has " + std::to_string(qvec.size()) +
                               " dims, index has " + std::to_string(ctx.index().dim()));
    }

    const std::vector<float> scores = ctx.index().scores(qvec);

    FilterOutcome filtered = apply_constraints(ctx.catalog(), scores, res.requirements, cfg);
    res.duration_relaxed = filtered.duration_relaxed;

    const auto ranked = balance_and_rank(filtered.candidates, res.requirements, cfg);
    res.items.reserve(ranked.size());
    for (const auto& c : ranked) {
        res.items.push_back(RecommendedItem{c.record, c.score(), c.similarity});
    }
    return res;
}

}  // namespace rec
