#pragma once
#include "catalog/AssessmentCatalog.hpp"
#include "catalog/EmbeddingIndex.hpp"
#include "emb/Embedder.hpp"
#include "rec/QueryAnalyzer.hpp"
#include "rec/RankingConfig.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rec {

// Catalog + its embedding matrix + the embedder that produced it.
// Built once, never mutated; every request reads it through a const reference.
class RecommenderContext {
public:
    // throws ConfigurationError if the three pieces do not line up
    RecommenderContext(catalog::AssessmentCatalog catalog,
                       catalog::EmbeddingIndex index,
                       std::shared_ptr<const emb::Embedder> embedder);

    const catalog::AssessmentCatalog& catalog() const { return m_catalog; }
    const catalog::EmbeddingIndex& index() const { return m_index; }
    const emb::Embedder& embedder() const { return *m_embedder; }

private:
    catalog::AssessmentCatalog m_catalog;
    catalog::EmbeddingIndex m_index;
    std::shared_ptr<const emb::Embedder> m_embedder;
};

struct ContextOptions {
    std::string catalog_path = "data/assessments_enriched_db.csv";
    std::string index_path = "models/assessment_embeddings.bin";  // empty: never cache
    bool rebuild_index = false;                                    // ignore an existing artifact
};

// Embeds catalog::search_text() of every record in catalog order.
// throws ConfigurationError if the embedder fails or returns the wrong size
catalog::EmbeddingIndex build_index(const catalog::AssessmentCatalog& catalog, const emb::Embedder& embedder);

// Loads the catalog, then loads the cached index or builds and saves it.
// throws ConfigurationError
std::shared_ptr<const RecommenderContext> build_context(const ContextOptions& opts,
                                                       std::shared_ptr<const emb::Embedder> embedder);

struct RecommendedItem {
    const catalog::Assessment* record = nullptr;  // owned by the context
    float score = 0.0f;                           // similarity + boost
    float similarity = 0.0f;
};

struct RecommendationResult {
    QueryRequirements requirements;
    bool duration_relaxed = false;
    std::vector<RecommendedItem> items;  // best first, unique urls
};

// throws ValidationError for a blank query, ComputationError if embedding fails
RecommendationResult recommend(const RecommenderContext& ctx,
                               const std::string& query,
                               const RankingConfig& cfg = RankingConfig{});

bool is_blank(const std::string& s);

}  // namespace rec
