#pragma once
#include "emb/Embedder.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace emb {

// Model-free embedder: folded tokens and adjacent-token bigrams are hashed
// into a fixed number of signed buckets. Deterministic for any input.
class HashingEmbedder final : public Embedder {
public:
    explicit HashingEmbedder(size_t dim = 384);

    std::vector<float> embed(const std::string& text) const override;
    size_t dim() const override { return m_dim; }
    std::string model_name() const override;

private:
    size_t m_dim;

    static uint64_t fnv1a(const std::string& s);
    void add_feature(std::vector<float>& v, const std::string& feature, float weight) const;
};

} // namespace emb
