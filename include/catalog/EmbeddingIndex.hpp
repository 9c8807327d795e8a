#pragma once
#include <string>
#include <vector>

namespace catalog {

// Dense N x dim matrix of unit-length rows, one per catalog url.
// Read-only once built; safe to share across threads.
class EmbeddingIndex {
public:
    // keys[i] corresponds to row i, vectors are packed row-major (size = keys.size()*dim).
    // Rows are L2-normalized here so that scoring is a plain dot product.
    void set(std::vector<std::string> keys, std::vector<float> vectors, size_t dim);

    // cosine similarity of query_vec against every row, in row order.
    // throws std::invalid_argument if query_vec.size() != dim()
    std::vector<float> scores(const std::vector<float>& query_vec) const;

    // cache I/O (binary)
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    size_t dim() const { return m_dim; }
    size_t size() const { return m_keys.size(); }
    const std::vector<std::string>& keys() const { return m_keys; }
    const float* row(size_t i) const { return &m_vecs[i * m_dim]; }

private:
    size_t m_dim = 0;
    std::vector<std::string> m_keys;
    std::vector<float> m_vecs; // packed: size = size()*dim()

    static void normalize_rows(std::vector<float>& vecs, size_t dim);
    static float dot(const float* a, const float* b, size_t dim);
};

}  // namespace catalog
