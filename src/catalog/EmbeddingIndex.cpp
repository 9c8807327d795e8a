#include "catalog/EmbeddingIndex.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace catalog {

void EmbeddingIndex::normalize_rows(std::vector<float>& vecs, size_t dim) {
    if (dim == 0) return;
    const size_t n = vecs.size() / dim;
    for (size_t i = 0; i < n; ++i) {
        float* v = &vecs[i * dim];
        double ss = 0.0;
        for (size_t j = 0; j < dim; ++j) ss += (double)v[j] * (double)v[j];
        if (ss <= 0.0) continue; // all-zero rows score 0 against everything
        const double inv = 1.0 / std::sqrt(ss);
        for (size_t j = 0; j < dim; ++j) v[j] = (float)(v[j] * inv);
    }
}

void EmbeddingIndex::set(std::vector<std::string> keys, std::vector<float> vectors, size_t dim) {
    if (dim == 0 && !keys.empty()) throw std::invalid_argument("EmbeddingIndex: dim must be > 0");
    if (vectors.size() != keys.size() * dim) {
        throw std::invalid_argument("EmbeddingIndex: expected " + std::to_string(keys.size() * dim) +
                                    " floats, got " + std::to_string(vectors.size()));
    }
    normalize_rows(vectors, dim);
    m_keys = std::move(keys);
    m_vecs = std::move(vectors);
    m_dim = dim;
}

float EmbeddingIndex::dot(const float* a, const float* b, size_t dim) {
    double s = 0.0;
    for (size_t i = 0; i < dim; ++i) s += (double)a[i] * (double)b[i];
    return (float)s;
}

std::vector<float> EmbeddingIndex::scores(const std::vector<float>& query_vec) const {
    if (query_vec.size() != m_dim) {
        throw std::invalid_argument("EmbeddingIndex: query dim " + std::to_string(query_vec.size()) +
                                    " != index dim " + std::to_string(m_dim));
    }

    // the embedder promises unit vectors; renormalize anyway so scores stay in [-1,1]
    std::vector<float> q = query_vec;
    normalize_rows(q, m_dim);

    std::vector<float> out(m_keys.size(), 0.0f);
    for (size_t i = 0; i < m_keys.size(); ++i) {
        out[i] = dot(q.data(), row(i), m_dim);
    }
    return out;
}

bool EmbeddingIndex::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;

    uint32_t dim = (uint32_t)m_dim;
    uint32_t n = (uint32_t)m_keys.size();
    out.write((char*)&dim, sizeof(dim));
    out.write((char*)&n, sizeof(n));

    for (const auto& key : m_keys) {
        uint32_t len = (uint32_t)key.size();
        out.write((char*)&len, sizeof(len));
        out.write(key.data(), len);
    }

    uint64_t vec_count = (uint64_t)m_vecs.size();
    out.write((char*)&vec_count, sizeof(vec_count));
    out.write((const char*)m_vecs.data(), (std::streamsize)(sizeof(float) * m_vecs.size()));
    return (bool)out;
}

bool EmbeddingIndex::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) return false;
    const std::streamoff file_size = in.tellg();
    in.seekg(0);
    if (file_size < 0) return false;

    // header counts are checked against what is left in the file before allocating
    auto remaining = [&]() -> uint64_t {
        const std::streamoff at = in.tellg();
        return at < 0 || at > file_size ? 0 : (uint64_t)(file_size - at);
    };

    uint32_t dim = 0, n = 0;
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&n, sizeof(n));
    if (!in || dim == 0) return false;
    if ((uint64_t)n * sizeof(uint32_t) > remaining()) return false;

    std::vector<std::string> keys;
    keys.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        uint32_t len = 0;
        in.read((char*)&len, sizeof(len));
        if (!in || len > remaining()) return false;
        std::string s(len, '\0');
        in.read(&s[0], len);
        if (!in) return false;
        keys.push_back(std::move(s));
    }

    uint64_t vec_count = 0;
    in.read((char*)&vec_count, sizeof(vec_count));
    if (!in || vec_count != (uint64_t)n * dim) return false;
    if (vec_count * sizeof(float) > remaining()) return false;

    std::vector<float> vecs((size_t)vec_count);
    in.read((char*)vecs.data(), (std::streamsize)(sizeof(float) * vecs.size()));
    if (!in) return false;

    normalize_rows(vecs, dim);
    m_dim = dim;
    m_keys = std::move(keys);
    m_vecs = std::move(vecs);
    return true;
}

}  // namespace catalog
