#include "emb/HashingEmbedder.hpp"
#include "emb/TextUtil.hpp"
#include <cmath>
#include <stdexcept>

namespace emb {

HashingEmbedder::HashingEmbedder(size_t dim) : m_dim(dim) {
    if (m_dim == 0) throw std::invalid_argument("HashingEmbedder: dim must be > 0");
}

std::string HashingEmbedder::model_name() const {
    return "hashing-bow-" + std::to_string(m_dim);
}

uint64_t HashingEmbedder::fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

void HashingEmbedder::add_feature(std::vector<float>& v, const std::string& feature, float weight) const {
    const uint64_t h = fnv1a(feature);
    const size_t bucket = (size_t)(h % m_dim);
    // top bit picks the sign so unrelated collisions tend to cancel out
    const float sign = (h >> 63) ? -1.0f : 1.0f;
    v[bucket] += sign * weight;
}

std::vector<float> HashingEmbedder::embed(const std::string& text) const {
    std::vector<float> v(m_dim, 0.0f);

    const auto tokens = textutil::normalize_tokens(textutil::tokenize(textutil::normalize(text)));
    for (size_t i = 0; i < tokens.size(); ++i) {
        add_feature(v, tokens[i], 1.0f);
        if (i + 1 < tokens.size()) add_feature(v, tokens[i] + " " + tokens[i + 1], 0.5f);
    }

    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss > 0.0) {
        const double inv = 1.0 / std::sqrt(ss);
        for (float& x : v) x = (float)(x * inv);
    }
    return v;
}

} // namespace emb
