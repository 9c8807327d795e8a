#pragma once
#include <string>
#include <vector>

namespace emb {

// Text -> fixed-dimension unit vector. Implementations must be safe to call
// concurrently through a const reference.
class Embedder {
public:
    virtual ~Embedder() = default;

    // L2-normalized vector of size dim(); throws on failure
    virtual std::vector<float> embed(const std::string& text) const = 0;

    virtual size_t dim() const = 0;
    virtual std::string model_name() const = 0;
};

} // namespace emb
