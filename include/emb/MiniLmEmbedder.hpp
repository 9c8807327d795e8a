#pragma once
#include "emb/Embedder.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace emb {

struct MiniLmConfig {
    std::string model_path = "models/emb/model.onnx";
    std::string vocab_path = "models/emb/vocab.txt";
    std::string model_name = "sentence-transformers/all-MiniLM-L6-v2";
    size_t max_len = 256;
    int intra_op_threads = 1;
};

// Sentence-transformers export run through ONNX Runtime: mean pooling over
// the attention mask, then L2 normalization.
class MiniLmEmbedder final : public Embedder {
public:
    bool init(const MiniLmConfig& cfg);

    std::vector<float> embed(const std::string& text) const override;
    size_t dim() const override { return m_dim; }
    std::string model_name() const override { return m_cfg.model_name; }

private:
    MiniLmConfig m_cfg;
    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "assess-rec"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    std::string m_out_name;
    size_t m_input_count = 3;
    size_t m_dim = 0;
};

} // namespace emb
