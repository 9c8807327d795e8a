#include "emb/MiniLmEmbedder.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace emb {

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

bool MiniLmEmbedder::init(const MiniLmConfig& cfg) {
    m_cfg = cfg;
    if (m_cfg.max_len < 2) m_cfg.max_len = 2;

    if (!m_tok.load_vocab(cfg.vocab_path)) {
        std::cerr << "MiniLmEmbedder: failed to load vocab: " << cfg.vocab_path << "\n";
        return false;
    }

    try {
        m_opts.SetIntraOpNumThreads(cfg.intra_op_threads);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

#ifdef _WIN32
        // ORTCHAR_T is wchar_t on Windows
        std::wstring wmodel(cfg.model_path.begin(), cfg.model_path.end());
        m_session = std::make_unique<Ort::Session>(m_env, wmodel.c_str(), m_opts);
#else
        m_session = std::make_unique<Ort::Session>(m_env, cfg.model_path.c_str(), m_opts);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        m_out_name = m_session->GetOutputNameAllocated(0, allocator).get();

        // some exports drop token_type_ids
        m_input_count = m_session->GetInputCount();
        if (m_input_count < 2 || m_input_count > 3) {
            std::cerr << "MiniLmEmbedder: unexpected input count " << m_input_count << "\n";
            m_session.reset();
            return false;
        }
        m_in_ids = m_session->GetInputNameAllocated(0, allocator).get();
        m_in_mask = m_session->GetInputNameAllocated(1, allocator).get();
        if (m_input_count == 3) m_in_type = m_session->GetInputNameAllocated(2, allocator).get();

        // [batch, seq, hidden]; hidden is static in every export we ship
        auto shape = m_session->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() == 3 && shape[2] > 0) {
            m_dim = (size_t)shape[2];
        } else {
            m_dim = embed("probe").size();
        }
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder ORT exception: " << e.what() << "\n";
        std::cerr << "model_path=" << cfg.model_path << "\n";
        m_session.reset();
        return false;
    }

    return m_dim > 0;
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    if (!m_session) throw std::runtime_error("MiniLmEmbedder: not initialized");

    std::vector<int64_t> ids = m_tok.encode(text, m_cfg.max_len);
    const size_t seq_len = ids.size();

    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);

    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<Ort::Value> in_vals;
    in_vals.reserve(3);
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), shape.data(), shape.size()));
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, mask.data(), mask.size(), shape.data(), shape.size()));
    if (m_input_count == 3) {
        in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()));
    }

    const char* in_names[3] = { m_in_ids.c_str(), m_in_mask.c_str(), m_in_type.c_str() };
    const char* out_names[1] = { m_out_name.c_str() };

    auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names, in_vals.data(), in_vals.size(), out_names, 1);

    Ort::Value& out = outs[0];
    auto shp = out.GetTensorTypeAndShapeInfo().GetShape(); // [1, seq_len, hidden]
    if (shp.size() != 3 || shp[1] != (int64_t)seq_len || shp[2] <= 0) {
        throw std::runtime_error("MiniLmEmbedder: unexpected output shape");
    }

    const size_t hidden = (size_t)shp[2];
    const float* data = out.GetTensorData<float>();

    std::vector<float> pooled(hidden, 0.0f);
    double denom = 0.0;

    // output is contiguous as [1, seq_len, hidden]
    for (size_t t = 0; t < seq_len; ++t) {
        if (mask[t] == 0) continue;
        denom += 1.0;
        const float* row = data + (t * hidden);
        for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
    }

    if (denom > 0.0) {
        float inv = (float)(1.0 / denom);
        for (float& x : pooled) x *= inv;
    }

    l2_normalize(pooled);
    return pooled;
}

} // namespace emb
