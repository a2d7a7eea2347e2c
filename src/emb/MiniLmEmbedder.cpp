#include "emb/MiniLmEmbedder.hpp"
#include <cmath>
#include <iostream>

namespace emb {

bool MiniLmEmbedder::init(const std::string& model_path, const std::string& vocab_path) {
    if (!m_tok.load_vocab(vocab_path)) {
        std::cerr << "[error] MiniLmEmbedder: failed to load vocab: " << vocab_path << "\n";
        return false;
    }

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);

        Ort::AllocatorWithDefaultOptions allocator;
        m_out_name = m_session->GetOutputNameAllocated(0, allocator).get();

        // some exports drop token_type_ids
        m_input_count = m_session->GetInputCount();
        if (m_input_count < 2 || m_input_count > 3) {
            std::cerr << "[error] MiniLmEmbedder: unexpected input count " << m_input_count << "\n";
            m_session.reset();
            return false;
        }
        m_in_ids = m_session->GetInputNameAllocated(0, allocator).get();
        m_in_mask = m_session->GetInputNameAllocated(1, allocator).get();
        if (m_input_count == 3) m_in_type = m_session->GetInputNameAllocated(2, allocator).get();

        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "[error] MiniLmEmbedder ORT exception: " << e.what() << "\n";
        std::cerr << "model_path=" << model_path << "\n";
        m_session.reset();
        return false;
    }
}

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += static_cast<double>(x) * static_cast<double>(x);
    if (ss <= 0.0) return;
    const double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = static_cast<float>(x * inv);
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text, size_t max_len) const {
    if (!m_session) return {};

    std::vector<int64_t> ids = m_tok.encode(text, max_len);
    const size_t seq_len = ids.size();

    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);
    std::vector<int64_t> shape{1, static_cast<int64_t>(seq_len)};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<const char*> in_names{m_in_ids.c_str(), m_in_mask.c_str()};
    std::vector<Ort::Value> in_vals;
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), shape.data(), shape.size()));
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, mask.data(), mask.size(), shape.data(), shape.size()));
    if (m_input_count == 3) {
        in_names.push_back(m_in_type.c_str());
        in_vals.push_back(
            Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()));
    }

    const char* out_names[1] = {m_out_name.c_str()};

    auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names.data(), in_vals.data(), in_vals.size(), out_names, 1);

    Ort::Value& out = outs[0];
    auto shp = out.GetTensorTypeAndShapeInfo().GetShape();  // [1, seq_len, hidden]
    if (shp.size() != 3) return {};

    const size_t hidden = static_cast<size_t>(shp[2]);
    const float* data = out.GetTensorData<float>();

    std::vector<float> pooled(hidden, 0.0f);
    for (size_t t = 0; t < seq_len; ++t) {
        const float* row = data + t * hidden;
        for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
    }
    if (seq_len > 0) {
        const float inv = static_cast<float>(1.0 / static_cast<double>(seq_len));
        for (float& x : pooled) x *= inv;
    }

    l2_normalize(pooled);
    return pooled;
}

} // namespace emb
