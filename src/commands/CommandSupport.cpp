#include "commands/CommandSupport.hpp"
#include "emb/HashingEmbedder.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "rec/Errors.hpp"

#include <stdexcept>

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == key) return true;
    }
    return false;
}

bool wants_help(int argc, char** argv) {
    return has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h");
}

size_t get_size_arg(int argc, char** argv, const std::string& key, size_t def) {
    const std::string v = get_arg(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        size_t pos = 0;
        long long n = std::stoll(v, &pos);
        if (pos == v.size() && n >= 0) return (size_t)n;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range: reported below
    }
    throw std::runtime_error("invalid value for " + key + ": " + v);
}

float get_float_arg(int argc, char** argv, const std::string& key, float def) {
    const std::string v = get_arg(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        size_t pos = 0;
        float f = std::stof(v, &pos);
        if (pos == v.size()) return f;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range: reported below
    }
    throw std::runtime_error("invalid value for " + key + ": " + v);
}

std::shared_ptr<const emb::Embedder> make_embedder(int argc, char** argv) {
    const std::string kind = get_arg(argc, argv, "--embedder", "minilm");

    if (kind == "hashing") {
        return std::make_shared<const emb::HashingEmbedder>(get_size_arg(argc, argv, "--hash_dim", 384));
    }

    if (kind == "minilm") {
        emb::MiniLmConfig cfg;
        cfg.model_path = get_arg(argc, argv, "--model", cfg.model_path);
        cfg.vocab_path = get_arg(argc, argv, "--vocab", cfg.vocab_path);
        cfg.max_len = get_size_arg(argc, argv, "--max_len", cfg.max_len);
        cfg.intra_op_threads = (int)get_size_arg(argc, argv, "--threads", (size_t)cfg.intra_op_threads);

        auto e = std::make_shared<emb::MiniLmEmbedder>();
        if (!e->init(cfg)) {
            throw rec::ConfigurationError("failed to init MiniLmEmbedder from " + cfg.model_path);
        }
        return e;
    }

    throw rec::ConfigurationError("unknown --embedder: " + kind + " (expected minilm or hashing)");
}

rec::ContextOptions context_options(int argc, char** argv) {
    rec::ContextOptions o;
    o.catalog_path = get_arg(argc, argv, "--catalog", o.catalog_path);
    o.index_path = get_arg(argc, argv, "--index", o.index_path);
    o.rebuild_index = has_flag(argc, argv, "--rebuild");
    return o;
}

rec::RankingConfig ranking_config(int argc, char** argv) {
    rec::RankingConfig c;
    c.max_results = get_size_arg(argc, argv, "--max_results", c.max_results);
    c.min_results = get_size_arg(argc, argv, "--min_results", c.min_results);
    c.entry_level_boost = get_float_arg(argc, argv, "--entry_boost", c.entry_level_boost);
    if (c.max_results == 0) throw std::runtime_error("--max_results must be > 0");
    return c;
}

const char* common_flags_help() {
    return
        "catalog / index:\n"
        "  --catalog <path>             default: data/assessments_enriched_db.csv\n"
        "  --index <path>               default: models/assessment_embeddings.bin\n"
        "  --rebuild                    ignore an existing index and re-embed the catalog\n"
        "\n"
        "embedder:\n"
        "  --embedder minilm|hashing    default: minilm\n"
        "  --model <path>               default: models/emb/model.onnx\n"
        "  --vocab <path>               default: models/emb/vocab.txt\n"
        "  --max_len <n>                default: 256\n"
        "  --threads <n>                default: 1 (onnxruntime intra-op)\n"
        "  --hash_dim <n>               default: 384 (hashing embedder)\n"
        "\n"
        "ranking:\n"
        "  --max_results <n>            default: 10\n"
        "  --min_results <n>            default: 5 (duration relaxation threshold)\n"
        "  --entry_boost <f>            default: 0.1\n";
}
