#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace emb {

// BERT-uncased style tokenizer over a vocab.txt (one token per line, id = line number)
class WordPieceTokenizer {
public:
    bool load_vocab(const std::string& vocab_path);

    // Returns token ids including [CLS] ... [SEP], truncated to max_len
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    // pieces before id lookup, without [CLS]/[SEP]; useful for debugging
    std::vector<std::string> tokenize(const std::string& text) const;

    size_t vocab_size() const { return m_id_to_tok.size(); }

    int64_t unk_id() const { return id_or(0, "[UNK]"); }
    int64_t cls_id() const { return id_or(0, "[CLS]"); }
    int64_t sep_id() const { return id_or(0, "[SEP]"); }

private:
    static constexpr size_t kMaxCharsPerWord = 100;

    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;

    static bool is_ws(unsigned char c);
    static bool is_control(unsigned char c);
    static bool is_punct(unsigned char c);

    std::vector<std::string> basic_tokenize(const std::string& text) const;
    void wordpiece(const std::string& word, std::vector<std::string>& out) const;

    int64_t id_or(int64_t def, const std::string& tok) const;
};

} // namespace emb
