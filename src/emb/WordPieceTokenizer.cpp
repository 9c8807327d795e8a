#include "emb/WordPieceTokenizer.hpp"
#include <cctype>
#include <fstream>

namespace emb {

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const int64_t id = (int64_t)m_id_to_tok.size();
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);
    }
    if (m_id_to_tok.empty()) return false;

    // a vocab without the special tokens cannot frame a sequence
    return m_tok_to_id.count("[CLS]") && m_tok_to_id.count("[SEP]") && m_tok_to_id.count("[UNK]");
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

bool WordPieceTokenizer::is_ws(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool WordPieceTokenizer::is_control(unsigned char c) {
    return (c < 32 && !is_ws(c)) || c == 127;
}

bool WordPieceTokenizer::is_punct(unsigned char c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) ||
           (c >= 91 && c <= 96) || (c >= 123 && c <= 126);
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> words;
    std::string cur;
    auto flush = [&]() {
        if (!cur.empty()) { words.push_back(cur); cur.clear(); }
    };

    for (unsigned char c : text) {
        if (is_control(c)) continue;
        if (is_ws(c)) {
            flush();
        } else if (is_punct(c)) {
            flush();
            words.emplace_back(1, (char)c);
        } else {
            // bytes >= 0x80 stay inside the word; the vocab resolves them or yields [UNK]
            cur.push_back((char)std::tolower(c));
        }
    }
    flush();
    return words;
}

void WordPieceTokenizer::wordpiece(const std::string& word, std::vector<std::string>& out) const {
    if (word.size() > kMaxCharsPerWord) {
        out.emplace_back("[UNK]");
        return;
    }

    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        std::string match;

        // greedy longest match; continuation pieces carry the "##" prefix
        while (end > start) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) sub = "##" + sub;
            if (m_tok_to_id.find(sub) != m_tok_to_id.end()) {
                match = std::move(sub);
                break;
            }
            --end;
        }

        if (match.empty()) {
            out.emplace_back("[UNK]");
            return;
        }
        pieces.push_back(std::move(match));
        start = end;
    }

    out.insert(out.end(), pieces.begin(), pieces.end());
}

std::vector<std::string> WordPieceTokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> out;
    for (const auto& w : basic_tokenize(text)) wordpiece(w, out);
    return out;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    const int64_t unk = unk_id();

    std::vector<int64_t> ids;
    ids.reserve(max_len);
    ids.push_back(cls_id());

    for (const auto& piece : tokenize(text)) {
        if (ids.size() + 1 >= max_len) break; // keep room for [SEP]
        ids.push_back(id_or(unk, piece));
    }

    ids.push_back(sep_id());
    return ids;
}

} // namespace emb
