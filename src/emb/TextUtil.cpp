#include "emb/TextUtil.hpp"
#include <cctype>
#include <unordered_map>

namespace textutil {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            (c == '+') || (c == '#'); // keeps "c++" and "c#"

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else if (!prev_space) {
            out.push_back(' ');
            prev_space = true;
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    auto flush = [&]() {
        // "c" alone is a language, every other single character is noise
        if (cur.size() >= 2 || cur == "c") tokens.push_back(cur);
        cur.clear();
    };

    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) flush();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) flush();
    return tokens;
}

std::vector<std::string> normalize_tokens(const std::vector<std::string>& tokens) {
    static const std::unordered_map<std::string, std::string> fold = {
        {"dev", "developer"},
        {"programmer", "developer"},
        {"engineer", "developer"},
        {"engineers", "developer"},
        {"developers", "developer"},
        {"js", "javascript"},
        {"behaviour", "behavior"},
        {"behavioural", "behavior"},
        {"behavioral", "behavior"},
        {"mins", "minutes"},
        {"min", "minutes"},
        {"minute", "minutes"},
        {"hrs", "hours"},
        {"hr", "hours"},
        {"hour", "hours"},
        {"graduates", "graduate"},
        {"skill", "skills"},
        {"tests", "test"},
        {"assessments", "assessment"},
    };

    std::vector<std::string> out;
    out.reserve(tokens.size());

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];

        // phrase merging (2-grams)
        if (i + 1 < tokens.size()) {
            const std::string& n = tokens[i + 1];

            if (t == "problem" && n == "solving") {
                out.push_back("problemsolving");
                ++i;
                continue;
            }
            if (t == "entry" && n == "level") {
                out.push_back("entrylevel");
                ++i;
                continue;
            }
            if (t == "new" && n == "graduate") {
                out.push_back("graduate");
                ++i;
                continue;
            }
        }

        auto it = fold.find(t);
        out.push_back(it != fold.end() ? it->second : t);
    }

    return out;
}

}
