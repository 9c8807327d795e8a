#include "rec/QueryAnalyzer.hpp"

#include <cctype>
#include <climits>

namespace rec {

namespace vocab {

const std::vector<std::string> kTechnical = {
    "java", "python", "sql", "javascript", "js", "programming",
    "coding", "technical", "excel", "development", "engineer",
    "developer", "software", "data analyst", "analyst", "sales",
};

const std::vector<std::string> kSoft = {
    "communication", "personality", "leadership", "behavior",
    "cultural", "collaborate", "interpersonal", "emotional",
    "team", "social", "motivat", "cultural fit",
};

const std::vector<std::string> kCognitive = {
    "cognitive", "aptitude", "reasoning", "numerical",
    "verbal", "analytical", "problem solving", "logic",
};

const std::vector<std::string> kEntryLevel = {
    "new graduate", "graduate", "entry", "fresher", "junior",
};

}  // namespace vocab

static std::string to_lower_ascii(const std::string& s) {
    std::string out = s;
    for (char& c : out) c = (char)std::tolower((unsigned char)c);
    return out;
}

const std::vector<DurationRule>& duration_rules() {
    // order matters: "2 hour 30 min" must resolve through the minute rule first
    static const std::vector<DurationRule> rules = {
        {"minutes",         std::regex(R"((\d+)\s*-?\s*(\d+)?\s*(min|minute)s?)"), 1},
        {"hours",           std::regex(R"((\d+)\s*-?\s*(\d+)?\s*(hour|hr)s?)"), 60},
        {"under_minutes",   std::regex(R"(under\s+(\d+)\s*(min|minute)s?)"), 1},
        {"under_hours",     std::regex(R"(under\s+(\d+)\s*(hour|hr)s?)"), 60},
        {"maximum_minutes", std::regex(R"(maximum\s+(\d+)\s*(min|minute)s?)"), 1},
        {"maximum_hours",   std::regex(R"(maximum\s+(\d+)\s*(hour|hr)s?)"), 60},
        {"max_minutes",     std::regex(R"(max\s+(\d+)\s*(min|minute)s?)"), 1},
        {"max_hours",       std::regex(R"(max\s+(\d+)\s*(hour|hr)s?)"), 60},
        {"bare_min",        std::regex(R"((\d+)\s*min)"), 1},
        {"bare_hour",       std::regex(R"((\d+)\s*hour)"), 60},
    };
    return rules;
}

// saturates instead of throwing on absurd digit runs
static int scaled_minutes(const std::string& digits, int multiplier) {
    size_t i = 0;
    while (i + 1 < digits.size() && digits[i] == '0') ++i;
    const std::string d = digits.substr(i);
    if (d.size() > 9) return INT_MAX;

    const long long v = std::stoll(d) * (long long)multiplier;
    return v > INT_MAX ? INT_MAX : (int)v;
}

std::optional<int> extract_max_duration(const std::string& text) {
    const std::string lowered = to_lower_ascii(text);

    for (const auto& rule : duration_rules()) {
        std::smatch m;
        if (std::regex_search(lowered, m, rule.pattern)) {
            return scaled_minutes(m[1].str(), rule.multiplier);
        }
    }
    return std::nullopt;
}

bool mentions_any(const std::string& lowered_text, const std::vector<std::string>& keywords) {
    for (const auto& kw : keywords) {
        if (lowered_text.find(kw) != std::string::npos) return true;
    }
    return false;
}

QueryRequirements analyze_query(const std::string& text) {
    const std::string lowered = to_lower_ascii(text);

    QueryRequirements r;
    r.max_duration = extract_max_duration(lowered);
    r.needs_tech = mentions_any(lowered, vocab::kTechnical);
    r.needs_soft = mentions_any(lowered, vocab::kSoft);
    r.needs_cognitive = mentions_any(lowered, vocab::kCognitive);
    r.is_entry_level = mentions_any(lowered, vocab::kEntryLevel);
    r.needs_balanced = (r.needs_tech && r.needs_soft) || (r.needs_tech && r.needs_cognitive);
    return r;
}

}  // namespace rec
