#pragma once
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace rec {

struct QueryRequirements {
    std::optional<int> max_duration;  // minutes
    bool needs_tech = false;
    bool needs_soft = false;
    bool needs_cognitive = false;
    bool needs_balanced = false;
    bool is_entry_level = false;
};

// One duration rule: the first capture group is the number, scaled by multiplier.
struct DurationRule {
    const char* name;
    std::regex pattern;
    int multiplier;
};

// Evaluated in order; the first matching rule wins.
const std::vector<DurationRule>& duration_rules();

namespace vocab {
extern const std::vector<std::string> kTechnical;
extern const std::vector<std::string> kSoft;
extern const std::vector<std::string> kCognitive;
extern const std::vector<std::string> kEntryLevel;
}  // namespace vocab

// case-insensitive substring membership of any keyword
bool mentions_any(const std::string& lowered_text, const std::vector<std::string>& keywords);

std::optional<int> extract_max_duration(const std::string& text);

QueryRequirements analyze_query(const std::string& text);

}  // namespace rec
