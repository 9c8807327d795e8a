#pragma once
#include <string>
#include <vector>

namespace catalog {

enum class TestType { Knowledge, Personality, Ability, Biodata, Other };

// single-letter code as stored in the catalog CSV: K, P, A, B
TestType test_type_from_code(const std::string& code);

// human-readable category label used in API payloads
std::string test_type_label(TestType t);

struct Assessment {
    std::string id;
    std::string name;
    std::string url;                  // unique key
    TestType test_type = TestType::Other;
    std::string test_type_raw;        // code exactly as read, e.g. "K"
    int duration_mins = 0;
    std::vector<std::string> skills;
    std::string description;
    bool adaptive_support = false;
    bool remote_support = false;
};

}  // namespace catalog
