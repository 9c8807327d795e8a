#include "catalog/Assessment.hpp"

namespace catalog {

TestType test_type_from_code(const std::string& code) {
    if (code == "K") return TestType::Knowledge;
    if (code == "P") return TestType::Personality;
    if (code == "A") return TestType::Ability;
    if (code == "B") return TestType::Biodata;
    return TestType::Other;
}

std::string test_type_label(TestType t) {
    switch (t) {
        case TestType::Knowledge:   return "Knowledge & Skills";
        case TestType::Personality: return "Personality & Behaviour";
        case TestType::Ability:     return "Ability & Aptitude";
        case TestType::Biodata:     return "Biodata & SJT";
        case TestType::Other:       break;
    }
    return "Other";
}

}  // namespace catalog
