#pragma once
#include "catalog/Assessment.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace catalog {

class AssessmentCatalog {
public:
    // CSV with a header row; throws std::runtime_error on a missing file,
    // a missing required column or an unparseable duration cell
    static AssessmentCatalog load_from_csv(const std::string& path);
    static AssessmentCatalog parse_csv(std::istream& in, const std::string& source_name);

    // rows repeating an earlier url are dropped (first one wins)
    static AssessmentCatalog from_records(std::vector<Assessment> records);

    const std::vector<Assessment>& assessments() const { return m_items; }
    size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }

    std::vector<std::string> urls() const;

private:
    std::vector<Assessment> m_items;
};

// text fed to the embedder for one record: name and skills are repeated to weight them
std::string search_text(const Assessment& a);

std::string join_skills(const std::vector<std::string>& skills);

}  // namespace catalog
