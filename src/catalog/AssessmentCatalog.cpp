#include "catalog/AssessmentCatalog.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace catalog {

namespace {

struct CsvRow {
    size_t line = 0;  // 1-based line where the row starts
    std::vector<std::string> fields;
};

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace((unsigned char)s[i])) ++i;
    while (j > i && std::isspace((unsigned char)s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

// RFC 4180: quoted fields may hold commas, doubled quotes and newlines
std::vector<CsvRow> read_csv_rows(std::istream& in) {
    std::vector<CsvRow> rows;
    CsvRow cur;
    std::string field;
    bool in_quotes = false;
    bool row_has_data = false;
    size_t line = 1;
    cur.line = line;

    auto end_field = [&]() {
        cur.fields.push_back(field);
        field.clear();
    };
    auto end_row = [&]() {
        end_field();
        if (row_has_data) rows.push_back(std::move(cur));
        cur = CsvRow{};
        cur.line = line;
        row_has_data = false;
    };

    char ch;
    while (in.get(ch)) {
        if (in_quotes) {
            if (ch == '"') {
                if (in.peek() == '"') {
                    in.get(ch);
                    field.push_back('"');
                } else {
                    in_quotes = false;
                }
            } else {
                if (ch == '\n') ++line;
                field.push_back(ch);
            }
            continue;
        }

        if (ch == '"') {
            in_quotes = true;
            row_has_data = true;
        } else if (ch == ',') {
            end_field();
            row_has_data = true;
        } else if (ch == '\r') {
            continue;
        } else if (ch == '\n') {
            ++line;
            end_row();
        } else {
            field.push_back(ch);
            row_has_data = true;
        }
    }
    if (in_quotes) throw std::runtime_error("unterminated quoted field starting near line " + std::to_string(cur.line));
    end_row();
    return rows;
}

bool parse_yes_no(const std::string& cell) {
    const std::string v = to_lower_ascii(trim(cell));
    return v == "yes" || v == "true" || v == "y" || v == "1";
}

int parse_duration(const std::string& cell, const std::string& where) {
    const std::string v = trim(cell);
    if (v.empty()) throw std::runtime_error(where + ": empty duration_mins");

    // pandas may write integral columns as "30.0"; fractional minutes are rejected
    size_t pos = 0;
    double d = 0.0;
    try {
        d = std::stod(v, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(where + ": invalid duration_mins '" + v + "'");
    }
    if (pos != v.size() || !std::isfinite(d) || d < 0.0 || d > 1e6 || d != std::floor(d)) {
        throw std::runtime_error(where + ": invalid duration_mins '" + v + "'");
    }
    return (int)d;
}

std::vector<std::string> split_skills(const std::string& cell) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream ss(cell);
    while (std::getline(ss, cur, ',')) {
        std::string t = trim(cur);
        if (!t.empty()) out.push_back(std::move(t));
    }
    return out;
}

}  // namespace

AssessmentCatalog AssessmentCatalog::load_from_csv(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open catalog: " + path);
    return parse_csv(in, path);
}

AssessmentCatalog AssessmentCatalog::parse_csv(std::istream& in, const std::string& source_name) {
    std::vector<CsvRow> rows = read_csv_rows(in);
    if (rows.empty()) throw std::runtime_error(source_name + ": catalog is empty (no header row)");

    std::unordered_map<std::string, size_t> col;
    const auto& header = rows.front().fields;
    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = to_lower_ascii(trim(header[i]));
        // tolerate a UTF-8 BOM on the first column
        if (i == 0 && name.rfind("\xef\xbb\xbf", 0) == 0) name = name.substr(3);
        col.emplace(name, i);
    }

    static const char* required[] = {"id", "name", "url", "test_type", "duration_mins", "skills", "description"};
    for (const char* r : required) {
        if (col.find(r) == col.end()) {
            throw std::runtime_error(source_name + ": missing required column: " + r);
        }
    }

    auto cell = [&](const CsvRow& row, const char* name) -> std::string {
        auto it = col.find(name);
        if (it == col.end() || it->second >= row.fields.size()) return "";
        return row.fields[it->second];
    };

    std::vector<Assessment> records;
    records.reserve(rows.size() - 1);

    for (size_t r = 1; r < rows.size(); ++r) {
        const CsvRow& row = rows[r];
        const std::string where = source_name + ":" + std::to_string(row.line);

        Assessment a;
        a.id = trim(cell(row, "id"));
        a.name = trim(cell(row, "name"));
        a.url = trim(cell(row, "url"));
        a.test_type_raw = trim(cell(row, "test_type"));
        a.test_type = test_type_from_code(a.test_type_raw);
        a.duration_mins = parse_duration(cell(row, "duration_mins"), where);
        a.skills = split_skills(cell(row, "skills"));
        a.description = trim(cell(row, "description"));
        a.adaptive_support = parse_yes_no(cell(row, "adaptive_support"));
        a.remote_support = parse_yes_no(cell(row, "remote_support"));

        if (a.url.empty()) throw std::runtime_error(where + ": empty url");
        records.push_back(std::move(a));
    }

    return from_records(std::move(records));
}

AssessmentCatalog AssessmentCatalog::from_records(std::vector<Assessment> records) {
    AssessmentCatalog c;
    c.m_items.reserve(records.size());

    std::unordered_set<std::string> seen;
    seen.reserve(records.size() * 2 + 8);

    for (auto& a : records) {
        if (!seen.insert(a.url).second) {
            std::cerr << "catalog: warning: skipping duplicate url " << a.url << "\n";
            continue;
        }
        c.m_items.push_back(std::move(a));
    }
    return c;
}

std::vector<std::string> AssessmentCatalog::urls() const {
    std::vector<std::string> out;
    out.reserve(m_items.size());
    for (const auto& a : m_items) out.push_back(a.url);
    return out;
}

std::string join_skills(const std::vector<std::string>& skills) {
    std::string out;
    for (size_t i = 0; i < skills.size(); ++i) {
        if (i) out += ", ";
        out += skills[i];
    }
    return out;
}

std::string search_text(const Assessment& a) {
    const std::string skills = join_skills(a.skills);
    std::string out;
    out.reserve(a.name.size() * 2 + skills.size() * 2 + a.description.size() + 32);
    out += a.name; out += ' ';
    out += a.name; out += ' ';
    out += skills; out += ' ';
    out += skills; out += ' ';
    out += a.description;
    out += " test type ";
    out += a.test_type_raw;
    return out;
}

}  // namespace catalog
