#include "city_directory.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <unordered_map>

#include "geo.hpp"
#include "ranking.hpp"
#include "textutil.hpp"

namespace citysuggest {

// Split a TSV line into columns (no quoting)
static std::vector<std::string> tsv_row(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;

    for (char c : line) {
        if (c == '\t') {
            out.push_back(cur);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }

    out.push_back(cur);
    return out;
}

// Trim whitespace (including a stray '\r') from both ends
static inline std::string trim_copy(std::string s) {
    auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_ws((unsigned char)s.front()))
        s.erase(s.begin());

    while (!s.empty() && is_ws((unsigned char)s.back()))
        s.pop_back();

    return s;
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

std::string expand_province(const std::string& admin1) {
    static const std::unordered_map<int, std::string> codes = {
        {1, "AB"}, {2, "BC"}, {3, "MB"}, {4, "NB"}, {5, "NL"},
        {7, "NS"}, {8, "ON"}, {9, "PE"}, {10, "QC"}, {11, "SK"},
        {12, "YT"}, {13, "NT"}, {14, "NU"}
    };

    if (!all_digits(admin1) || admin1.size() > 4) return admin1;

    auto it = codes.find(std::stoi(admin1));
    return it == codes.end() ? admin1 : it->second;
}

std::string expand_country(const std::string& code) {
    if (code == "US") return "USA";
    if (code == "CA") return "Canada";
    return code;
}

// Column positions looked up from the header row
struct TsvColumns {
    size_t name = 0;
    size_t province = 0;
    size_t country = 0;
    size_t lat = 0;
    size_t lon = 0;
    size_t population = 0;
    size_t max_index = 0;
};

static bool find_columns(const std::vector<std::string>& header, TsvColumns& cols) {
    std::unordered_map<std::string, size_t> pos;
    for (size_t i = 0; i < header.size(); i++) pos[trim_copy(header[i])] = i;

    struct Want { const char* name; size_t* slot; };
    const Want wants[] = {
        {"ascii", &cols.name},
        {"admin1", &cols.province},
        {"country", &cols.country},
        {"lat", &cols.lat},
        {"long", &cols.lon},
        {"population", &cols.population},
    };

    for (const auto& w : wants) {
        auto it = pos.find(w.name);
        if (it == pos.end()) {
            std::cerr << "[directory] missing column: " << w.name << "\n";
            return false;
        }
        *w.slot = it->second;
        cols.max_index = std::max(cols.max_index, it->second);
    }
    return true;
}

// Parse one data row; false (with a log line) if it is unusable
static bool parse_city(const std::vector<std::string>& f, const TsvColumns& cols,
                       size_t line_no, City& out) {
    if (f.size() <= cols.max_index) {
        std::cerr << "[directory] line " << line_no << ": expected at least "
                  << (cols.max_index + 1) << " columns, got " << f.size() << "\n";
        return false;
    }

    out.name = trim_copy(f[cols.name]);
    out.province = expand_province(trim_copy(f[cols.province]));
    out.country = expand_country(trim_copy(f[cols.country]));

    struct Number { const char* column; const std::string& text; double* real; int64_t* whole; };
    const Number numbers[] = {
        {"lat", f[cols.lat], &out.latitude, nullptr},
        {"long", f[cols.lon], &out.longitude, nullptr},
        {"population", f[cols.population], nullptr, &out.population},
    };

    for (const auto& n : numbers) {
        std::string text = trim_copy(n.text);
        bool ok = n.real ? parse_finite_double(text, *n.real) : parse_int64(text, *n.whole);
        if (!ok) {
            std::cerr << "[directory] line " << line_no << ": bad " << n.column
                      << " \"" << text << "\"\n";
            return false;
        }
    }

    if (!valid_coordinates(out.latitude, out.longitude)) {
        std::cerr << "[directory] line " << line_no << ": coordinates out of range ("
                  << out.latitude << ", " << out.longitude << ")\n";
        return false;
    }

    if (out.population <= 0) {
        std::cerr << "[directory] line " << line_no << ": skipping "
                  << out.full_name() << " with population " << out.population << "\n";
        return false;
    }
    return true;
}

bool CityDirectory::add(const City& city) {
    auto ptr = std::make_shared<const City>(city);
    std::unique_lock<std::shared_mutex> lock(mtx_);
    return tree_.add(ptr->full_name(), ptr);
}

bool CityDirectory::remove(const City& city) {
    auto ptr = std::make_shared<const City>(city);
    std::unique_lock<std::shared_mutex> lock(mtx_);
    return tree_.remove(ptr->full_name(), ptr);
}

std::vector<CityPtr> CityDirectory::get_all(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return tree_.get_all(name);
}

std::vector<Suggestion> CityDirectory::query(const std::string& name) const {
    return rank_by_population(get_all(name));
}

std::vector<Suggestion> CityDirectory::query(const std::string& name,
                                             double latitude, double longitude) const {
    return rank_by_distance(get_all(name), latitude, longitude);
}

bool CityDirectory::load_from_tsv(const fs::path& path, bool replace) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "[directory] FAILED open: " << path.string() << "\n";
        return false;
    }

    std::string line;
    if (!std::getline(in, line)) {
        std::cerr << "[directory] empty file: " << path.string() << "\n";
        return false;
    }

    TsvColumns cols;
    if (!find_columns(tsv_row(line), cols)) return false;

    // Parse everything before touching the tree
    std::vector<CityPtr> cities;
    size_t line_no = 1;
    size_t skipped = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (trim_copy(line).empty()) continue;

        City c;
        if (!parse_city(tsv_row(line), cols, line_no, c)) {
            skipped++;
            continue;
        }
        cities.push_back(std::make_shared<const City>(std::move(c)));
    }

    size_t added = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mtx_);
        if (replace) tree_.clear();
        for (const auto& c : cities) {
            if (tree_.add(c->full_name(), c)) added++;
        }
    }

    std::cerr << "[directory] loaded " << added << " cities from " << path.string()
              << " (" << skipped << " rows skipped, "
              << (cities.size() - added) << " duplicates)\n";
    return true;
}

void CityDirectory::reset() {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    tree_.clear();
}

size_t CityDirectory::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return tree_.size();
}

} // namespace citysuggest
