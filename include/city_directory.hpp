#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <vector>

#include "api_types.hpp"
#include "city.hpp"
#include "radix_tree.hpp"

namespace citysuggest {

// Cities indexed by full name ("name, province, country").
//
// Notes:
// - One reader-writer lock guards the tree: lookups share it, add / remove /
//   reset / load hold it exclusively for the whole call.
// - The TSV file is parsed before the lock is taken.
class CityDirectory {
public:
    // Returns true if the directory changed.
    bool add(const City& city);
    bool remove(const City& city);

    // Cities whose full name starts with `name` (normalized).
    std::vector<CityPtr> get_all(const std::string& name) const;

    // Ranked suggestions by population, or by distance from a position.
    std::vector<Suggestion> query(const std::string& name) const;
    std::vector<Suggestion> query(const std::string& name, double latitude, double longitude) const;

    // Load a tab-separated city file with a header row. With replace=true the
    // current contents are dropped in the same critical section.
    // Returns false if the file cannot be read or lacks a required column.
    bool load_from_tsv(const fs::path& path, bool replace = false);

    void reset();
    size_t size() const;

private:
    RadixTree<CityPtr, SameCity> tree_;
    mutable std::shared_mutex mtx_;
};

// Field normalization applied to loaded rows.
// Numeric Canadian admin1 codes become postal abbreviations ("8" -> "ON").
std::string expand_province(const std::string& admin1);
// "US" -> "USA", "CA" -> "Canada", others unchanged.
std::string expand_country(const std::string& code);

} // namespace citysuggest
