#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace citysuggest {

namespace fs = std::filesystem;
using json = nlohmann::json;

// One ranked autocomplete entry, shaped for the JSON response.
struct Suggestion {
    std::string name;      // "London, ON, Canada"
    std::string latitude;  // at most 5 decimals
    std::string longitude;
    double score = 0.0;    // 0.1 .. 1.0, one decimal
};

inline void to_json(json& j, const Suggestion& s) {
    j = json{{"name", s.name},
             {"latitude", s.latitude},
             {"longitude", s.longitude},
             {"score", s.score}};
}

// {"suggestions": [...]}
inline json suggestions_to_json(const std::vector<Suggestion>& suggestions) {
    json out;
    out["suggestions"] = json::array();
    for (const auto& s : suggestions) out["suggestions"].push_back(s);
    return out;
}

} // namespace citysuggest
