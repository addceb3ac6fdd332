#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "api_types.hpp"
#include "city.hpp"

namespace citysuggest {

// Suggestions scoring below this are dropped.
constexpr double MIN_SUGGESTION_SCORE = 0.1;

// Rank matches by their share of the total population:
//   (log10(p) - 3) / (log10(total) - 3)
// Results are sorted by score (ties keep input order), filtered and
// floor-truncated to one decimal. When no match exceeds 1000 people the
// score is the plain share p / total instead. Throws InvalidPopulation for p <= 0.
std::vector<Suggestion> rank_by_population(const std::vector<CityPtr>& matches);

// Rank matches by distance from (latitude, longitude): the score halves
// every 100 * log10(p) km, so larger cities decay slower.
std::vector<Suggestion> rank_by_distance(const std::vector<CityPtr>& matches,
                                         double latitude, double longitude);

double population_score(int64_t population, int64_t population_sum);
double distance_score(double distance_km, int64_t population);

// floor(score * 10) / 10
double truncate_score(double score);

// At most 5 decimals, trailing zeros dropped: 43.70011, -79.4163, 45
std::string format_coordinate(double degrees);

} // namespace citysuggest
