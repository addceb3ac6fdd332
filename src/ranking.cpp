#include "ranking.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "errors.hpp"

namespace citysuggest {

static void check_population(const City& city) {
    if (city.population <= 0) {
        throw InvalidPopulation("non-positive population " + std::to_string(city.population) +
                                " for " + city.full_name());
    }
}

static const City& deref(const CityPtr& c) {
    if (!c) throw InvalidValue("ranking: null city");
    return *c;
}

static Suggestion make_suggestion(const City& city, double score) {
    Suggestion s;
    s.name = city.full_name();
    s.latitude = format_coordinate(city.latitude);
    s.longitude = format_coordinate(city.longitude);
    s.score = score;
    return s;
}

// Filter, sort (descending, stable) and truncate scored suggestions
static std::vector<Suggestion> finish(std::vector<Suggestion> scored) {
    scored.erase(std::remove_if(scored.begin(), scored.end(), [](const Suggestion& s) {
                     return std::isnan(s.score) || s.score < MIN_SUGGESTION_SCORE;
                 }),
                 scored.end());

    std::stable_sort(scored.begin(), scored.end(), [](const Suggestion& a, const Suggestion& b) {
        return a.score > b.score;
    });

    for (auto& s : scored) s.score = truncate_score(s.score);
    return scored;
}

double population_score(int64_t population, int64_t population_sum) {
    double denom = std::log10((double)population_sum) - 3.0;

    // Totals of 1000 or less leave no log headroom; use the plain share
    if (denom <= 0.0) return (double)population / (double)population_sum;

    return (std::log10((double)population) - 3.0) / denom;
}

double distance_score(double distance_km, int64_t population) {
    double half_distance = 100.0 * std::log10((double)population);

    // Population 1: no decay distance at all
    if (half_distance <= 0.0) return distance_km <= 0.0 ? 1.0 : 0.0;

    double scale = std::log(0.5) / half_distance;
    return std::exp(scale * distance_km);
}

double truncate_score(double score) {
    return std::floor(score * 10.0) / 10.0;
}

std::string format_coordinate(double degrees) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(5) << degrees;
    std::string s = ss.str();

    size_t dot = s.find('.');
    if (dot != std::string::npos) {
        while (s.back() == '0') s.pop_back();
        if (s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

std::vector<Suggestion> rank_by_population(const std::vector<CityPtr>& matches) {
    std::vector<Suggestion> scored;
    if (matches.empty()) return scored;

    int64_t total = 0;
    int64_t largest = 0;
    for (const auto& c : matches) {
        const City& city = deref(c);
        check_population(city);
        total += city.population;
        largest = std::max(largest, city.population);
    }

    // With no match above 1000 the log score is never positive; use the plain share
    bool by_share = largest <= 1000;

    scored.reserve(matches.size());
    for (const auto& c : matches) {
        double score = by_share ? (double)c->population / (double)total
                                : population_score(c->population, total);
        scored.push_back(make_suggestion(*c, score));
    }
    return finish(std::move(scored));
}

std::vector<Suggestion> rank_by_distance(const std::vector<CityPtr>& matches,
                                         double latitude, double longitude) {
    std::vector<Suggestion> scored;
    scored.reserve(matches.size());

    for (const auto& c : matches) {
        const City& city = deref(c);
        check_population(city);
        double d = city.distance_from(latitude, longitude);
        scored.push_back(make_suggestion(city, distance_score(d, city.population)));
    }
    return finish(std::move(scored));
}

} // namespace citysuggest
