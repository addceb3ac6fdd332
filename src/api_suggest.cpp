#include "api_suggest.hpp"

#include <chrono>
#include <iostream>

#include "api_http.hpp"
#include "api_stats.hpp"
#include "city_directory.hpp"
#include "geo.hpp"
#include "textutil.hpp"

namespace citysuggest {

SuggestParse parse_suggest_params(const httplib::Request& req) {
    SuggestParse out;

    if (!req.has_param("q")) {
        out.status = 400;
        out.error = "missing q param";
        return out;
    }
    out.params.q = req.get_param_value("q");

    // A lone latitude or longitude is ignored
    if (!req.has_param("latitude") || !req.has_param("longitude")) return out;

    double lat = 0.0;
    double lon = 0.0;
    if (!parse_finite_double(req.get_param_value("latitude"), lat) ||
        !parse_finite_double(req.get_param_value("longitude"), lon)) {
        out.status = 400;
        out.error = "latitude and longitude must be numbers";
        return out;
    }

    if (!valid_coordinates(lat, lon)) {
        out.status = 422;
        out.error = "latitude must be within [-90, 90] and longitude within [-180, 180]";
        return out;
    }

    out.params.latitude = lat;
    out.params.longitude = lon;
    return out;
}

void handle_suggest(const CityDirectory& directory,
                    StatsTracker& stats,
                    const httplib::Request& req,
                    httplib::Response& res) {
    enable_cors(res);

    SuggestParse parsed = parse_suggest_params(req);
    if (parsed.status != 200) {
        stats.increment_rejected();
        send_error(res, parsed.status, parsed.error);
        return;
    }

    const SuggestParams& p = parsed.params;
    auto t0 = std::chrono::steady_clock::now();

    std::vector<Suggestion> suggestions;
    if (p.latitude && p.longitude) {
        suggestions = directory.query(p.q, *p.latitude, *p.longitude);
        stats.increment_positional_queries();
    } else {
        suggestions = directory.query(p.q);
    }
    stats.increment_queries();

    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    std::cerr << "[suggest] q=\"" << p.q << "\" -> " << suggestions.size()
              << " suggestions in " << ms << " ms\n";

    res.status = 200;
    res.set_content(suggestions_to_json(suggestions).dump(2), "application/json");
}

} // namespace citysuggest
