#pragma once

#include <optional>
#include <string>

// Forward declarations
namespace httplib {
    struct Request;
    struct Response;
}

namespace citysuggest {

class CityDirectory;
class StatsTracker;

// Validated parameters of a suggestion request.
struct SuggestParams {
    std::string q;
    std::optional<double> latitude;  // set only when both coordinates are
    std::optional<double> longitude;
};

// Outcome of parameter validation: status 200 on success, otherwise the
// HTTP status to answer with (400 bad/missing parameter, 422 out of range).
struct SuggestParse {
    int status = 200;
    std::string error;
    SuggestParams params;
};

SuggestParse parse_suggest_params(const httplib::Request& req);

// Handle GET /suggestions?q=...[&latitude=...&longitude=...]
void handle_suggest(const CityDirectory& directory,
                    StatsTracker& stats,
                    const httplib::Request& req,
                    httplib::Response& res);

} // namespace citysuggest
