#pragma once

#include <cctype>
#include <string>

#include <httplib.h>

#include "api_types.hpp"

namespace citysuggest {

inline void enable_cors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

// {"error": message} with the given status
inline void send_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    json err;
    err["error"] = message;
    res.set_content(err.dump(2), "application/json");
}

// Token after a case-insensitive "Bearer " prefix, or "" if there is none
inline std::string extract_bearer_token(const std::string& auth_header) {
    const std::string prefix = "Bearer ";
    if (auth_header.size() <= prefix.size()) return "";

    for (size_t i = 0; i < prefix.size(); i++) {
        if (std::tolower((unsigned char)auth_header[i]) != std::tolower((unsigned char)prefix[i])) {
            return "";
        }
    }
    return auth_header.substr(prefix.size());
}

// Guard for state-changing routes. An empty expected token disables the
// route (403); a missing or wrong bearer token gets 401.
inline bool require_token(const httplib::Request& req, httplib::Response& res,
                          const std::string& expected) {
    if (expected.empty()) {
        send_error(res, 403, "disabled");
        return false;
    }

    std::string token = extract_bearer_token(req.get_header_value("Authorization"));
    if (token.empty() || token != expected) {
        send_error(res, 401, "Unauthorized");
        return false;
    }
    return true;
}

} // namespace citysuggest
