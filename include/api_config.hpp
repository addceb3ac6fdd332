#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "api_types.hpp"

namespace citysuggest {

struct ServerConfig {
    fs::path data_path;          // TSV file with the cities
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string reload_token;    // empty: POST /api/reload is disabled
};

// Resolve the server configuration.
//   args: command line without the program name, [TSV_PATH] [port]
//   env_file: values loaded from .env
// Command line wins over CITYSUGGEST_DATA / CITYSUGGEST_PORT, which win over
// the defaults; CITYSUGGEST_HOST sets the bind address and
// CITYSUGGEST_RELOAD_TOKEN the bearer token required by /api/reload.
// Returns false (and logs) if no data path is given or the port is invalid.
bool resolve_server_config(const std::vector<std::string>& args,
                           const std::unordered_map<std::string, std::string>& env_file,
                           ServerConfig& out);

} // namespace citysuggest
