#include "api_config.hpp"

#include <iostream>
#include <stdexcept>

#include "env_loader.hpp"

namespace citysuggest {

static bool parse_port(const std::string& s, int& port) {
    try {
        size_t used = 0;
        int p = std::stoi(s, &used);
        if (used != s.size() || p <= 0 || p > 65535) return false;
        port = p;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool resolve_server_config(const std::vector<std::string>& args,
                           const std::unordered_map<std::string, std::string>& env_file,
                           ServerConfig& out) {
    std::string data = args.size() >= 1 ? args[0] : env_or(env_file, "CITYSUGGEST_DATA", "");
    if (data.empty()) {
        std::cerr << "[config] no city data file (pass TSV_PATH or set CITYSUGGEST_DATA)\n";
        return false;
    }
    out.data_path = fs::path(data);

    std::string port = args.size() >= 2 ? args[1] : env_or(env_file, "CITYSUGGEST_PORT", "8080");
    if (!parse_port(port, out.port)) {
        std::cerr << "[config] invalid port: " << port << "\n";
        return false;
    }

    out.host = env_or(env_file, "CITYSUGGEST_HOST", out.host);
    out.reload_token = env_or(env_file, "CITYSUGGEST_RELOAD_TOKEN", "");
    return true;
}

} // namespace citysuggest
