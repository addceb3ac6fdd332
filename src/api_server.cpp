#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "api_config.hpp"
#include "api_http.hpp"
#include "api_stats.hpp"
#include "api_suggest.hpp"
#include "city_directory.hpp"
#include "env_loader.hpp"

using citysuggest::CityDirectory;
using citysuggest::json;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto env_vars = citysuggest::load_env_file(".env");

    citysuggest::ServerConfig config;
    if (!citysuggest::resolve_server_config(args, env_vars, config)) {
        std::cerr << "Usage: citysuggest_server <TSV_PATH> [port]\n"
                  << "Example: citysuggest_server ./data/cities_canada-usa.tsv 8080\n";
        return 1;
    }

    CityDirectory directory;
    if (!directory.load_from_tsv(config.data_path)) {
        std::cerr << "Failed to load cities from: " << config.data_path << "\n";
        return 1;
    }

    if (config.reload_token.empty()) {
        std::cerr << "[config] CITYSUGGEST_RELOAD_TOKEN not set, /api/reload disabled\n";
    }

    citysuggest::StatsTracker stats_tracker;

    httplib::Server svr;

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cerr << "[http] " << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            std::cerr << "[exception] " << req.method << " " << req.path << " : " << e.what() << "\n";
        }
        citysuggest::enable_cors(res);
        res.status = 500;
        res.set_content(R"({"error":"internal server error"})", "application/json");
    });

    svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        std::cerr << "[error] " << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    // CORS preflight handler (OPTIONS) for all routes
    svr.Options(R"(.*)", [](const httplib::Request& req, httplib::Response& res) {
        citysuggest::enable_cors(res);

        if (req.has_header("Access-Control-Request-Headers")) {
            res.set_header("Access-Control-Allow-Headers",
                           req.get_header_value("Access-Control-Request-Headers"));
        }

        res.status = 204;
    });

    svr.Get("/suggestions", [&](const httplib::Request& req, httplib::Response& res) {
        citysuggest::handle_suggest(directory, stats_tracker, req, res);
    });

    svr.Get("/api/stats", [&](const httplib::Request&, httplib::Response& res) {
        citysuggest::enable_cors(res);
        res.set_content(stats_tracker.get_stats_json(directory).dump(2), "application/json");
    });

    svr.Post("/api/reload", [&](const httplib::Request& req, httplib::Response& res) {
        citysuggest::enable_cors(res);
        if (!citysuggest::require_token(req, res, config.reload_token)) return;

        bool ok = directory.load_from_tsv(config.data_path, true);
        if (ok) stats_tracker.increment_reloads();

        json j;
        j["reloaded"] = ok;
        j["cities"] = directory.size();
        if (!ok) res.status = 500;
        res.set_content(j.dump(2), "application/json");
    });

    std::cout << "API running on http://" << config.host << ":" << config.port << "\n";
    std::cout << "Try: /suggestions?q=Londo&latitude=43.70011&longitude=-79.4163\n";

    if (!svr.listen(config.host.c_str(), config.port)) {
        std::cerr << "Failed to listen on " << config.host << ":" << config.port << "\n";
        return 1;
    }
    return 0;
}
