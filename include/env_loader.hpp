#pragma once

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <unordered_map>

#include "api_types.hpp"

namespace citysuggest {

// Read KEY=VALUE pairs from a .env file. Blank lines and lines starting
// with '#' are ignored; one level of surrounding quotes is stripped.
// A missing file yields an empty map.
inline std::unordered_map<std::string, std::string> load_env_file(const fs::path& path) {
    std::unordered_map<std::string, std::string> vars;

    std::ifstream in(path);
    if (!in) return vars;

    auto trim = [](std::string s) {
        const char* ws = " \t\r\n";
        size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos) return std::string();
        size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    };

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[config] " << path.string() << ":" << line_no << ": ignoring line without '='\n";
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) vars[key] = value;
    }
    return vars;
}

// Process environment first, then the .env map, then `fallback`.
inline std::string env_or(const std::unordered_map<std::string, std::string>& env_file,
                          const std::string& key, const std::string& fallback) {
    if (const char* v = std::getenv(key.c_str())) {
        if (*v) return v;
    }
    auto it = env_file.find(key);
    if (it != env_file.end() && !it->second.empty()) return it->second;
    return fallback;
}

} // namespace citysuggest
