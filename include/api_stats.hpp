#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "api_types.hpp"
#include "city_directory.hpp"

namespace citysuggest {

// Request counters for the suggestion API. In memory only.
class StatsTracker {
public:
    StatsTracker()
        : started_(std::chrono::steady_clock::now())
        , total_queries_(0)
        , positional_queries_(0)
        , rejected_requests_(0)
        , reloads_(0)
    {}

    void increment_queries() { total_queries_++; }
    void increment_positional_queries() { positional_queries_++; }
    void increment_rejected() { rejected_requests_++; }
    void increment_reloads() { reloads_++; }

    int64_t total_queries() const { return total_queries_.load(); }
    int64_t positional_queries() const { return positional_queries_.load(); }
    int64_t rejected_requests() const { return rejected_requests_.load(); }

    json get_stats_json(const CityDirectory& directory) const {
        json stats;

        int64_t total = total_queries_.load();
        int64_t positional = positional_queries_.load();

        stats["total_queries"] = total;
        stats["positional_queries"] = positional;
        stats["positional_query_rate"] = (total > 0) ? (static_cast<double>(positional) / total) : 0.0;
        stats["rejected_requests"] = rejected_requests_.load();
        stats["reloads"] = reloads_.load();
        stats["cities"] = directory.size();

        auto up = std::chrono::steady_clock::now() - started_;
        stats["uptime_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(up).count();

        return stats;
    }

private:
    std::chrono::steady_clock::time_point started_;
    std::atomic<int64_t> total_queries_;
    std::atomic<int64_t> positional_queries_;
    std::atomic<int64_t> rejected_requests_;
    std::atomic<int64_t> reloads_;
};

} // namespace citysuggest
