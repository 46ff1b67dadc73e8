#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voice_bridge {

class Metrics {
public:
    static Metrics& instance();

    void increment(const std::string& counter, uint64_t value = 1);
    void session_opened();
    void session_closed();
    void observe_backend_latency(const std::string& backend, double seconds);
    std::string render_prometheus() const;

    uint64_t counter_value(const std::string& counter) const;
    int64_t active_sessions() const;

private:
    struct SummarySeries {
        uint64_t count = 0;
        double sum = 0.0;
    };

    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
    int64_t active_sessions_ = 0;
    std::map<std::string, SummarySeries> latency_summaries_;
    std::map<std::string, HistogramSeries> latency_histograms_;
    std::vector<double> histogram_bounds_;
};

}
