#include "voice_bridge/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voice_bridge {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 1.5, 2.0,
                         3.0, 5.0, 7.5, 10.0, 15.0};
}

void Metrics::increment(const std::string& counter, uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counter] += value;
}

void Metrics::session_opened() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++active_sessions_;
}

void Metrics::session_closed() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_sessions_ > 0) {
        --active_sessions_;
    }
}

void Metrics::observe_backend_latency(const std::string& backend, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = latency_histograms_[backend];
    if (histogram.buckets.empty()) {
        histogram.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;

    auto& summary = latency_summaries_[backend];
    summary.count += 1;
    summary.sum += seconds;
}

uint64_t Metrics::counter_value(const std::string& counter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counter);
    return it == counters_.end() ? 0 : it->second;
}

int64_t Metrics::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_sessions_;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    for (const auto& [name, value] : counters_) {
        out << "# TYPE voice_bridge_" << name << "_total counter\n";
        out << "voice_bridge_" << name << "_total " << value << "\n";
    }

    out << "# HELP voice_bridge_active_sessions Media sessions currently attached\n";
    out << "# TYPE voice_bridge_active_sessions gauge\n";
    out << "voice_bridge_active_sessions " << active_sessions_ << "\n";

    out << "# HELP voice_bridge_backend_latency_summary Time elapsed per backend call\n";
    out << "# TYPE voice_bridge_backend_latency_summary summary\n";
    for (const auto& [backend, series] : latency_summaries_) {
        out << "voice_bridge_backend_latency_summary_count{backend=\"" << backend << "\"} "
            << series.count << "\n";
        out << "voice_bridge_backend_latency_summary_sum{backend=\"" << backend << "\"} "
            << series.sum << "\n";
    }

    out << "# HELP voice_bridge_backend_latency_seconds Backend latency in seconds\n";
    out << "# TYPE voice_bridge_backend_latency_seconds histogram\n";
    for (const auto& [backend, series] : latency_histograms_) {
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "voice_bridge_backend_latency_seconds_bucket{backend=\"" << backend
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "voice_bridge_backend_latency_seconds_bucket{backend=\"" << backend
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "voice_bridge_backend_latency_seconds_count{backend=\"" << backend << "\"} "
            << series.count << "\n";
        out << "voice_bridge_backend_latency_seconds_sum{backend=\"" << backend << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
