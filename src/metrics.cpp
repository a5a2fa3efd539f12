#include "call_core/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace call_core {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.005, 0.01, 0.025, 0.05, 0.075, 0.1, 0.25, 0.5,
                         0.75, 1.0, 2.5, 5.0, 7.5, 10.0};
    peek_latency_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

void Metrics::increment_transition(const std::string& event, bool changed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = transitions_[event];
    if (changed) {
        ++series.applied;
    } else {
        ++series.unchanged;
    }
}

void Metrics::increment_stale_event(const std::string& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stale_events_[event];
}

void Metrics::increment_peek_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++peek_requests_total_;
}

void Metrics::increment_peek_issued() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++peek_issued_total_;
}

void Metrics::increment_peek_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++peek_failures_total_;
}

void Metrics::increment_peek_discarded() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++peek_discarded_total_;
}

void Metrics::observe_peek_latency(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    peek_latency_.count += 1;
    peek_latency_.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            peek_latency_.buckets[i] += 1;
        }
    }
    peek_latency_.buckets.back() += 1;
}

uint64_t Metrics::peek_issued_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peek_issued_total_;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    transitions_.clear();
    stale_events_.clear();
    peek_requests_total_ = 0;
    peek_issued_total_ = 0;
    peek_failures_total_ = 0;
    peek_discarded_total_ = 0;
    peek_latency_.count = 0;
    peek_latency_.sum = 0.0;
    peek_latency_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP call_store_transitions_total Store events by outcome\n";
    out << "# TYPE call_store_transitions_total counter\n";
    for (const auto& item : transitions_) {
        out << "call_store_transitions_total{event=\"" << item.first
            << "\",outcome=\"applied\"} " << item.second.applied << "\n";
        out << "call_store_transitions_total{event=\"" << item.first
            << "\",outcome=\"unchanged\"} " << item.second.unchanged << "\n";
    }

    out << "# HELP call_store_stale_events_total Events referencing a missing or mismatched call\n";
    out << "# TYPE call_store_stale_events_total counter\n";
    for (const auto& item : stale_events_) {
        out << "call_store_stale_events_total{event=\"" << item.first << "\"} "
            << item.second << "\n";
    }

    out << "# HELP peek_requests_total Peek refreshes requested\n";
    out << "# TYPE peek_requests_total counter\n";
    out << "peek_requests_total " << peek_requests_total_ << "\n";
    out << "# HELP peek_issued_total Peek calls sent to the calling service\n";
    out << "# TYPE peek_issued_total counter\n";
    out << "peek_issued_total " << peek_issued_total_ << "\n";
    out << "# HELP peek_failures_total Peek calls that failed\n";
    out << "# TYPE peek_failures_total counter\n";
    out << "peek_failures_total " << peek_failures_total_ << "\n";
    out << "# HELP peek_discarded_total Peeks skipped because the call had connected\n";
    out << "# TYPE peek_discarded_total counter\n";
    out << "peek_discarded_total " << peek_discarded_total_ << "\n";

    out << "# HELP peek_latency_seconds Peek round-trip time\n";
    out << "# TYPE peek_latency_seconds histogram\n";
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out << "peek_latency_seconds_bucket{le=\"" << histogram_bounds_[i] << "\"} "
            << peek_latency_.buckets[i] << "\n";
    }
    out << "peek_latency_seconds_bucket{le=\"+Inf\"} " << peek_latency_.buckets.back() << "\n";
    out << "peek_latency_seconds_count " << peek_latency_.count << "\n";
    out << "peek_latency_seconds_sum " << peek_latency_.sum << "\n";

    return out.str();
}

}
