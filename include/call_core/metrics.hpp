#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace call_core {

class Metrics {
public:
    static Metrics& instance();

    void increment_transition(const std::string& event, bool changed);
    void increment_stale_event(const std::string& event);
    void increment_peek_request();
    void increment_peek_issued();
    void increment_peek_failure();
    void increment_peek_discarded();
    void observe_peek_latency(double seconds);

    uint64_t peek_issued_total() const;
    std::string render_prometheus() const;
    void reset();

private:
    struct TransitionSeries {
        uint64_t applied = 0;
        uint64_t unchanged = 0;
    };

    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    std::map<std::string, TransitionSeries> transitions_;
    std::map<std::string, uint64_t> stale_events_;
    uint64_t peek_requests_total_ = 0;
    uint64_t peek_issued_total_ = 0;
    uint64_t peek_failures_total_ = 0;
    uint64_t peek_discarded_total_ = 0;
    HistogramSeries peek_latency_;
    std::vector<double> histogram_bounds_;
};

}
