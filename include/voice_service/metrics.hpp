#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace voice_service {

class Metrics {
public:
    static Metrics& instance();

    void increment_request(const std::string& route);
    void increment_error(const std::string& kind);
    void increment_speech_ended();
    void set_active_sessions(std::size_t count);
    void observe_response_time(const std::string& route, double seconds);
    void observe_classifier_latency(double seconds);
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    void observe(HistogramSeries& series, double seconds);
    void render_histogram(std::ostringstream& out,
                          const std::string& name,
                          const std::string& labels,
                          const HistogramSeries& series) const;

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> requests_;
    std::map<std::string, uint64_t> errors_;
    uint64_t speech_ended_total_ = 0;
    std::size_t active_sessions_ = 0;
    std::map<std::string, HistogramSeries> response_histograms_;
    HistogramSeries classifier_histogram_;
    std::vector<double> histogram_bounds_;
};

}
