#include "voice_service/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voice_service {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1,
                         0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
    classifier_histogram_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

void Metrics::increment_request(const std::string& route) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++requests_[route];
}

void Metrics::increment_error(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++errors_[kind];
}

void Metrics::increment_speech_ended() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++speech_ended_total_;
}

void Metrics::set_active_sessions(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_sessions_ = count;
}

void Metrics::observe(HistogramSeries& series, double seconds) {
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    series.count += 1;
    series.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            series.buckets[i] += 1;
        }
    }
    series.buckets.back() += 1;
}

void Metrics::observe_response_time(const std::string& route, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    observe(response_histograms_[route], seconds);
}

void Metrics::observe_classifier_latency(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    observe(classifier_histogram_, seconds);
}

void Metrics::render_histogram(std::ostringstream& out,
                               const std::string& name,
                               const std::string& labels,
                               const HistogramSeries& series) const {
    const std::string prefix = labels.empty() ? "" : labels + ",";
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out << name << "_bucket{" << prefix << "le=\"" << histogram_bounds_[i] << "\"} "
            << (series.buckets.empty() ? 0 : series.buckets[i]) << "\n";
    }
    out << name << "_bucket{" << prefix << "le=\"+Inf\"} "
        << (series.buckets.empty() ? 0 : series.buckets.back()) << "\n";
    const std::string suffix = labels.empty() ? "" : "{" + labels + "}";
    out << name << "_count" << suffix << " " << series.count << "\n";
    out << name << "_sum" << suffix << " " << series.sum << "\n";
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP voice_requests_total Total number of handled requests\n";
    out << "# TYPE voice_requests_total counter\n";
    for (const auto& [route, count] : requests_) {
        out << "voice_requests_total{route=\"" << route << "\"} " << count << "\n";
    }

    out << "# HELP voice_errors_total Failed requests by error kind\n";
    out << "# TYPE voice_errors_total counter\n";
    for (const auto& [kind, count] : errors_) {
        out << "voice_errors_total{kind=\"" << kind << "\"} " << count << "\n";
    }

    out << "# HELP vad_sessions_active Live streaming VAD sessions\n";
    out << "# TYPE vad_sessions_active gauge\n";
    out << "vad_sessions_active " << active_sessions_ << "\n";

    out << "# HELP vad_speech_ended_total End-of-utterance events emitted\n";
    out << "# TYPE vad_speech_ended_total counter\n";
    out << "vad_speech_ended_total " << speech_ended_total_ << "\n";

    out << "# HELP voice_response_time_seconds Request handling time\n";
    out << "# TYPE voice_response_time_seconds histogram\n";
    for (const auto& [route, series] : response_histograms_) {
        render_histogram(out, "voice_response_time_seconds",
                         "route=\"" + route + "\"", series);
    }

    out << "# HELP vad_classifier_latency_seconds Frame classification time\n";
    out << "# TYPE vad_classifier_latency_seconds histogram\n";
    render_histogram(out, "vad_classifier_latency_seconds", "", classifier_histogram_);

    return out.str();
}

}
