#pragma once

#include "gmailup/delegate.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace gmailup {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports upload metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename. With an empty path nothing is written and the registry can
/// still be read through serialize().
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file (may be empty).
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Prometheus text exposition of the current registry.
    std::string serialize() const;

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& http_requests_total() { return *http_requests_total_; }
    prometheus::Counter& transport_errors() { return *transport_errors_; }
    prometheus::Counter& status_errors() { return *status_errors_; }
    prometheus::Counter& retries_total() { return *retries_total_; }
    prometheus::Counter& chunks_acknowledged() { return *chunks_acknowledged_; }
    prometheus::Counter& sessions_resumed() { return *sessions_resumed_; }

    // --- Gauge accessors ---
    prometheus::Gauge& uploads_in_flight() { return *uploads_in_flight_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* http_requests_total_;
    prometheus::Counter* transport_errors_;
    prometheus::Counter* status_errors_;
    prometheus::Counter* retries_total_;
    prometheus::Counter* chunks_acknowledged_;
    prometheus::Counter* sessions_resumed_;

    // --- Gauges ---
    prometheus::Gauge* uploads_in_flight_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

/// Records an upload call into a MetricsExporter and forwards every hook to
/// the wrapped delegate.
class MetricsDelegate : public ForwardingDelegate {
public:
    /// @param media_size  Bytes added to the byte counter when the call succeeds.
    MetricsDelegate(Delegate& inner, MetricsExporter& metrics, uint64_t media_size);

    void begin(const MethodInfo& info) override;
    void pre_request() override;
    Retry http_error(const net::HttpResponse& response) override;
    Retry http_failure(const net::HttpResponse& response,
                       const std::optional<ErrorResponse>& err) override;
    std::optional<std::string> upload_url() override;
    bool cancel_chunk_upload(const ContentRange& next) override;
    void finished(bool success) override;

private:
    MetricsExporter& metrics_;
    uint64_t media_size_;
    std::optional<ScopedTimer> timer_;
};

}  // namespace gmailup
