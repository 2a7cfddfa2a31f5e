#include "gmailup/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace gmailup {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("gmailup_uploads_total")
        .Help("Total upload calls finished")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("gmailup_upload_bytes_total")
        .Help("Total media bytes of successful uploads")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    http_requests_total_ = &prometheus::BuildCounter()
        .Name("gmailup_http_requests_total")
        .Help("Total HTTP requests sent, chunks included")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& errors_family = prometheus::BuildCounter()
        .Name("gmailup_http_errors_total")
        .Help("Total failed HTTP exchanges")
        .Labels(labels)
        .Register(*registry_);
    transport_errors_ = &errors_family.Add({{"type", "transport"}});
    status_errors_ = &errors_family.Add({{"type", "status"}});

    retries_total_ = &prometheus::BuildCounter()
        .Name("gmailup_retries_total")
        .Help("Total attempts repeated after a delegate retry decision")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    chunks_acknowledged_ = &prometheus::BuildCounter()
        .Name("gmailup_chunks_acknowledged_total")
        .Help("Total resumable chunks acknowledged with resume-incomplete")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    sessions_resumed_ = &prometheus::BuildCounter()
        .Name("gmailup_sessions_resumed_total")
        .Help("Total resumable transfers continued from a stored session URL")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    uploads_in_flight_ = &prometheus::BuildGauge()
        .Name("gmailup_uploads_in_flight")
        .Help("Upload calls currently running")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("gmailup_upload_duration_seconds")
        .Help("Upload call duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

std::string MetricsExporter::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

// ============================================================================
// MetricsDelegate
// ============================================================================

MetricsDelegate::MetricsDelegate(Delegate& inner, MetricsExporter& metrics, uint64_t media_size)
    : ForwardingDelegate(inner)
    , metrics_(metrics)
    , media_size_(media_size) {}

void MetricsDelegate::begin(const MethodInfo& info) {
    metrics_.uploads_in_flight().Increment();
    timer_.emplace(metrics_.upload_duration());
    inner_.begin(info);
}

void MetricsDelegate::pre_request() {
    metrics_.http_requests_total().Increment();
    inner_.pre_request();
}

Retry MetricsDelegate::http_error(const net::HttpResponse& response) {
    metrics_.transport_errors().Increment();
    auto retry = inner_.http_error(response);
    if (!retry.is_abort()) metrics_.retries_total().Increment();
    return retry;
}

Retry MetricsDelegate::http_failure(const net::HttpResponse& response,
                                    const std::optional<ErrorResponse>& err) {
    metrics_.status_errors().Increment();
    auto retry = inner_.http_failure(response, err);
    if (!retry.is_abort()) metrics_.retries_total().Increment();
    return retry;
}

std::optional<std::string> MetricsDelegate::upload_url() {
    auto url = inner_.upload_url();
    if (url) metrics_.sessions_resumed().Increment();
    return url;
}

bool MetricsDelegate::cancel_chunk_upload(const ContentRange& next) {
    metrics_.chunks_acknowledged().Increment();
    return inner_.cancel_chunk_upload(next);
}

void MetricsDelegate::finished(bool success) {
    if (success) {
        metrics_.uploads_success().Increment();
        metrics_.upload_bytes_total().Increment(static_cast<double>(media_size_));
    } else {
        metrics_.uploads_failure().Increment();
    }
    timer_.reset();
    metrics_.uploads_in_flight().Decrement();
    inner_.finished(success);
}

}  // namespace gmailup
