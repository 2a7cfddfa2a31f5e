#include "gmailup/delegate.hpp"
#include "gmailup/log.hpp"

#include <algorithm>
#include <cmath>

namespace gmailup {

std::string ContentRange::to_header_value() const {
    std::string value = "bytes ";
    if (range) {
        value += std::to_string(range->first) + "-" + std::to_string(range->last);
    } else {
        value += "*";
    }
    value += "/" + std::to_string(total);
    return value;
}

// ============================================================================
// BackoffDelegate
// ============================================================================

std::string BackoffPolicy::validate() const {
    if (max_retries < 0) {
        return "max_retries must be >= 0";
    }
    if (initial_delay.count() < 0 || max_delay.count() < 0) {
        return "retry delays must be >= 0";
    }
    if (multiplier < 1.0) {
        return "backoff multiplier must be >= 1.0";
    }
    return {};
}

BackoffDelegate::BackoffDelegate(const BackoffPolicy& policy)
    : policy_(policy) {}

void BackoffDelegate::begin(const MethodInfo& info) {
    method_id_ = info.id;
    attempts_ = 0;
}

Retry BackoffDelegate::http_error(const net::HttpResponse& response) {
    log_debug("%s: transport error: %s", method_id_.c_str(), response.error.c_str());
    return next_delay("transport error", 0);
}

Retry BackoffDelegate::http_failure(const net::HttpResponse& response,
                                    const std::optional<ErrorResponse>& err) {
    (void)err;
    if (!net::is_retryable_status(response.status_code)) {
        return Retry::abort();
    }
    return next_delay("HTTP", response.status_code);
}

uint64_t BackoffDelegate::chunk_size() {
    if (policy_.chunk_size == 0) return 0;
    uint64_t g = constants::RESUMABLE_CHUNK_GRANULARITY;
    return ((policy_.chunk_size + g - 1) / g) * g;
}

Retry BackoffDelegate::next_delay(const char* what, int status) {
    if (attempts_ >= policy_.max_retries) {
        log_error("%s: giving up after %d retries", method_id_.c_str(), attempts_);
        return Retry::abort();
    }
    double factor = std::pow(policy_.multiplier, attempts_);
    auto delay_ms = static_cast<int64_t>(policy_.initial_delay.count() * factor);
    delay_ms = std::min<int64_t>(delay_ms, policy_.max_delay.count());
    ++attempts_;

    if (status > 0) {
        log_info("%s: %s %d, retry %d/%d in %lld ms", method_id_.c_str(), what, status,
                 attempts_, policy_.max_retries, static_cast<long long>(delay_ms));
    } else {
        log_info("%s: %s, retry %d/%d in %lld ms", method_id_.c_str(), what,
                 attempts_, policy_.max_retries, static_cast<long long>(delay_ms));
    }
    return Retry::after(std::chrono::milliseconds(delay_ms));
}

}  // namespace gmailup
