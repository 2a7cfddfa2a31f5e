#pragma once

#include "gmailup/constants.hpp"
#include "gmailup/errors.hpp"
#include "gmailup/net/http.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gmailup {

/// Decision returned by the delegate after a failed attempt.
class Retry {
public:
    static Retry abort() { return Retry(false, std::chrono::milliseconds{0}); }
    static Retry after(std::chrono::milliseconds delay) { return Retry(true, delay); }

    bool is_abort() const { return !retry_; }
    std::chrono::milliseconds delay() const { return delay_; }

private:
    Retry(bool retry, std::chrono::milliseconds delay) : retry_(retry), delay_(delay) {}

    bool retry_;
    std::chrono::milliseconds delay_;
};

/// Identifies the API method a call belongs to.
struct MethodInfo {
    std::string id;  // e.g. "gmail.users.messages.send"
    net::HttpMethod http_method = net::HttpMethod::POST;
};

/// Inclusive byte range of the media.
struct Chunk {
    uint64_t first = 0;
    uint64_t last = 0;

    uint64_t size() const { return last - first + 1; }
};

/// Value of a Content-Range header: "bytes first-last/total" or "bytes */total".
struct ContentRange {
    std::optional<Chunk> range;
    uint64_t total = 0;

    std::string to_header_value() const;
};

/// Policy object consulted at fixed points of an upload call.
///
/// Every hook has a default that makes the call fail fast: no retries, no
/// cached session URL, no chunk size preference, never cancel. A delegate is
/// borrowed by the call and never owned.
class Delegate {
public:
    virtual ~Delegate() = default;

    /// Called once when the call starts.
    virtual void begin(const MethodInfo& info) { (void)info; }

    /// Called before every physical request, chunks included.
    virtual void pre_request() {}

    /// Token acquisition failed with `error`. Return a substitute token, or
    /// nullopt to end the call with MissingToken.
    virtual std::optional<std::string> token(const std::string& error) {
        (void)error;
        return std::nullopt;
    }

    /// No HTTP response was received.
    virtual Retry http_error(const net::HttpResponse& response) {
        (void)response;
        return Retry::abort();
    }

    /// A non-2xx response was received. `err` is set when the body carried a
    /// structured error.
    virtual Retry http_failure(const net::HttpResponse& response,
                               const std::optional<ErrorResponse>& err) {
        (void)response;
        (void)err;
        return Retry::abort();
    }

    /// Session URL of an earlier, interrupted resumable transfer, if known.
    virtual std::optional<std::string> upload_url() { return std::nullopt; }

    /// Offset to resume at when upload_url() returned a URL. nullopt makes
    /// the engine ask the server.
    virtual std::optional<uint64_t> resume_offset() { return std::nullopt; }

    /// Remember (or, with nullopt, forget) the current session URL.
    virtual void store_upload_url(const std::optional<std::string>& url) { (void)url; }

    /// Asked after every "resume incomplete" response with the range still
    /// to send. Return true to stop the transfer.
    virtual bool cancel_chunk_upload(const ContentRange& next) {
        (void)next;
        return false;
    }

    /// Bytes per chunk. 0 sends the whole remainder in one request.
    virtual uint64_t chunk_size() { return 0; }

    virtual void response_json_decode_error(const std::string& body, const std::string& error) {
        (void)body;
        (void)error;
    }

    /// Called exactly once when the call ends.
    virtual void finished(bool success) { (void)success; }
};

/// Fail-fast delegate.
class DefaultDelegate : public Delegate {};

/// Passes every hook through to an inner delegate. Base for decorators.
class ForwardingDelegate : public Delegate {
public:
    explicit ForwardingDelegate(Delegate& inner) : inner_(inner) {}

    void begin(const MethodInfo& info) override { inner_.begin(info); }
    void pre_request() override { inner_.pre_request(); }
    std::optional<std::string> token(const std::string& error) override {
        return inner_.token(error);
    }
    Retry http_error(const net::HttpResponse& response) override {
        return inner_.http_error(response);
    }
    Retry http_failure(const net::HttpResponse& response,
                       const std::optional<ErrorResponse>& err) override {
        return inner_.http_failure(response, err);
    }
    std::optional<std::string> upload_url() override { return inner_.upload_url(); }
    std::optional<uint64_t> resume_offset() override { return inner_.resume_offset(); }
    void store_upload_url(const std::optional<std::string>& url) override {
        inner_.store_upload_url(url);
    }
    bool cancel_chunk_upload(const ContentRange& next) override {
        return inner_.cancel_chunk_upload(next);
    }
    uint64_t chunk_size() override { return inner_.chunk_size(); }
    void response_json_decode_error(const std::string& body, const std::string& error) override {
        inner_.response_json_decode_error(body, error);
    }
    void finished(bool success) override { inner_.finished(success); }

protected:
    Delegate& inner_;
};

struct BackoffPolicy {
    int max_retries = constants::DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds initial_delay{constants::DEFAULT_INITIAL_RETRY_DELAY_MS};
    double multiplier = constants::DEFAULT_RETRY_BACKOFF_MULTIPLIER;
    std::chrono::milliseconds max_delay{constants::DEFAULT_MAX_RETRY_DELAY_MS};

    // 0 = whole remainder; otherwise rounded up to 256 KiB
    uint64_t chunk_size = constants::DEFAULT_BACKOFF_CHUNK_SIZE;

    /// Returns error message on invalid policy, empty string on success.
    std::string validate() const;
};

/// Retries transport errors and retryable statuses (429, 500, 502-504) with
/// exponential backoff, up to `max_retries` per call.
class BackoffDelegate : public Delegate {
public:
    explicit BackoffDelegate(const BackoffPolicy& policy = {});

    void begin(const MethodInfo& info) override;
    Retry http_error(const net::HttpResponse& response) override;
    Retry http_failure(const net::HttpResponse& response,
                       const std::optional<ErrorResponse>& err) override;
    uint64_t chunk_size() override;

    int attempts() const { return attempts_; }

private:
    Retry next_delay(const char* what, int status);

    BackoffPolicy policy_;
    std::string method_id_;
    int attempts_ = 0;
};

}  // namespace gmailup
