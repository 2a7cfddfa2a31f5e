#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gmailup::net {

// HTTP methods
enum class HttpMethod {
    POST,
    PUT
};

// Status codes the upload protocol cares about
enum class HttpStatus {
    OK = 200,
    Created = 201,
    PermanentRedirect = 308,  // "Resume Incomplete" in the resumable protocol
    BadRequest = 400,
    Unauthorized = 401,
    NotFound = 404,
    Gone = 410,
    PayloadTooLarge = 413,
    TooManyRequests = 429,
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504
};

bool is_success_status(int status);
bool is_resume_incomplete_status(int status);
bool is_retryable_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_bearer_token(const std::string& token);

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

struct HttpRequest {
    HttpMethod method = HttpMethod::POST;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};

    // Upload sessions answer with 308 and must not be chased by the client
    bool follow_redirects = false;

    static HttpRequest post(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);

    void set_json_body(const std::string& json);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return !is_network_error && is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if no HTTP response was received
};

// HTTP client configuration
// Timeouts can be overridden via GMAILUP_REQUEST_TIMEOUT (seconds).
struct HttpClientConfig {
    size_t max_idle_handles = 8;

    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    std::chrono::milliseconds default_connect_timeout{30000};
    std::chrono::milliseconds default_total_timeout{300000};

    // Response size limit (0 = unlimited)
    size_t max_response_size = 16 * 1024 * 1024;

    bool verify_ssl = true;
    std::string ca_bundle;

    std::string user_agent = "gmail-upload/1.0";

    std::string proxy_url;  // Empty = no proxy

    bool verbose = false;
};

// Anything that can carry one HTTP exchange. The upload engine only talks to
// this interface so tests can script the server side.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Never throws. Transport failures come back with is_network_error set.
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

// libcurl-backed transport with a small pool of reusable easy handles
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    HttpResponse execute(const HttpRequest& request) override;

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Percent-encoding for query names and values
std::string url_encode(const std::string& str);

// Join query parameters onto a URL, encoding names and values
std::string append_query(const std::string& url,
                         const std::vector<std::pair<std::string, std::string>>& params);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64url_encode(const std::vector<uint8_t>& data);  // no padding

} // namespace gmailup::net
