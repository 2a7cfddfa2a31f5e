#pragma once

#include "gmailup/constants.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gmailup {

/// Configuration for the gmail-upload command line tool.
struct UploadConfig {
    // What to upload
    std::string operation = "send";  // send, insert, import, draft-create, draft-update
    std::filesystem::path message_file;
    std::string mime_type = constants::DEFAULT_MESSAGE_MIME;
    std::string protocol = "simple";  // simple, resumable

    // Call parameters
    std::string user_id = "me";
    std::string draft_id;  // draft-update only
    std::string thread_id;
    std::vector<std::string> label_ids;
    std::string internal_date_source;  // insert/import: receivedTime | dateHeader
    std::optional<bool> never_mark_spam;
    std::optional<bool> process_for_calendar;
    std::optional<bool> deleted;
    std::vector<std::string> scopes;  // empty = https://mail.google.com/

    // Authentication (one of access_token, credentials_file, or no_auth)
    std::string access_token;
    std::filesystem::path credentials_file;  // Service account JSON (or GMAILUP_CREDENTIALS env)
    std::string subject;                     // Impersonated user (domain-wide delegation)
    bool no_auth = false;
    bool refresh_token_per_chunk = false;

    // Endpoint / HTTP
    std::string root_url = constants::DEFAULT_ROOT_URL;
    std::string user_agent = "gmail-upload/1.0";
    std::string proxy_url;
    std::string ca_bundle;
    bool verify_ssl = true;
    size_t request_timeout_secs = 300;

    // Retry policy and chunking
    int max_retries = constants::DEFAULT_MAX_RETRIES;
    size_t initial_retry_delay_ms = constants::DEFAULT_INITIAL_RETRY_DELAY_MS;
    size_t max_retry_delay_ms = constants::DEFAULT_MAX_RETRY_DELAY_MS;
    uint64_t chunk_size = constants::DEFAULT_BACKOFF_CHUNK_SIZE;

    // Resumable session persistence (empty = disabled)
    std::filesystem::path session_db;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    bool verbose = false;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<UploadConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in GMAILUP_CREDENTIALS and GMAILUP_USER_AGENT from the environment
    /// where not set explicitly. GMAILUP_REQUEST_TIMEOUT is read by HttpClient.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace gmailup
