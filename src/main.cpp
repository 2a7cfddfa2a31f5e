#include "gmailup/delegate.hpp"
#include "gmailup/gmail.hpp"
#include "gmailup/log.hpp"
#include "gmailup/media_source.hpp"
#include "gmailup/metrics.hpp"
#include "gmailup/net/http.hpp"
#include "gmailup/session_store.hpp"
#include "gmailup/token_provider.hpp"
#include "gmailup/upload_config.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

// Stops a resumable transfer between chunks and suppresses retries once
// SIGINT/SIGTERM arrives. The session URL stays stored for a later run.
class InterruptDelegate : public gmailup::ForwardingDelegate {
public:
    using ForwardingDelegate::ForwardingDelegate;

    gmailup::Retry http_error(const gmailup::net::HttpResponse& response) override {
        auto retry = inner_.http_error(response);
        return g_shutdown_requested ? gmailup::Retry::abort() : retry;
    }

    gmailup::Retry http_failure(const gmailup::net::HttpResponse& response,
                                const std::optional<gmailup::ErrorResponse>& err) override {
        auto retry = inner_.http_failure(response, err);
        return g_shutdown_requested ? gmailup::Retry::abort() : retry;
    }

    bool cancel_chunk_upload(const gmailup::ContentRange& next) override {
        if (g_shutdown_requested) return true;
        return inner_.cancel_chunk_upload(next);
    }
};

const char* method_id_for(const std::string& operation) {
    if (operation == "insert") return "gmail.users.messages.insert";
    if (operation == "import") return "gmail.users.messages.import";
    if (operation == "draft-create") return "gmail.users.drafts.create";
    if (operation == "draft-update") return "gmail.users.drafts.update";
    return "gmail.users.messages.send";
}

void print_message(const gmailup::Message& m) {
    std::cout << "  id: " << m.id.value_or("") << std::endl;
    std::cout << "  thread-id: " << m.thread_id.value_or("") << std::endl;
    if (m.label_ids) {
        std::cout << "  labels:";
        for (const auto& l : *m.label_ids) std::cout << " " << l;
        std::cout << std::endl;
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = gmailup::UploadConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    gmailup::set_verbose_logging(config.verbose);

    std::cout << "gmail-upload starting..." << std::endl;
    std::cout << "  operation: " << config.operation << std::endl;
    std::cout << "  protocol: " << config.protocol << std::endl;
    std::cout << "  message: " << config.message_file << std::endl;
    std::cout << "  user-id: " << config.user_id << std::endl;
    std::cout << "  root-url: " << config.root_url << std::endl;
    if (!config.access_token.empty()) {
        // Mask secrets in log output
        std::cout << "  access-token: ****" << std::endl;
    } else if (!config.credentials_file.empty()) {
        std::cout << "  credentials-file: " << config.credentials_file << std::endl;
        if (!config.subject.empty()) {
            std::cout << "  subject: " << config.subject << std::endl;
        }
    } else {
        std::cout << "  auth: none" << std::endl;
    }
    if (!config.session_db.empty()) {
        std::cout << "  session-db: " << config.session_db << std::endl;
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    gmailup::net::HttpClientConfig http_config;
    http_config.user_agent = config.user_agent;
    http_config.proxy_url = config.proxy_url;
    http_config.ca_bundle = config.ca_bundle;
    http_config.verify_ssl = config.verify_ssl;
    http_config.verbose = config.verbose;
    http_config.default_total_timeout = std::chrono::seconds(config.request_timeout_secs);
    gmailup::net::HttpClient client(http_config);

    std::unique_ptr<gmailup::TokenProvider> tokens;
    if (!config.access_token.empty()) {
        tokens = std::make_unique<gmailup::StaticTokenProvider>(config.access_token);
    } else if (config.no_auth) {
        tokens = std::make_unique<gmailup::NoTokenProvider>();
    } else {
        std::string key_err;
        auto key = gmailup::ServiceAccountKey::from_file(config.credentials_file, key_err);
        if (!key) {
            std::cerr << "Failed to load credentials: " << key_err << std::endl;
            return 1;
        }
        tokens = std::make_unique<gmailup::ServiceAccountTokenProvider>(
            client, std::move(*key), config.subject);
    }

    gmailup::FileMediaSource media;
    err = media.open(config.message_file);
    if (!err.empty()) {
        std::cerr << "Failed to open message: " << err << std::endl;
        return 1;
    }
    auto media_size = gmailup::measure_length(media);
    if (!media_size) {
        std::cerr << "Failed to determine size of " << config.message_file << std::endl;
        return 1;
    }
    std::cout << "  size: " << *media_size << " bytes" << std::endl;

    auto protocol = config.protocol == "resumable" ? gmailup::UploadProtocol::Resumable
                                                   : gmailup::UploadProtocol::Simple;

    // Delegate chain: backoff <- session persistence <- interrupt <- metrics
    gmailup::BackoffPolicy policy;
    policy.max_retries = config.max_retries;
    policy.initial_delay = std::chrono::milliseconds(config.initial_retry_delay_ms);
    policy.max_delay = std::chrono::milliseconds(config.max_retry_delay_ms);
    policy.chunk_size = config.chunk_size;
    err = policy.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << std::endl;
        return 1;
    }
    gmailup::BackoffDelegate backoff(policy);
    gmailup::Delegate* delegate = &backoff;

    gmailup::SessionStore sessions;
    std::unique_ptr<gmailup::PersistentSessionDelegate> persistent;
    if (!config.session_db.empty() && protocol == gmailup::UploadProtocol::Resumable) {
        err = sessions.open(config.session_db);
        if (!err.empty()) {
            std::cerr << "Failed to open session store: " << err << std::endl;
            return 1;
        }
        std::error_code ec;
        auto canonical = std::filesystem::weakly_canonical(config.message_file, ec);
        std::string media_id = ec ? config.message_file.string() : canonical.string();
        persistent = std::make_unique<gmailup::PersistentSessionDelegate>(
            *delegate, sessions,
            gmailup::make_session_key(method_id_for(config.operation), media_id, *media_size),
            *media_size);
        delegate = persistent.get();
    }

    InterruptDelegate interrupt(*delegate);
    delegate = &interrupt;

    std::unique_ptr<gmailup::MetricsExporter> metrics;
    std::unique_ptr<gmailup::MetricsDelegate> metrics_delegate;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<gmailup::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"operation", config.operation}});
        metrics->start();
        metrics_delegate = std::make_unique<gmailup::MetricsDelegate>(*delegate, *metrics, *media_size);
        delegate = metrics_delegate.get();
    }

    gmailup::GmailOptions options;
    options.root_url = config.root_url;
    options.user_agent = config.user_agent;
    options.refresh_token_per_chunk = config.refresh_token_per_chunk;
    gmailup::Gmail gmail(client, *tokens, options);

    gmailup::Message message;
    if (!config.thread_id.empty()) message.thread_id = config.thread_id;
    if (!config.label_ids.empty()) message.label_ids = config.label_ids;

    std::optional<gmailup::UploadError> failure;
    if (config.operation == "draft-create" || config.operation == "draft-update") {
        gmailup::Draft draft;
        draft.message = message;
        gmailup::UploadOutcome<gmailup::Draft> outcome;
        if (config.operation == "draft-create") {
            gmailup::DraftsCreateCall call;
            call.request = draft;
            call.user_id = config.user_id;
            call.scopes = config.scopes;
            outcome = gmail.drafts_create(call, media, config.mime_type, protocol, *delegate);
        } else {
            gmailup::DraftsUpdateCall call;
            call.request = draft;
            call.user_id = config.user_id;
            call.id = config.draft_id;
            call.scopes = config.scopes;
            outcome = gmail.drafts_update(call, media, config.mime_type, protocol, *delegate);
        }
        if (outcome.ok()) {
            std::cout << "Draft " << outcome.value.id.value_or("") << " saved" << std::endl;
            if (outcome.value.message) print_message(*outcome.value.message);
        } else {
            failure = std::move(outcome.error);
        }
    } else {
        gmailup::UploadOutcome<gmailup::Message> outcome;
        if (config.operation == "send") {
            gmailup::MessagesSendCall call;
            call.request = message;
            call.user_id = config.user_id;
            call.scopes = config.scopes;
            outcome = gmail.messages_send(call, media, config.mime_type, protocol, *delegate);
        } else if (config.operation == "insert") {
            gmailup::MessagesInsertCall call;
            call.request = message;
            call.user_id = config.user_id;
            call.scopes = config.scopes;
            if (!config.internal_date_source.empty())
                call.internal_date_source = config.internal_date_source;
            call.deleted = config.deleted;
            outcome = gmail.messages_insert(call, media, config.mime_type, protocol, *delegate);
        } else {
            gmailup::MessagesImportCall call;
            call.request = message;
            call.user_id = config.user_id;
            call.scopes = config.scopes;
            if (!config.internal_date_source.empty())
                call.internal_date_source = config.internal_date_source;
            call.never_mark_spam = config.never_mark_spam;
            call.process_for_calendar = config.process_for_calendar;
            call.deleted = config.deleted;
            outcome = gmail.messages_import(call, media, config.mime_type, protocol, *delegate);
        }
        if (outcome.ok()) {
            std::cout << "Message uploaded" << std::endl;
            print_message(outcome.value);
        } else {
            failure = std::move(outcome.error);
        }
    }

    if (metrics) {
        metrics->stop();
    }

    if (failure) {
        gmailup::log_error("%s failed: %s", config.operation.c_str(), failure->to_string().c_str());
        if (g_shutdown_requested && persistent) {
            std::cerr << "Interrupted; rerun with the same --session-db to resume" << std::endl;
        }
        return 1;
    }
    return 0;
}
