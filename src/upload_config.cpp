#include "gmailup/upload_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace gmailup {

namespace {

const char* const OPERATIONS[] = {"send", "insert", "import", "draft-create", "draft-update"};

bool is_known_operation(const std::string& op) {
    for (const char* known : OPERATIONS) {
        if (op == known) return true;
    }
    return false;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        auto comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        if (comma > start) out.push_back(value.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

void print_usage() {
    std::cerr <<
        "Usage: gmail-upload --message <file.eml> [options]\n"
        "\n"
        "Required:\n"
        "  --message <path>                 RFC 822 message to upload\n"
        "\n"
        "Operation:\n"
        "  --operation <op>                 send, insert, import, draft-create, draft-update\n"
        "                                   (default: send)\n"
        "  --protocol <p>                   simple (multipart) or resumable (default: simple)\n"
        "  --mime-type <type>               Media type (default: message/rfc822)\n"
        "  --user-id <id>                   Mailbox owner (default: me)\n"
        "  --draft-id <id>                  Draft to replace (draft-update)\n"
        "  --thread-id <id>                 Thread the message belongs to\n"
        "  --label-ids <a,b,...>            Labels to apply (insert/import)\n"
        "  --internal-date-source <src>     receivedTime or dateHeader (insert/import)\n"
        "  --never-mark-spam                Bypass spam classification (import)\n"
        "  --process-for-calendar           Process calendar invites (import)\n"
        "  --deleted                        Mark as permanently deleted (insert/import)\n"
        "  --scopes <a,b,...>               OAuth scopes (default: https://mail.google.com/)\n"
        "\n"
        "Authentication:\n"
        "  --access-token <token>           Use a fixed bearer token\n"
        "  --credentials-file <path>        Service account JSON (or GMAILUP_CREDENTIALS env)\n"
        "  --subject <email>                Impersonate a user (domain-wide delegation)\n"
        "  --no-auth                        Send no Authorization header\n"
        "  --refresh-token-per-chunk        Fetch a token before every resumable chunk\n"
        "\n"
        "Transfer:\n"
        "  --chunk-size <bytes>             Resumable chunk size, 0 = one request\n"
        "                                   (default: 8388608)\n"
        "  --max-retries <N>                Retries per call (default: 5)\n"
        "  --retry-delay-ms <N>             Initial backoff delay (default: 1000)\n"
        "  --max-retry-delay-ms <N>         Backoff ceiling (default: 32000)\n"
        "  --session-db <path>              SQLite file for resumable session URLs\n"
        "\n"
        "HTTP:\n"
        "  --root-url <url>                 API root (default: https://gmail.googleapis.com/)\n"
        "  --user-agent <ua>                User-Agent (or GMAILUP_USER_AGENT env)\n"
        "  --proxy <url>                    HTTP proxy\n"
        "  --ca-bundle <path>               CA certificate bundle\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --timeout <secs>                 Per-request timeout (default: 300,\n"
        "                                   or GMAILUP_REQUEST_TIMEOUT env)\n"
        "\n"
        "Other:\n"
        "  --config <path>                  JSON config file\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --verbose                        Verbose output\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<UploadConfig> UploadConfig::from_args(int argc, char* argv[]) {
    UploadConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto next_number = [&](int& i, const char* name) -> std::optional<uint64_t> {
        auto* v = next_arg(i, name);
        if (!v) return std::nullopt;
        size_t used = 0;
        uint64_t n = 0;
        try {
            n = std::stoull(v, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != std::string(v).size()) {
            std::cerr << "Error: " << name << " expects a number, got '" << v << "'\n";
            return std::nullopt;
        }
        return n;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--message") {
            auto* v = next_arg(i, "--message");
            if (!v) return std::nullopt;
            config.message_file = v;
        } else if (arg == "--operation") {
            auto* v = next_arg(i, "--operation");
            if (!v) return std::nullopt;
            config.operation = v;
        } else if (arg == "--protocol") {
            auto* v = next_arg(i, "--protocol");
            if (!v) return std::nullopt;
            config.protocol = v;
        } else if (arg == "--mime-type") {
            auto* v = next_arg(i, "--mime-type");
            if (!v) return std::nullopt;
            config.mime_type = v;
        } else if (arg == "--user-id") {
            auto* v = next_arg(i, "--user-id");
            if (!v) return std::nullopt;
            config.user_id = v;
        } else if (arg == "--draft-id") {
            auto* v = next_arg(i, "--draft-id");
            if (!v) return std::nullopt;
            config.draft_id = v;
        } else if (arg == "--thread-id") {
            auto* v = next_arg(i, "--thread-id");
            if (!v) return std::nullopt;
            config.thread_id = v;
        } else if (arg == "--label-ids") {
            auto* v = next_arg(i, "--label-ids");
            if (!v) return std::nullopt;
            config.label_ids = split_list(v);
        } else if (arg == "--internal-date-source") {
            auto* v = next_arg(i, "--internal-date-source");
            if (!v) return std::nullopt;
            config.internal_date_source = v;
        } else if (arg == "--never-mark-spam") {
            config.never_mark_spam = true;
        } else if (arg == "--process-for-calendar") {
            config.process_for_calendar = true;
        } else if (arg == "--deleted") {
            config.deleted = true;
        } else if (arg == "--scopes") {
            auto* v = next_arg(i, "--scopes");
            if (!v) return std::nullopt;
            config.scopes = split_list(v);
        } else if (arg == "--access-token") {
            auto* v = next_arg(i, "--access-token");
            if (!v) return std::nullopt;
            config.access_token = v;
        } else if (arg == "--credentials-file") {
            auto* v = next_arg(i, "--credentials-file");
            if (!v) return std::nullopt;
            config.credentials_file = v;
        } else if (arg == "--subject") {
            auto* v = next_arg(i, "--subject");
            if (!v) return std::nullopt;
            config.subject = v;
        } else if (arg == "--no-auth") {
            config.no_auth = true;
        } else if (arg == "--refresh-token-per-chunk") {
            config.refresh_token_per_chunk = true;
        } else if (arg == "--chunk-size") {
            auto n = next_number(i, "--chunk-size");
            if (!n) return std::nullopt;
            config.chunk_size = *n;
        } else if (arg == "--max-retries") {
            auto n = next_number(i, "--max-retries");
            if (!n) return std::nullopt;
            config.max_retries = static_cast<int>(*n);
        } else if (arg == "--retry-delay-ms") {
            auto n = next_number(i, "--retry-delay-ms");
            if (!n) return std::nullopt;
            config.initial_retry_delay_ms = *n;
        } else if (arg == "--max-retry-delay-ms") {
            auto n = next_number(i, "--max-retry-delay-ms");
            if (!n) return std::nullopt;
            config.max_retry_delay_ms = *n;
        } else if (arg == "--session-db") {
            auto* v = next_arg(i, "--session-db");
            if (!v) return std::nullopt;
            config.session_db = v;
        } else if (arg == "--root-url") {
            auto* v = next_arg(i, "--root-url");
            if (!v) return std::nullopt;
            config.root_url = v;
        } else if (arg == "--user-agent") {
            auto* v = next_arg(i, "--user-agent");
            if (!v) return std::nullopt;
            config.user_agent = v;
        } else if (arg == "--proxy") {
            auto* v = next_arg(i, "--proxy");
            if (!v) return std::nullopt;
            config.proxy_url = v;
        } else if (arg == "--ca-bundle") {
            auto* v = next_arg(i, "--ca-bundle");
            if (!v) return std::nullopt;
            config.ca_bundle = v;
        } else if (arg == "--no-verify-ssl") {
            config.verify_ssl = false;
        } else if (arg == "--timeout") {
            auto n = next_number(i, "--timeout");
            if (!n) return std::nullopt;
            config.request_timeout_secs = *n;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto n = next_number(i, "--metrics-interval");
            if (!n) return std::nullopt;
            config.metrics_interval_secs = *n;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool UploadConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("operation")) operation = j["operation"].get<std::string>();
        if (j.contains("message")) message_file = j["message"].get<std::string>();
        if (j.contains("mime_type")) mime_type = j["mime_type"].get<std::string>();
        if (j.contains("protocol")) protocol = j["protocol"].get<std::string>();
        if (j.contains("user_id")) user_id = j["user_id"].get<std::string>();
        if (j.contains("draft_id")) draft_id = j["draft_id"].get<std::string>();
        if (j.contains("thread_id")) thread_id = j["thread_id"].get<std::string>();
        if (j.contains("label_ids")) label_ids = j["label_ids"].get<std::vector<std::string>>();
        if (j.contains("internal_date_source"))
            internal_date_source = j["internal_date_source"].get<std::string>();
        if (j.contains("never_mark_spam")) never_mark_spam = j["never_mark_spam"].get<bool>();
        if (j.contains("process_for_calendar"))
            process_for_calendar = j["process_for_calendar"].get<bool>();
        if (j.contains("deleted")) deleted = j["deleted"].get<bool>();
        if (j.contains("scopes")) scopes = j["scopes"].get<std::vector<std::string>>();
        if (j.contains("access_token")) access_token = j["access_token"].get<std::string>();
        if (j.contains("credentials_file"))
            credentials_file = j["credentials_file"].get<std::string>();
        if (j.contains("subject")) subject = j["subject"].get<std::string>();
        if (j.contains("no_auth")) no_auth = j["no_auth"].get<bool>();
        if (j.contains("refresh_token_per_chunk"))
            refresh_token_per_chunk = j["refresh_token_per_chunk"].get<bool>();
        if (j.contains("root_url")) root_url = j["root_url"].get<std::string>();
        if (j.contains("user_agent")) user_agent = j["user_agent"].get<std::string>();
        if (j.contains("proxy")) proxy_url = j["proxy"].get<std::string>();
        if (j.contains("ca_bundle")) ca_bundle = j["ca_bundle"].get<std::string>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("timeout")) request_timeout_secs = j["timeout"].get<size_t>();
        if (j.contains("max_retries")) max_retries = j["max_retries"].get<int>();
        if (j.contains("retry_delay_ms")) initial_retry_delay_ms = j["retry_delay_ms"].get<size_t>();
        if (j.contains("max_retry_delay_ms"))
            max_retry_delay_ms = j["max_retry_delay_ms"].get<size_t>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<uint64_t>();
        if (j.contains("session_db")) session_db = j["session_db"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void UploadConfig::apply_defaults() {
    if (credentials_file.empty() && access_token.empty() && !no_auth) {
        if (const char* v = std::getenv("GMAILUP_CREDENTIALS")) {
            credentials_file = v;
        }
    }
    if (const char* v = std::getenv("GMAILUP_USER_AGENT")) {
        if (user_agent == "gmail-upload/1.0") user_agent = v;
    }
    if (!root_url.empty() && root_url.back() != '/') {
        root_url += '/';
    }
}

std::string UploadConfig::validate() const {
    if (message_file.empty()) return "message file is required (--message)";
    if (!std::filesystem::exists(message_file))
        return "message file does not exist: " + message_file.string();
    if (!is_known_operation(operation)) return "unknown operation: " + operation;
    if (protocol != "simple" && protocol != "resumable")
        return "protocol must be 'simple' or 'resumable'";
    if (operation == "draft-update" && draft_id.empty())
        return "draft-update requires --draft-id";
    if (mime_type.rfind("message/", 0) != 0)
        return "mime type must match message/*: " + mime_type;
    if (user_id.empty()) return "user_id must not be empty";

    int auth_sources = (access_token.empty() ? 0 : 1) + (credentials_file.empty() ? 0 : 1) +
                       (no_auth ? 1 : 0);
    if (auth_sources == 0)
        return "no credentials: use --access-token, --credentials-file (GMAILUP_CREDENTIALS) or --no-auth";
    if (auth_sources > 1)
        return "--access-token, --credentials-file and --no-auth are mutually exclusive";
    if (!subject.empty() && credentials_file.empty())
        return "--subject requires a service account (--credentials-file)";

    if (max_retries < 0) return "max_retries must be >= 0";
    if (max_retry_delay_ms < initial_retry_delay_ms)
        return "max_retry_delay_ms must be >= retry_delay_ms";
    if (request_timeout_secs == 0) return "timeout must be > 0";
    if (metrics_interval_secs == 0) return "metrics_interval must be > 0";
    return {};
}

}  // namespace gmailup
