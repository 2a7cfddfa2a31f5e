#pragma once

#include "gmailup/delegate.hpp"
#include "gmailup/errors.hpp"
#include "gmailup/media_source.hpp"
#include "gmailup/net/http.hpp"
#include "gmailup/token_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gmailup {

enum class UploadProtocol {
    Simple,     // one multipart/related request
    Resumable   // session + chunked PUTs
};

/// Value of the uploadType query parameter: "multipart" or "resumable".
const char* upload_protocol_name(UploadProtocol protocol);

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Everything the Uploader needs to know about one upload call.
struct UploadCall {
    MethodInfo method;

    // Upload endpoint, with {name} placeholders filled from path_params
    std::string url;
    QueryParams path_params;

    // Query parameters the operation itself sets
    QueryParams params;

    // Names the call provides natively; additional_params may not reuse them
    std::vector<std::string> reserved_params;
    QueryParams additional_params;

    std::vector<std::string> scopes;  // empty = default_scope
    std::string default_scope;

    uint64_t max_size = 0;      // 0 = unlimited
    std::string accepted_mime;  // informational
    std::string metadata_json = "{}";
};

/// Result of an upload call. On success `error` is empty, `response` is the
/// final server response and `value` the decoded body.
template <typename T>
struct UploadOutcome {
    std::optional<UploadError> error;
    net::HttpResponse response;
    T value{};

    bool ok() const { return !error.has_value(); }
};

struct UploaderOptions {
    std::string user_agent = "gmail-upload/1.0";

    // Re-acquire the bearer token before every resumable chunk instead of
    // reusing the one obtained for the initiating request.
    bool refresh_token_per_chunk = false;
};

/// Runs upload calls: token acquisition, request assembly, the retry loop
/// and the hand-off to the resumable engine. Stateless between calls.
class Uploader {
public:
    /// Decodes a 2xx body. Returns an error message, or nullopt on success.
    using BodyDecoder = std::function<std::optional<std::string>(const std::string& body)>;

    Uploader(net::HttpTransport& transport, TokenProvider& tokens, UploaderOptions options = {});

    /// Run `call` to completion. The delegate's finished() hook fires exactly
    /// once, whatever the outcome.
    UploadOutcome<std::string> execute(const UploadCall& call,
                                       MediaSource& media,
                                       const std::string& mime_type,
                                       UploadProtocol protocol,
                                       Delegate& delegate,
                                       const BodyDecoder& decode);

    /// execute() with the body decoded into T through nlohmann::json.
    template <typename T>
    UploadOutcome<T> upload(const UploadCall& call,
                            MediaSource& media,
                            const std::string& mime_type,
                            UploadProtocol protocol,
                            Delegate& delegate) {
        UploadOutcome<T> out;
        auto raw = execute(call, media, mime_type, protocol, delegate,
                           [&out](const std::string& body) -> std::optional<std::string> {
                               try {
                                   out.value = nlohmann::json::parse(body).get<T>();
                                   return std::nullopt;
                               } catch (const nlohmann::json::exception& e) {
                                   return std::string(e.what());
                               }
                           });
        out.error = std::move(raw.error);
        out.response = std::move(raw.response);
        return out;
    }

    const UploaderOptions& options() const { return options_; }

    /// Fill {name} placeholders and append the query string.
    static std::string build_url(const UploadCall& call, UploadProtocol protocol);

private:
    net::HttpTransport& transport_;
    TokenProvider& tokens_;
    UploaderOptions options_;
};

/// Drop null members and null array elements, recursively.
void remove_json_null_values(nlohmann::json& value);

}  // namespace gmailup
