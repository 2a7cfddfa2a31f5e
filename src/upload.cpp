#include "gmailup/upload.hpp"
#include "gmailup/log.hpp"
#include "gmailup/multipart.hpp"
#include "gmailup/resumable_upload.hpp"

#include <algorithm>
#include <thread>

namespace gmailup {

namespace {

bool is_session_gone(int status) {
    return status == static_cast<int>(net::HttpStatus::NotFound) ||
           status == static_cast<int>(net::HttpStatus::Gone);
}

}  // namespace

const char* upload_protocol_name(UploadProtocol protocol) {
    switch (protocol) {
        case UploadProtocol::Simple: return "multipart";
        case UploadProtocol::Resumable: return "resumable";
    }
    return "multipart";
}

void remove_json_null_values(nlohmann::json& value) {
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end();) {
            if (it->is_null()) {
                it = value.erase(it);
            } else {
                remove_json_null_values(*it);
                ++it;
            }
        }
    } else if (value.is_array()) {
        auto& arr = value.get_ref<nlohmann::json::array_t&>();
        arr.erase(std::remove_if(arr.begin(), arr.end(),
                                 [](const nlohmann::json& v) { return v.is_null(); }),
                  arr.end());
        for (auto& v : arr) {
            remove_json_null_values(v);
        }
    }
}

std::string Uploader::build_url(const UploadCall& call, UploadProtocol protocol) {
    std::string url = call.url;
    for (const auto& [name, value] : call.path_params) {
        std::string placeholder = "{" + name + "}";
        auto pos = url.find(placeholder);
        if (pos != std::string::npos) {
            url.replace(pos, placeholder.size(), net::url_encode(value));
        }
    }

    QueryParams query;
    query.emplace_back("alt", "json");
    query.emplace_back("uploadType", upload_protocol_name(protocol));
    query.insert(query.end(), call.params.begin(), call.params.end());
    query.insert(query.end(), call.additional_params.begin(), call.additional_params.end());
    return net::append_query(url, query);
}

Uploader::Uploader(net::HttpTransport& transport, TokenProvider& tokens, UploaderOptions options)
    : transport_(transport)
    , tokens_(tokens)
    , options_(std::move(options)) {}

UploadOutcome<std::string> Uploader::execute(const UploadCall& call,
                                             MediaSource& media,
                                             const std::string& mime_type,
                                             UploadProtocol protocol,
                                             Delegate& delegate,
                                             const BodyDecoder& decode) {
    UploadOutcome<std::string> result;
    const char* id = call.method.id.c_str();

    auto fail = [&](UploadError err, net::HttpResponse response = {}) {
        log_debug("%s: %s", id, err.to_string().c_str());
        delegate.finished(false);
        result.error = std::move(err);
        result.response = std::move(response);
        return std::move(result);
    };

    delegate.begin(call.method);

    for (const auto& [name, value] : call.additional_params) {
        if (std::find(call.reserved_params.begin(), call.reserved_params.end(), name) !=
            call.reserved_params.end()) {
            return fail(UploadError::field_clash(name));
        }
    }

    const std::string url = build_url(call, protocol);
    const std::vector<std::string> scopes =
        call.scopes.empty() ? std::vector<std::string>{call.default_scope} : call.scopes;

    auto size = measure_length(media);
    if (!size) {
        return fail(UploadError::media("cannot determine media size"));
    }
    if (call.max_size > 0 && *size > call.max_size) {
        return fail(UploadError::size_limit_exceeded(*size, call.max_size));
    }

    // Non-2xx response: let the delegate decide. Returns the error to surface,
    // or nullopt after sleeping when the call should be retried.
    auto on_failure = [&](const net::HttpResponse& response) -> std::optional<UploadError> {
        auto err = ErrorResponse::parse(response.body_string());
        auto retry = delegate.http_failure(response, err);
        if (!retry.is_abort()) {
            std::this_thread::sleep_for(retry.delay());
            return std::nullopt;
        }
        if (err) return UploadError::bad_request(std::move(*err), response);
        return UploadError::failure(response);
    };

    auto on_transport_error = [&](const net::HttpResponse& response) -> std::optional<UploadError> {
        auto retry = delegate.http_error(response);
        if (!retry.is_abort()) {
            std::this_thread::sleep_for(retry.delay());
            return std::nullopt;
        }
        return UploadError::http_error(response.error);
    };

    while (true) {
        std::optional<std::string> token;
        auto token_result = tokens_.get_token(scopes);
        if (token_result.ok()) {
            token = std::move(token_result.token);
        } else {
            token = delegate.token(token_result.error);
            if (!token) {
                return fail(UploadError::missing_token(token_result.error));
            }
        }

        if (!media.seek(0, SeekOrigin::Begin)) {
            return fail(UploadError::media("cannot rewind media"));
        }

        net::HttpResponse response;
        bool from_server = true;
        std::optional<std::string> cached_url;
        if (protocol == UploadProtocol::Resumable) {
            cached_url = delegate.upload_url();
        }

        if (cached_url) {
            log_debug("%s: resuming session %s", id, cached_url->c_str());
            response.status_code = static_cast<int>(net::HttpStatus::OK);
            response.headers.set("Location", *cached_url);
            from_server = false;
        } else {
            net::HttpRequest request;
            if (protocol == UploadProtocol::Simple) {
                auto mp = assemble_multipart(call.metadata_json, "application/json",
                                             media, mime_type, call.max_size);
                if (!mp.ok()) {
                    return fail(std::move(*mp.error));
                }
                request = net::HttpRequest::post(url, std::move(mp.body));
                request.headers.set_content_type(mp.content_type);
            } else {
                request = net::HttpRequest::post(url, {});
                request.set_json_body(call.metadata_json);
                request.headers.set("X-Upload-Content-Type", mime_type);
                request.headers.set("X-Upload-Content-Length", std::to_string(*size));
            }
            request.method = call.method.http_method;
            request.headers.set("User-Agent", options_.user_agent);
            if (token && !token->empty()) {
                request.headers.set_bearer_token(*token);
            }

            delegate.pre_request();
            response = transport_.execute(request);
        }

        if (response.is_network_error) {
            if (auto err = on_transport_error(response)) {
                return fail(std::move(*err), std::move(response));
            }
            continue;
        }

        if (!net::is_success_status(response.status_code)) {
            if (auto err = on_failure(response)) {
                return fail(std::move(*err), std::move(response));
            }
            continue;
        }

        if (protocol == UploadProtocol::Resumable) {
            auto current = measure_length(media);
            if (!current) {
                return fail(UploadError::media("cannot determine media size"));
            }
            if (call.max_size > 0 && *current > call.max_size) {
                return fail(UploadError::size_limit_exceeded(*current, call.max_size));
            }

            auto location = response.headers.get("Location");
            if (!location || location->empty()) {
                log_error("%s: resumable session response carries no Location", id);
                return fail(UploadError::cancelled(), std::move(response));
            }
            if (from_server) {
                delegate.store_upload_url(*location);
            }

            TransferSession session;
            session.url = *location;
            session.from_server = from_server;
            session.start_at = from_server ? std::optional<uint64_t>(0) : delegate.resume_offset();

            ResumableUploadHelper helper(transport_, delegate, session, media, mime_type,
                                         *current, token.value_or(""), options_.user_agent);
            if (options_.refresh_token_per_chunk) {
                helper.set_token_refresher([this, &scopes]() -> std::optional<std::string> {
                    auto fresh = tokens_.get_token(scopes);
                    if (!fresh.ok() || !fresh.token) return std::nullopt;
                    return fresh.token;
                });
            }

            auto transfer = helper.upload();
            log_debug("%s: transfer finished after %u requests, %llu bytes", id,
                      helper.requests_sent(),
                      static_cast<unsigned long long>(helper.bytes_sent()));

            switch (transfer.outcome) {
                case ChunkedUploadResult::Outcome::Cancelled:
                    return fail(UploadError::cancelled(), std::move(transfer.response));
                case ChunkedUploadResult::Outcome::MediaError:
                    return fail(UploadError::media(transfer.error));
                case ChunkedUploadResult::Outcome::TransportError:
                    if (auto err = on_transport_error(transfer.response)) {
                        return fail(std::move(*err), std::move(transfer.response));
                    }
                    continue;
                case ChunkedUploadResult::Outcome::Completed:
                    break;
            }

            if (!net::is_success_status(transfer.response.status_code)) {
                // The server no longer knows this session: a retry must start a new one.
                if (is_session_gone(transfer.response.status_code)) {
                    delegate.store_upload_url(std::nullopt);
                }
                if (auto err = on_failure(transfer.response)) {
                    return fail(std::move(*err), std::move(transfer.response));
                }
                continue;
            }
            response = std::move(transfer.response);
        }

        std::string body = response.body_string();
        if (auto decode_error = decode(body)) {
            delegate.response_json_decode_error(body, *decode_error);
            return fail(UploadError::json_decode(body, *decode_error), std::move(response));
        }

        delegate.finished(true);
        result.value = std::move(body);
        result.response = std::move(response);
        return result;
    }
}

}  // namespace gmailup
