#include "gmailup/errors.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

namespace gmailup {

std::optional<ErrorResponse> ErrorResponse::parse(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object() || !j.contains("error") || !j["error"].is_object()) {
            return std::nullopt;
        }
        const auto& je = j["error"];

        ErrorResponse resp;
        resp.error.code = je.value("code", 0);
        resp.error.message = je.value("message", std::string{});
        if (je.contains("errors") && je["errors"].is_array()) {
            for (const auto& jm : je["errors"]) {
                ServerMessage msg;
                msg.domain = jm.value("domain", std::string{});
                msg.reason = jm.value("reason", std::string{});
                msg.message = jm.value("message", std::string{});
                if (jm.contains("locationType") && jm["locationType"].is_string())
                    msg.location_type = jm["locationType"].get<std::string>();
                if (jm.contains("location") && jm["location"].is_string())
                    msg.location = jm["location"].get<std::string>();
                resp.error.errors.push_back(std::move(msg));
            }
        }
        return resp;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::HttpError: return "HttpError";
        case ErrorKind::UploadSizeLimitExceeded: return "UploadSizeLimitExceeded";
        case ErrorKind::BadRequest: return "BadRequest";
        case ErrorKind::MissingToken: return "MissingToken";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::FieldClash: return "FieldClash";
        case ErrorKind::JsonDecodeError: return "JsonDecodeError";
        case ErrorKind::Failure: return "Failure";
        case ErrorKind::MediaError: return "MediaError";
    }
    return "Unknown";
}

std::string UploadError::to_string() const {
    std::ostringstream oss;
    switch (kind) {
        case ErrorKind::HttpError:
            oss << "HTTP transport error: " << message;
            break;
        case ErrorKind::UploadSizeLimitExceeded:
            oss << "The media size " << resource_size
                << " exceeds the maximum allowed upload size of " << max_size;
            break;
        case ErrorKind::BadRequest:
            if (server_error) {
                oss << "Bad Request (" << server_error->error.code << "): "
                    << server_error->error.message;
                for (const auto& e : server_error->error.errors) {
                    oss << "\n    " << e.domain << ": " << e.message << ", " << e.reason;
                    if (e.location) oss << "@" << *e.location;
                }
            } else {
                oss << "Bad Request (" << response.status_code << ")";
            }
            break;
        case ErrorKind::MissingToken:
            oss << "Token retrieval failed with error: " << message;
            break;
        case ErrorKind::Cancelled:
            oss << "Operation cancelled by delegate";
            break;
        case ErrorKind::FieldClash:
            oss << "The custom parameter '" << message
                << "' is already provided natively by the call";
            break;
        case ErrorKind::JsonDecodeError:
            oss << message << ": " << body;
            break;
        case ErrorKind::Failure:
            oss << "Http status indicates failure: " << response.status_code;
            break;
        case ErrorKind::MediaError:
            oss << "Media source error: " << message;
            break;
    }
    return oss.str();
}

UploadError UploadError::http_error(std::string message) {
    UploadError e;
    e.kind = ErrorKind::HttpError;
    e.message = std::move(message);
    return e;
}

UploadError UploadError::size_limit_exceeded(uint64_t resource_size, uint64_t max_size) {
    UploadError e;
    e.kind = ErrorKind::UploadSizeLimitExceeded;
    e.resource_size = resource_size;
    e.max_size = max_size;
    return e;
}

UploadError UploadError::bad_request(ErrorResponse err, net::HttpResponse response) {
    UploadError e;
    e.kind = ErrorKind::BadRequest;
    e.server_error = std::move(err);
    e.response = std::move(response);
    return e;
}

UploadError UploadError::missing_token(std::string message) {
    UploadError e;
    e.kind = ErrorKind::MissingToken;
    e.message = std::move(message);
    return e;
}

UploadError UploadError::cancelled() {
    UploadError e;
    e.kind = ErrorKind::Cancelled;
    return e;
}

UploadError UploadError::field_clash(std::string field) {
    UploadError e;
    e.kind = ErrorKind::FieldClash;
    e.message = std::move(field);
    return e;
}

UploadError UploadError::json_decode(std::string body, std::string message) {
    UploadError e;
    e.kind = ErrorKind::JsonDecodeError;
    e.body = std::move(body);
    e.message = std::move(message);
    return e;
}

UploadError UploadError::failure(net::HttpResponse response) {
    UploadError e;
    e.kind = ErrorKind::Failure;
    e.response = std::move(response);
    return e;
}

UploadError UploadError::media(std::string message) {
    UploadError e;
    e.kind = ErrorKind::MediaError;
    e.message = std::move(message);
    return e;
}

}  // namespace gmailup
