#pragma once

#include "gmailup/net/http.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gmailup {

// One entry of the "errors" array in a Google API error body
struct ServerMessage {
    std::string domain;
    std::string reason;
    std::string message;
    std::optional<std::string> location_type;
    std::optional<std::string> location;
};

struct ServerError {
    std::vector<ServerMessage> errors;
    int code = 0;
    std::string message;
};

/// Structured error body: {"error": {"code": .., "message": .., "errors": [..]}}
struct ErrorResponse {
    ServerError error;

    /// Returns nullopt when the body is not a structured error.
    static std::optional<ErrorResponse> parse(const std::string& body);
};

enum class ErrorKind {
    HttpError,                // transport failure, no response
    UploadSizeLimitExceeded,  // media larger than the operation allows
    BadRequest,               // non-2xx with a structured error body
    MissingToken,             // no bearer token and no substitute
    Cancelled,                // delegate vetoed the resumable transfer
    FieldClash,               // additional parameter shadows a native one
    JsonDecodeError,          // 2xx body did not decode
    Failure,                  // non-2xx without a structured body
    MediaError                // media source could not be measured or read
};

const char* error_kind_to_string(ErrorKind kind);

/// Terminal error of an upload call. Only the fields relevant to `kind` are set.
struct UploadError {
    ErrorKind kind = ErrorKind::Failure;

    std::string message;             // HttpError, MissingToken, FieldClash, JsonDecodeError, MediaError
    uint64_t resource_size = 0;      // UploadSizeLimitExceeded
    uint64_t max_size = 0;           // UploadSizeLimitExceeded
    std::optional<ErrorResponse> server_error;  // BadRequest
    net::HttpResponse response;      // BadRequest, Failure
    std::string body;                // JsonDecodeError

    std::string to_string() const;

    static UploadError http_error(std::string message);
    static UploadError size_limit_exceeded(uint64_t resource_size, uint64_t max_size);
    static UploadError bad_request(ErrorResponse err, net::HttpResponse response);
    static UploadError missing_token(std::string message);
    static UploadError cancelled();
    static UploadError field_clash(std::string field);
    static UploadError json_decode(std::string body, std::string message);
    static UploadError failure(net::HttpResponse response);
    static UploadError media(std::string message);
};

}  // namespace gmailup
