#pragma once

#include "gmailup/delegate.hpp"
#include "gmailup/media_source.hpp"
#include "gmailup/net/http.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gmailup {

/// A resumable upload session on the server.
struct TransferSession {
    std::string url;
    bool from_server = true;             // false when the delegate supplied the URL
    std::optional<uint64_t> start_at;    // nullopt = ask the server
};

struct ChunkedUploadResult {
    enum class Outcome {
        Completed,       // server sent a final response (any status)
        TransportError,  // no response to the last request
        Cancelled,       // delegate stopped the transfer between chunks
        MediaError       // media could not be read
    };

    Outcome outcome = Outcome::Completed;
    net::HttpResponse response;
    std::string error;
};

/// Parse a Range response header ("bytes=0-1023", also "bytes 0-1023").
std::optional<Chunk> parse_range_header(const std::string& value);

/// Drives one resumable transfer against a session URL.
///
/// Chunks are sent strictly in sequence with PUT and a Content-Range header.
/// A 308 response moves the offset to one past the last byte the server
/// acknowledged. Any other response ends the transfer and is handed back for
/// the caller to classify; nothing is retried here.
class ResumableUploadHelper {
public:
    /// Returns a fresh bearer token, or nullopt to keep the current one.
    using TokenRefresher = std::function<std::optional<std::string>()>;

    ResumableUploadHelper(net::HttpTransport& transport,
                          Delegate& delegate,
                          TransferSession session,
                          MediaSource& reader,
                          std::string media_type,
                          uint64_t content_length,
                          std::string auth_token,
                          std::string user_agent);

    /// Re-acquire the token before every request of the transfer.
    void set_token_refresher(TokenRefresher refresher) { refresher_ = std::move(refresher); }

    ChunkedUploadResult upload();

    uint64_t bytes_sent() const { return bytes_sent_; }
    uint32_t requests_sent() const { return requests_sent_; }

private:
    /// Ask the server how much it has. On anything but a 308 the transfer is
    /// over and `result` holds the outcome.
    std::optional<uint64_t> query_transfer_status(ChunkedUploadResult& result);

    void refresh_token();

    net::HttpRequest make_request(std::vector<uint8_t> body, const ContentRange& range) const;
    uint64_t next_chunk_size(uint64_t offset, uint64_t chunk_size) const;

    net::HttpTransport& transport_;
    Delegate& delegate_;
    TransferSession session_;
    MediaSource& reader_;
    std::string media_type_;
    uint64_t content_length_;
    std::string auth_token_;
    std::string user_agent_;
    TokenRefresher refresher_;

    uint64_t bytes_sent_ = 0;
    uint32_t requests_sent_ = 0;
};

}  // namespace gmailup
