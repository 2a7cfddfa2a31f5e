#include "gmailup/resumable_upload.hpp"
#include "gmailup/log.hpp"

#include <algorithm>
#include <exception>

namespace gmailup {

std::optional<Chunk> parse_range_header(const std::string& value) {
    std::string s = value;
    if (s.starts_with("bytes=") || s.starts_with("bytes ")) {
        s = s.substr(6);
    } else {
        return std::nullopt;
    }

    auto dash = s.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 >= s.size()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        Chunk c;
        c.first = std::stoull(s.substr(0, dash), &used);
        if (used != dash) return std::nullopt;
        std::string last = s.substr(dash + 1);
        c.last = std::stoull(last, &used);
        if (used != last.size() || c.last < c.first) return std::nullopt;
        return c;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

ResumableUploadHelper::ResumableUploadHelper(net::HttpTransport& transport,
                                             Delegate& delegate,
                                             TransferSession session,
                                             MediaSource& reader,
                                             std::string media_type,
                                             uint64_t content_length,
                                             std::string auth_token,
                                             std::string user_agent)
    : transport_(transport)
    , delegate_(delegate)
    , session_(std::move(session))
    , reader_(reader)
    , media_type_(std::move(media_type))
    , content_length_(content_length)
    , auth_token_(std::move(auth_token))
    , user_agent_(std::move(user_agent)) {}

net::HttpRequest ResumableUploadHelper::make_request(std::vector<uint8_t> body,
                                                     const ContentRange& range) const {
    auto request = net::HttpRequest::put(session_.url, std::move(body));
    request.headers.set("Content-Range", range.to_header_value());
    if (!user_agent_.empty()) {
        request.headers.set("User-Agent", user_agent_);
    }
    if (!auth_token_.empty()) {
        request.headers.set_bearer_token(auth_token_);
    }
    return request;
}

uint64_t ResumableUploadHelper::next_chunk_size(uint64_t offset, uint64_t chunk_size) const {
    uint64_t remaining = offset < content_length_ ? content_length_ - offset : 0;
    if (chunk_size == 0) return remaining;
    return std::min(remaining, chunk_size);
}

void ResumableUploadHelper::refresh_token() {
    if (!refresher_) return;
    auto fresh = refresher_();
    if (fresh) {
        auth_token_ = std::move(*fresh);
    } else {
        log_error("Token refresh failed, continuing with the previous token");
    }
}

std::optional<uint64_t> ResumableUploadHelper::query_transfer_status(ChunkedUploadResult& result) {
    ContentRange range{std::nullopt, content_length_};

    refresh_token();
    delegate_.pre_request();
    auto response = transport_.execute(make_request({}, range));
    ++requests_sent_;

    if (response.is_network_error) {
        result.outcome = ChunkedUploadResult::Outcome::TransportError;
        result.error = response.error;
        result.response = std::move(response);
        return std::nullopt;
    }

    if (net::is_resume_incomplete_status(response.status_code)) {
        auto header = response.headers.get("Range");
        auto chunk = header ? parse_range_header(*header) : std::nullopt;
        uint64_t offset = chunk ? chunk->last + 1 : 0;
        log_debug("Upload session reports %llu of %llu bytes received",
                  static_cast<unsigned long long>(offset),
                  static_cast<unsigned long long>(content_length_));
        return offset;
    }

    if (response.ok()) {
        delegate_.store_upload_url(std::nullopt);
    }
    result.outcome = ChunkedUploadResult::Outcome::Completed;
    result.response = std::move(response);
    return std::nullopt;
}

ChunkedUploadResult ResumableUploadHelper::upload() {
    ChunkedUploadResult result;

    uint64_t offset = 0;
    if (session_.start_at) {
        offset = *session_.start_at;
    } else {
        auto queried = query_transfer_status(result);
        if (!queried) {
            return result;
        }
        offset = *queried;
    }

    const uint64_t chunk_size = delegate_.chunk_size();

    while (true) {
        uint64_t size = next_chunk_size(offset, chunk_size);
        ContentRange range{std::nullopt, content_length_};
        if (size > 0) {
            range.range = Chunk{offset, offset + size - 1};
        }

        std::vector<uint8_t> buffer(size);
        if (size > 0) {
            if (!reader_.seek(static_cast<int64_t>(offset), SeekOrigin::Begin) ||
                !read_exact(reader_, buffer.data(), buffer.size())) {
                result.outcome = ChunkedUploadResult::Outcome::MediaError;
                result.error = "failed to read media at offset " + std::to_string(offset);
                return result;
            }
        }

        refresh_token();
        delegate_.pre_request();
        auto request = make_request(std::move(buffer), range);
        request.headers.set_content_type(media_type_);

        log_debug("PUT %s [%s]", session_.url.c_str(), range.to_header_value().c_str());
        auto response = transport_.execute(request);
        ++requests_sent_;

        if (response.is_network_error) {
            result.outcome = ChunkedUploadResult::Outcome::TransportError;
            result.error = response.error;
            result.response = std::move(response);
            return result;
        }
        bytes_sent_ += size;

        if (net::is_resume_incomplete_status(response.status_code)) {
            auto header = response.headers.get("Range");
            auto acked = header ? parse_range_header(*header) : std::nullopt;
            offset = acked ? acked->last + 1 : 0;

            ContentRange next{std::nullopt, content_length_};
            uint64_t next_size = next_chunk_size(offset, chunk_size);
            if (next_size > 0) {
                next.range = Chunk{offset, offset + next_size - 1};
            }
            if (delegate_.cancel_chunk_upload(next)) {
                log_info("Upload cancelled at offset %llu of %llu",
                         static_cast<unsigned long long>(offset),
                         static_cast<unsigned long long>(content_length_));
                result.outcome = ChunkedUploadResult::Outcome::Cancelled;
                result.response = std::move(response);
                return result;
            }
            continue;
        }

        if (response.ok()) {
            delegate_.store_upload_url(std::nullopt);
        }
        result.outcome = ChunkedUploadResult::Outcome::Completed;
        result.response = std::move(response);
        return result;
    }
}

}  // namespace gmailup
