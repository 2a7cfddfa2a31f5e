#pragma once

#include "gmailup/constants.hpp"
#include "gmailup/errors.hpp"
#include "gmailup/media_source.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gmailup {

/// Builds a multipart/related body. Each part carries Content-Type and
/// Content-Length headers; parts are framed as "\r\n--B\r\n" and the body
/// ends with "\r\n--B--".
class MultipartBuilder {
public:
    explicit MultipartBuilder(std::string boundary = constants::MULTIPART_BOUNDARY);

    MultipartBuilder& add_part(const std::string& content_type, const uint8_t* data, size_t size);
    MultipartBuilder& add_part(const std::string& content_type, const std::string& data);

    /// Append the closing delimiter and hand over the body.
    std::vector<uint8_t> finish();

    /// "multipart/related; boundary=<B>"
    std::string content_type() const;

    const std::string& boundary() const { return boundary_; }

private:
    void append(const std::string& s);

    std::string boundary_;
    std::vector<uint8_t> body_;
};

struct MultipartResult {
    std::optional<UploadError> error;
    std::vector<uint8_t> body;
    std::string content_type;

    bool ok() const { return !error.has_value(); }
};

/// Metadata part followed by the media part.
///
/// Measures `media` again and fails with UploadSizeLimitExceeded when it
/// exceeds `max_size` (0 = unlimited), or MediaError when it cannot be read.
/// The media is read from offset 0 whatever its current position.
MultipartResult assemble_multipart(const std::string& metadata,
                                   const std::string& metadata_mime,
                                   MediaSource& media,
                                   const std::string& media_mime,
                                   uint64_t max_size);

}  // namespace gmailup
