#include "gmailup/multipart.hpp"

namespace gmailup {

namespace {
constexpr const char* CRLF = "\r\n";
}  // namespace

MultipartBuilder::MultipartBuilder(std::string boundary)
    : boundary_(std::move(boundary)) {}

void MultipartBuilder::append(const std::string& s) {
    body_.insert(body_.end(), s.begin(), s.end());
}

MultipartBuilder& MultipartBuilder::add_part(const std::string& content_type,
                                             const uint8_t* data, size_t size) {
    append(std::string(CRLF) + "--" + boundary_ + CRLF);
    append("content-type: " + content_type + CRLF);
    append("content-length: " + std::to_string(size) + CRLF);
    append(CRLF);
    if (size > 0) {
        body_.insert(body_.end(), data, data + size);
    }
    return *this;
}

MultipartBuilder& MultipartBuilder::add_part(const std::string& content_type,
                                             const std::string& data) {
    return add_part(content_type, reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> MultipartBuilder::finish() {
    append(std::string(CRLF) + "--" + boundary_ + "--");
    return std::move(body_);
}

std::string MultipartBuilder::content_type() const {
    return "multipart/related; boundary=" + boundary_;
}

MultipartResult assemble_multipart(const std::string& metadata,
                                   const std::string& metadata_mime,
                                   MediaSource& media,
                                   const std::string& media_mime,
                                   uint64_t max_size) {
    MultipartResult result;

    auto size = measure_length(media);
    if (!size) {
        result.error = UploadError::media("cannot determine media size");
        return result;
    }
    if (max_size > 0 && *size > max_size) {
        result.error = UploadError::size_limit_exceeded(*size, max_size);
        return result;
    }

    std::vector<uint8_t> data(*size);
    if (!media.seek(0, SeekOrigin::Begin) || !read_exact(media, data.data(), data.size())) {
        result.error = UploadError::media("short read while assembling multipart body");
        return result;
    }

    MultipartBuilder builder;
    builder.add_part(metadata_mime, metadata);
    builder.add_part(media_mime, data.data(), data.size());
    result.content_type = builder.content_type();
    result.body = builder.finish();
    return result;
}

}  // namespace gmailup
