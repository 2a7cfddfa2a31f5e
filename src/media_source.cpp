#include "gmailup/media_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace gmailup {

std::optional<uint64_t> measure_length(MediaSource& source) {
    auto end = source.seek(0, SeekOrigin::End);
    if (!end) return std::nullopt;
    if (!source.seek(0, SeekOrigin::Begin)) return std::nullopt;
    return end;
}

bool read_exact(MediaSource& source, uint8_t* buf, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        auto n = source.read(buf + filled, len - filled);
        if (!n || *n == 0) return false;
        filled += *n;
    }
    return true;
}

// ============================================================================
// MemoryMediaSource
// ============================================================================

MemoryMediaSource::MemoryMediaSource(std::vector<uint8_t> data)
    : data_(std::move(data)) {}

MemoryMediaSource::MemoryMediaSource(const std::string& data)
    : data_(data.begin(), data.end()) {}

std::optional<uint64_t> MemoryMediaSource::seek(int64_t offset, SeekOrigin origin) {
    int64_t base = origin == SeekOrigin::Begin ? 0 : static_cast<int64_t>(data_.size());
    int64_t target = base + offset;
    if (target < 0) return std::nullopt;
    pos_ = static_cast<uint64_t>(target);
    return pos_;
}

std::optional<size_t> MemoryMediaSource::read(uint8_t* buf, size_t len) {
    if (pos_ >= data_.size()) return size_t{0};
    size_t n = std::min<uint64_t>(len, data_.size() - pos_);
    std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return n;
}

// ============================================================================
// FileMediaSource
// ============================================================================

FileMediaSource::~FileMediaSource() {
    if (fp_) fclose(fp_);
}

std::string FileMediaSource::open(const std::filesystem::path& path) {
    if (fp_) {
        fclose(fp_);
        fp_ = nullptr;
    }
    fp_ = fopen(path.c_str(), "rb");
    if (!fp_) {
        return "Cannot open " + path.string() + ": " + std::strerror(errno);
    }
    return {};
}

std::optional<uint64_t> FileMediaSource::seek(int64_t offset, SeekOrigin origin) {
    if (!fp_) return std::nullopt;
    int whence = origin == SeekOrigin::Begin ? SEEK_SET : SEEK_END;
    if (fseeko(fp_, static_cast<off_t>(offset), whence) != 0) return std::nullopt;
    off_t pos = ftello(fp_);
    if (pos < 0) return std::nullopt;
    return static_cast<uint64_t>(pos);
}

std::optional<size_t> FileMediaSource::read(uint8_t* buf, size_t len) {
    if (!fp_) return std::nullopt;
    size_t n = fread(buf, 1, len, fp_);
    if (n < len && ferror(fp_)) {
        clearerr(fp_);
        return std::nullopt;
    }
    return n;
}

}  // namespace gmailup
