#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gmailup {

enum class SeekOrigin {
    Begin,
    End
};

/// Seekable byte stream holding the media payload.
///
/// The upload engine re-seeks before every read, so implementations need not
/// track position across requests. Both methods report failure with nullopt.
class MediaSource {
public:
    virtual ~MediaSource() = default;

    /// Move the cursor. Returns the new absolute position.
    virtual std::optional<uint64_t> seek(int64_t offset, SeekOrigin origin) = 0;

    /// Read up to `len` bytes into `buf`. Returns 0 at end of stream.
    virtual std::optional<size_t> read(uint8_t* buf, size_t len) = 0;
};

/// Seek to the end to learn the size, then rewind to the start.
std::optional<uint64_t> measure_length(MediaSource& source);

/// Read exactly `len` bytes. Returns false on error or premature end of stream.
bool read_exact(MediaSource& source, uint8_t* buf, size_t len);

/// Media held in memory.
class MemoryMediaSource : public MediaSource {
public:
    explicit MemoryMediaSource(std::vector<uint8_t> data);
    explicit MemoryMediaSource(const std::string& data);

    std::optional<uint64_t> seek(int64_t offset, SeekOrigin origin) override;
    std::optional<size_t> read(uint8_t* buf, size_t len) override;

    const std::vector<uint8_t>& data() const { return data_; }

private:
    std::vector<uint8_t> data_;
    uint64_t pos_ = 0;
};

/// Media backed by a file on disk.
class FileMediaSource : public MediaSource {
public:
    FileMediaSource() = default;
    ~FileMediaSource() override;

    FileMediaSource(const FileMediaSource&) = delete;
    FileMediaSource& operator=(const FileMediaSource&) = delete;

    /// Returns error message on failure, empty string on success.
    std::string open(const std::filesystem::path& path);
    bool is_open() const { return fp_ != nullptr; }

    std::optional<uint64_t> seek(int64_t offset, SeekOrigin origin) override;
    std::optional<size_t> read(uint8_t* buf, size_t len) override;

private:
    FILE* fp_ = nullptr;
};

}  // namespace gmailup
