#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace blockshare {

/**
 * Number of blocks a file of file_size bytes splits into, ceil(file_size / block_size)
 * @throws std::invalid_argument if block_size is 0 or the count does not fit in 32 bits
 */
uint32_t compute_block_count(uint64_t file_size, uint32_t block_size);

/**
 * Description of the shared file. Immutable once constructed; block_count is
 * always derived from file_size and block_size.
 */
class FileMetadata {
public:
    /**
     * @param filename Base name of the file
     * @param file_size Total size in bytes
     * @param block_size Block size in bytes (> 0)
     * @param sha256 64-character hex digest of the full content, stored lowercase
     * @throws std::invalid_argument on a zero block size, an unrepresentable block count or a malformed digest
     */
    FileMetadata(const std::string& filename, uint64_t file_size, uint32_t block_size, const std::string& sha256);

    const std::string& filename() const { return filename_; }
    uint64_t file_size() const { return file_size_; }
    uint32_t block_size() const { return block_size_; }
    uint32_t block_count() const { return block_count_; }
    const std::string& sha256() const { return sha256_; }

    /**
     * Exact payload length of block index; 0 for an out-of-range index
     */
    uint32_t block_length(uint32_t index) const;

    /**
     * Byte offset of block index within the file
     */
    uint64_t block_offset(uint32_t index) const;

    bool operator==(const FileMetadata& other) const;
    bool operator!=(const FileMetadata& other) const { return !(*this == other); }

private:
    std::string filename_;
    uint64_t file_size_;
    uint32_t block_size_;
    uint32_t block_count_;
    std::string sha256_;
};

/**
 * Describe a local file: size, base name and streamed SHA-256
 * @return The metadata, or std::nullopt if the file cannot be read
 */
std::optional<FileMetadata> describe_file(const std::string& path, uint32_t block_size);

/**
 * Write-once holder for the metadata of the current download.
 * Sessions that need the metadata before a leecher has learned it wait here.
 */
class MetadataSlot {
public:
    MetadataSlot() = default;

    MetadataSlot(const MetadataSlot&) = delete;
    MetadataSlot& operator=(const MetadataSlot&) = delete;

    /**
     * Publish the metadata and wake all waiters
     * @return false if metadata was already published (the first value is kept)
     */
    bool publish(const FileMetadata& metadata);

    std::optional<FileMetadata> get() const;

    bool is_known() const;

    /**
     * Wait until the metadata is published or the timeout expires
     */
    std::optional<FileMetadata> wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<FileMetadata> metadata_;
};

} // namespace blockshare
