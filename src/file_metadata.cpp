#include "file_metadata.h"
#include "fs.h"
#include "logger.h"
#include "sha256.h"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

#define LOG_METADATA_INFO(message)  LOG_INFO("metadata", message)
#define LOG_METADATA_ERROR(message) LOG_ERROR("metadata", message)

namespace blockshare {

uint32_t compute_block_count(uint64_t file_size, uint32_t block_size) {
    if (block_size == 0) {
        throw std::invalid_argument("block size must be positive");
    }
    uint64_t count = (file_size + block_size - 1) / block_size;
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("file of " + std::to_string(file_size) +
                                    " bytes has too many blocks of " + std::to_string(block_size) + " bytes");
    }
    return static_cast<uint32_t>(count);
}

FileMetadata::FileMetadata(const std::string& filename, uint64_t file_size, uint32_t block_size, const std::string& sha256)
    : filename_(filename),
      file_size_(file_size),
      block_size_(block_size),
      block_count_(compute_block_count(file_size, block_size)),
      sha256_(sha256) {
    if (!is_sha256_hex(sha256_)) {
        throw std::invalid_argument("malformed sha256 digest '" + sha256 + "'");
    }
    std::transform(sha256_.begin(), sha256_.end(), sha256_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

uint32_t FileMetadata::block_length(uint32_t index) const {
    if (index >= block_count_) {
        return 0;
    }
    uint64_t offset = block_offset(index);
    uint64_t remaining = file_size_ - offset;
    return remaining < block_size_ ? static_cast<uint32_t>(remaining) : block_size_;
}

uint64_t FileMetadata::block_offset(uint32_t index) const {
    return static_cast<uint64_t>(index) * block_size_;
}

bool FileMetadata::operator==(const FileMetadata& other) const {
    return filename_ == other.filename_ &&
           file_size_ == other.file_size_ &&
           block_size_ == other.block_size_ &&
           sha256_ == other.sha256_;
}

std::optional<FileMetadata> describe_file(const std::string& path, uint32_t block_size) {
    if (!is_file(path)) {
        LOG_METADATA_ERROR("Not a regular file: " << path);
        return std::nullopt;
    }

    int64_t size = get_file_size(path);
    if (size < 0) {
        LOG_METADATA_ERROR("Failed to get size of " << path);
        return std::nullopt;
    }

    std::string digest;
    if (!SHA256::hash_file(path, digest)) {
        return std::nullopt;
    }

    try {
        FileMetadata metadata(get_filename_from_path(path), static_cast<uint64_t>(size), block_size, digest);
        LOG_METADATA_INFO("Described " << path << ": " << metadata.file_size() << " bytes, "
                          << metadata.block_count() << " blocks of " << block_size << ", sha256 " << digest);
        return metadata;
    } catch (const std::invalid_argument& e) {
        LOG_METADATA_ERROR("Cannot split " << path << " into blocks: " << e.what());
        return std::nullopt;
    }
}

//=============================================================================
// MetadataSlot
//=============================================================================

bool MetadataSlot::publish(const FileMetadata& metadata) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (metadata_) {
            return false;
        }
        metadata_ = metadata;
    }
    cv_.notify_all();
    return true;
}

std::optional<FileMetadata> MetadataSlot::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

bool MetadataSlot::is_known() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_.has_value();
}

std::optional<FileMetadata> MetadataSlot::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return metadata_.has_value(); });
    return metadata_;
}

} // namespace blockshare
