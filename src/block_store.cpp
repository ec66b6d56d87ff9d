#include "block_store.h"
#include "fs.h"
#include "logger.h"

// Block store module logging macros
#define LOG_STORE_DEBUG(message) LOG_DEBUG("store", message)
#define LOG_STORE_INFO(message)  LOG_INFO("store", message)
#define LOG_STORE_WARN(message)  LOG_WARN("store", message)
#define LOG_STORE_ERROR(message) LOG_ERROR("store", message)

namespace blockshare {

BlockStore::BlockStore() {
}

bool BlockStore::size_locked(const FileMetadata& metadata) {
    if (metadata_) {
        LOG_STORE_ERROR("Block store already sized for " << metadata_->filename());
        return false;
    }
    metadata_ = metadata;
    owned_ = Bitfield(metadata.block_count());
    payloads_.assign(metadata.block_count(), std::vector<uint8_t>());
    return true;
}

bool BlockStore::set_metadata(const FileMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!size_locked(metadata)) {
        return false;
    }
    LOG_STORE_DEBUG("Sized block store for " << metadata.filename() << ": " << metadata.block_count() << " blocks");
    return true;
}

bool BlockStore::load_from_file(const std::string& path, const FileMetadata& metadata) {
    int64_t size = get_file_size(path);
    if (size < 0 || static_cast<uint64_t>(size) != metadata.file_size()) {
        LOG_STORE_ERROR("File " << path << " has size " << size << ", expected " << metadata.file_size());
        return false;
    }

    ScopedFile file(path, "rb");
    if (!file.is_open()) {
        LOG_STORE_ERROR("Failed to open " << path << " for reading");
        return false;
    }

    std::vector<std::vector<uint8_t>> blocks(metadata.block_count());
    for (uint32_t i = 0; i < metadata.block_count(); ++i) {
        blocks[i].resize(metadata.block_length(i));
        size_t bytes_read = fread(blocks[i].data(), 1, blocks[i].size(), file.get());
        if (bytes_read != blocks[i].size()) {
            LOG_STORE_ERROR("Short read on block " << i << " of " << path);
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!size_locked(metadata)) {
        return false;
    }
    for (uint32_t i = 0; i < metadata.block_count(); ++i) {
        payloads_[i] = std::move(blocks[i]);
        owned_.set_bit(i);
    }

    LOG_STORE_INFO("Loaded " << metadata.block_count() << " blocks from " << path);
    return true;
}

bool BlockStore::is_sized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_.has_value();
}

std::optional<FileMetadata> BlockStore::metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

bool BlockStore::has(uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owned_.get_bit(index);
}

std::vector<uint8_t> BlockStore::get(uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!owned_.get_bit(index)) {
        throw BlockNotOwned(index);
    }
    return payloads_[index];
}

bool BlockStore::put(uint32_t index, std::vector<uint8_t> payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!metadata_) {
        LOG_STORE_WARN("Rejecting block " << index << ": store not sized yet");
        return false;
    }
    if (index >= metadata_->block_count()) {
        LOG_STORE_WARN("Rejecting block " << index << ": out of range (" << metadata_->block_count() << " blocks)");
        return false;
    }
    if (payload.size() != metadata_->block_length(index)) {
        LOG_STORE_WARN("Rejecting block " << index << ": " << payload.size() << " bytes, expected "
                       << metadata_->block_length(index));
        return false;
    }
    if (owned_.get_bit(index)) {
        LOG_STORE_DEBUG("Block " << index << " already owned, ignoring duplicate");
        return false;
    }

    payloads_[index] = std::move(payload);
    owned_.set_bit(index);
    LOG_STORE_DEBUG("Stored block " << index << " (" << owned_.count() << "/" << owned_.size() << ")");
    return true;
}

bool BlockStore::all_owned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_.has_value() && owned_.all_set();
}

uint32_t BlockStore::owned_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(owned_.count());
}

uint32_t BlockStore::block_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(owned_.size());
}

std::vector<uint32_t> BlockStore::missing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owned_.clear_indices();
}

Bitfield BlockStore::owned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owned_;
}

} // namespace blockshare
