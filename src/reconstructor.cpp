#include "reconstructor.h"
#include "fs.h"
#include "logger.h"
#include "sha256.h"

// Reconstructor module logging macros
#define LOG_RECONSTRUCT_DEBUG(message) LOG_DEBUG("reconstruct", message)
#define LOG_RECONSTRUCT_INFO(message)  LOG_INFO("reconstruct", message)
#define LOG_RECONSTRUCT_ERROR(message) LOG_ERROR("reconstruct", message)

namespace blockshare {

namespace {

constexpr size_t VERIFY_CHUNK_SIZE = 64 * 1024;

} // anonymous namespace

std::string verify_result_to_string(VerifyResult result) {
    switch (result) {
        case VerifyResult::VERIFIED:     return "verified";
        case VerifyResult::CORRUPT:      return "corrupt";
        case VerifyResult::WRITE_FAILED: return "write_failed";
    }
    return "unknown";
}

bool write_blocks_to_file(const BlockStore& store, const FileMetadata& metadata, const std::string& path) {
    ScopedFile file(path, "wb");
    if (!file.is_open()) {
        LOG_RECONSTRUCT_ERROR("Failed to open " << path << " for writing");
        return false;
    }

    uint64_t written = 0;
    for (uint32_t i = 0; i < metadata.block_count(); ++i) {
        std::vector<uint8_t> block;
        try {
            block = store.get(i);
        } catch (const BlockNotOwned& e) {
            LOG_RECONSTRUCT_ERROR("Cannot reconstruct " << path << ": " << e.what());
            return false;
        }
        if (!file.write(block.data(), block.size())) {
            LOG_RECONSTRUCT_ERROR("Write of block " << i << " to " << path << " failed");
            return false;
        }
        written += block.size();
    }

    if (!file.close()) {
        LOG_RECONSTRUCT_ERROR("Failed to flush " << path);
        return false;
    }

    LOG_RECONSTRUCT_INFO("File reconstructed at " << path << " (" << written << " bytes)");
    return true;
}

VerifyResult verify_file(const std::string& path, const std::string& expected_sha256) {
    std::string digest;
    if (!SHA256::hash_file(path, digest, VERIFY_CHUNK_SIZE)) {
        return VerifyResult::WRITE_FAILED;
    }

    if (digest != expected_sha256) {
        LOG_RECONSTRUCT_ERROR("SHA-256 mismatch for " << path << ": expected " << expected_sha256
                              << ", got " << digest);
        return VerifyResult::CORRUPT;
    }

    LOG_RECONSTRUCT_INFO("SHA-256 verified for " << path << ": " << digest);
    return VerifyResult::VERIFIED;
}

VerifyResult reconstruct_and_verify(const BlockStore& store, const FileMetadata& metadata, const std::string& path) {
    if (!write_blocks_to_file(store, metadata, path)) {
        return VerifyResult::WRITE_FAILED;
    }
    return verify_file(path, metadata.sha256());
}

} // namespace blockshare
