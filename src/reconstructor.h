#pragma once

#include "block_store.h"
#include "file_metadata.h"

#include <string>

namespace blockshare {

enum class VerifyResult {
    VERIFIED,       // digest of the written file matches the metadata
    CORRUPT,        // digest mismatch; reported, never repaired
    WRITE_FAILED    // the output file could not be written or read back
};

std::string verify_result_to_string(VerifyResult result);

/**
 * Write all blocks in ascending index order to path.
 * The store must own every block.
 * @return false on an I/O error or a missing block (logged)
 */
bool write_blocks_to_file(const BlockStore& store, const FileMetadata& metadata, const std::string& path);

/**
 * Hash a file in 64 KiB chunks and compare with the expected digest
 */
VerifyResult verify_file(const std::string& path, const std::string& expected_sha256);

/**
 * Reconstruct the file from the store and verify its integrity
 */
VerifyResult reconstruct_and_verify(const BlockStore& store, const FileMetadata& metadata, const std::string& path);

} // namespace blockshare
