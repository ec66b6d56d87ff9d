#pragma once

/**
 * @file block_store.h
 * @brief Thread-safe repository of the blocks this peer owns
 *
 * The provider reads from the store while download workers write to it.
 * One mutex covers both the ownership bitfield and the payloads, so a block
 * is visible as owned only together with its bytes.
 */

#include "bitfield.h"
#include "file_metadata.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockshare {

/**
 * Raised by BlockStore::get for an index that is not owned
 */
class BlockNotOwned : public std::runtime_error {
public:
    explicit BlockNotOwned(uint32_t index)
        : std::runtime_error("block " + std::to_string(index) + " is not owned"), index_(index) {}

    uint32_t index() const { return index_; }

private:
    uint32_t index_;
};

class BlockStore {
public:
    BlockStore();

    BlockStore(const BlockStore&) = delete;
    BlockStore& operator=(const BlockStore&) = delete;

    //=========================================================================
    // Setup
    //=========================================================================

    /**
     * @brief Size the store for a file. Allowed exactly once.
     * @param metadata Description of the file being shared
     * @return false if the store was already sized
     */
    bool set_metadata(const FileMetadata& metadata);

    /**
     * @brief Size the store and fill it from a complete local file (seeder)
     *
     * The file is read block by block; its size must equal metadata.file_size().
     * @param path Source file
     * @param metadata Description of that file
     * @return false if the store was already sized or the file could not be read
     */
    bool load_from_file(const std::string& path, const FileMetadata& metadata);

    bool is_sized() const;

    /**
     * @brief Metadata the store was sized with, if any
     */
    std::optional<FileMetadata> metadata() const;

    //=========================================================================
    // Block access
    //=========================================================================

    bool has(uint32_t index) const;

    /**
     * @brief Copy of the payload of an owned block
     * @throws BlockNotOwned if index is not owned
     */
    std::vector<uint8_t> get(uint32_t index) const;

    /**
     * @brief Store a block. Idempotent: a block already owned is left untouched.
     *
     * Rejected (false, logged) when the store is not sized, index is out of
     * range, or the payload length differs from the block's expected length.
     * @return true only for the first successful insertion of index
     */
    bool put(uint32_t index, std::vector<uint8_t> payload);

    //=========================================================================
    // Progress
    //=========================================================================

    /**
     * @brief True once every block is owned; false while the store is unsized
     */
    bool all_owned() const;

    uint32_t owned_count() const;
    uint32_t block_count() const;

    /**
     * @brief Indices not yet owned, ascending
     */
    std::vector<uint32_t> missing() const;

    /**
     * @brief Snapshot of the ownership bitfield
     */
    Bitfield owned() const;

private:
    bool size_locked(const FileMetadata& metadata);

    mutable std::mutex mutex_;
    std::optional<FileMetadata> metadata_;
    Bitfield owned_;
    std::vector<std::vector<uint8_t>> payloads_;
};

} // namespace blockshare
