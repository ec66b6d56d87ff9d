#pragma once

/**
 * @file block_picker.h
 * @brief Claim set shared by the download workers
 *
 * A block index is unclaimed, claimed by exactly one worker, or owned.
 * claim_next() atomically picks the lowest index that is neither owned nor
 * claimed, so two workers never fetch the same block at the same time.
 */

#include "bitfield.h"

#include <cstdint>
#include <mutex>
#include <optional>

namespace blockshare {

class BlockStore;

class BlockPicker {
public:
    /**
     * @param block_count Number of blocks in the file
     */
    explicit BlockPicker(uint32_t block_count);

    BlockPicker(const BlockPicker&) = delete;
    BlockPicker& operator=(const BlockPicker&) = delete;

    /**
     * @brief Claim the lowest missing index no other worker holds
     * @param store Ownership source
     * @return The claimed index, or std::nullopt when every missing block is in flight
     */
    std::optional<uint32_t> claim_next(const BlockStore& store);

    /**
     * @brief Return a claim, whether or not the block was stored
     * @return false if index was not claimed
     */
    bool release(uint32_t index);

    bool is_claimed(uint32_t index) const;
    size_t claimed_count() const;
    uint32_t block_count() const { return block_count_; }

private:
    mutable std::mutex mutex_;
    Bitfield claimed_;
    uint32_t block_count_;
};

/**
 * Scoped claim: releases the index back to the picker unless released earlier
 */
class BlockClaim {
public:
    BlockClaim(BlockPicker& picker, uint32_t index) : picker_(&picker), index_(index) {}
    ~BlockClaim() { release(); }

    BlockClaim(const BlockClaim&) = delete;
    BlockClaim& operator=(const BlockClaim&) = delete;

    uint32_t index() const { return index_; }

    void release() {
        if (picker_) {
            picker_->release(index_);
            picker_ = nullptr;
        }
    }

private:
    BlockPicker* picker_;
    uint32_t index_;
};

} // namespace blockshare
