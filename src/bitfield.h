#pragma once

/**
 * @file bitfield.h
 * @brief Packed bit set indexed by block number
 *
 * Used for the set of owned blocks in the BlockStore and for the claim set
 * in the BlockPicker.
 */

#include <vector>
#include <cstdint>
#include <cstddef>
#include <string>

namespace blockshare {

/**
 * @brief Fixed-size bit array over block indices
 *
 * Bits are packed into uint64_t words, bit i lives in word i / 64 at
 * position i % 64. Out-of-range indices read as clear and are ignored on write.
 */
class Bitfield {
public:
    Bitfield() noexcept;

    /**
     * @brief Create bitfield with specified number of bits, all clear
     * @param num_bits Number of bits in the bitfield
     */
    explicit Bitfield(size_t num_bits);

    //=========================================================================
    // Bit Operations
    //=========================================================================

    /**
     * @brief Set a bit
     * @param index Bit index
     * @return true if the bit was clear before
     */
    bool set_bit(size_t index);

    /**
     * @brief Clear a bit
     * @param index Bit index
     * @return true if the bit was set before
     */
    bool clear_bit(size_t index);

    bool get_bit(size_t index) const;
    bool operator[](size_t index) const { return get_bit(index); }

    //=========================================================================
    // Query Operations
    //=========================================================================

    /**
     * @brief Check if all bits are set (true for an empty bitfield)
     */
    bool all_set() const;

    /**
     * @brief Number of set bits, maintained incrementally
     */
    size_t count() const noexcept { return set_count_; }

    size_t size() const noexcept { return num_bits_; }
    bool empty() const noexcept { return num_bits_ == 0; }

    /**
     * @brief Lowest index clear in both this and other
     *
     * Bits of other beyond its size count as clear.
     * @param other Second bitfield
     * @return The index, or size() if every bit is set in one of them
     */
    size_t find_first_clear_in_both(const Bitfield& other) const;

    /**
     * @brief Find the first clear bit at or after start
     * @return Index of the clear bit, or size() if none
     */
    size_t find_next_clear(size_t start) const;

    /**
     * @brief All clear indices in ascending order
     */
    std::vector<uint32_t> clear_indices() const;

    /**
     * @brief String of '0' and '1' characters, for logging
     */
    std::string to_string() const;

    bool operator==(const Bitfield& other) const;
    bool operator!=(const Bitfield& other) const { return !(*this == other); }

private:
    std::vector<uint64_t> words_;
    size_t num_bits_;
    size_t set_count_;

    uint64_t valid_mask(size_t word_index) const;
    static size_t lowest_bit(uint64_t word);
};

} // namespace blockshare
