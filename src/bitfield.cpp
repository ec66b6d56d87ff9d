#include "bitfield.h"

namespace blockshare {

//=============================================================================
// Constructors
//=============================================================================

Bitfield::Bitfield() noexcept
    : num_bits_(0), set_count_(0) {
}

Bitfield::Bitfield(size_t num_bits)
    : words_((num_bits + 63) / 64, 0), num_bits_(num_bits), set_count_(0) {
}

//=============================================================================
// Bit Operations
//=============================================================================

bool Bitfield::set_bit(size_t index) {
    if (index >= num_bits_) {
        return false;
    }
    uint64_t mask = uint64_t(1) << (index % 64);
    uint64_t& word = words_[index / 64];
    if (word & mask) {
        return false;
    }
    word |= mask;
    ++set_count_;
    return true;
}

bool Bitfield::clear_bit(size_t index) {
    if (index >= num_bits_) {
        return false;
    }
    uint64_t mask = uint64_t(1) << (index % 64);
    uint64_t& word = words_[index / 64];
    if (!(word & mask)) {
        return false;
    }
    word &= ~mask;
    --set_count_;
    return true;
}

bool Bitfield::get_bit(size_t index) const {
    if (index >= num_bits_) {
        return false;
    }
    return (words_[index / 64] >> (index % 64)) & 1;
}

//=============================================================================
// Query Operations
//=============================================================================

bool Bitfield::all_set() const {
    return set_count_ == num_bits_;
}

size_t Bitfield::find_first_clear_in_both(const Bitfield& other) const {
    for (size_t w = 0; w < words_.size(); ++w) {
        uint64_t taken = words_[w];
        if (w < other.words_.size()) {
            taken |= other.words_[w];
        }
        uint64_t free_bits = ~taken & valid_mask(w);
        if (free_bits != 0) {
            return w * 64 + lowest_bit(free_bits);
        }
    }
    return num_bits_;
}

size_t Bitfield::find_next_clear(size_t start) const {
    for (size_t i = start; i < num_bits_; ++i) {
        if (!get_bit(i)) return i;
    }
    return num_bits_;
}

std::vector<uint32_t> Bitfield::clear_indices() const {
    std::vector<uint32_t> result;
    result.reserve(num_bits_ - set_count_);
    for (size_t i = find_next_clear(0); i < num_bits_; i = find_next_clear(i + 1)) {
        result.push_back(static_cast<uint32_t>(i));
    }
    return result;
}

std::string Bitfield::to_string() const {
    std::string result;
    result.reserve(num_bits_);
    for (size_t i = 0; i < num_bits_; ++i) {
        result += get_bit(i) ? '1' : '0';
    }
    return result;
}

bool Bitfield::operator==(const Bitfield& other) const {
    return num_bits_ == other.num_bits_ && words_ == other.words_;
}

//=============================================================================
// Private Helpers
//=============================================================================

uint64_t Bitfield::valid_mask(size_t word_index) const {
    size_t bits_before = word_index * 64;
    size_t remaining = num_bits_ - bits_before;
    if (remaining >= 64) {
        return ~uint64_t(0);
    }
    return (uint64_t(1) << remaining) - 1;
}

size_t Bitfield::lowest_bit(uint64_t word) {
#if defined(__GNUC__) || defined(__clang__)
    return static_cast<size_t>(__builtin_ctzll(word));
#else
    size_t n = 0;
    while ((word & 1) == 0) {
        word >>= 1;
        ++n;
    }
    return n;
#endif
}

} // namespace blockshare
