#include "block_picker.h"
#include "block_store.h"
#include "logger.h"

#define LOG_PICKER_DEBUG(message) LOG_DEBUG("picker", message)
#define LOG_PICKER_WARN(message)  LOG_WARN("picker", message)

namespace blockshare {

BlockPicker::BlockPicker(uint32_t block_count)
    : claimed_(block_count), block_count_(block_count) {
}

std::optional<uint32_t> BlockPicker::claim_next(const BlockStore& store) {
    std::lock_guard<std::mutex> lock(mutex_);

    Bitfield owned = store.owned();
    size_t index = claimed_.find_first_clear_in_both(owned);
    if (index >= block_count_) {
        return std::nullopt;
    }

    claimed_.set_bit(index);
    LOG_PICKER_DEBUG("Claimed block " << index << " (" << claimed_.count() << " in flight)");
    return static_cast<uint32_t>(index);
}

bool BlockPicker::release(uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!claimed_.clear_bit(index)) {
        LOG_PICKER_WARN("Release of unclaimed block " << index);
        return false;
    }
    return true;
}

bool BlockPicker::is_claimed(uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.get_bit(index);
}

size_t BlockPicker::claimed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.count();
}

} // namespace blockshare
