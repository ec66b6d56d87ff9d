#include "stop_token.h"

namespace blockshare {

void StopToken::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true);
    }
    cv_.notify_all();
}

void StopToken::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return stopped_.load(); });
}

} // namespace blockshare
