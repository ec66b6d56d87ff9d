#pragma once

#include "block_picker.h"
#include "block_store.h"
#include "file_metadata.h"
#include "neighbor_client.h"
#include "peer_config.h"
#include "stop_token.h"
#include "threadmanager.h"

#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blockshare {

enum class DownloadResult {
    COMPLETE,   // every block owned
    FAILED,     // every worker gave up with blocks missing
    STOPPED     // stop requested before completion
};

std::string download_result_to_string(DownloadResult result);

/**
 * Per-neighbor download counters
 */
struct NeighborStats {
    std::string neighbor;
    uint64_t blocks_fetched = 0;
    uint64_t bytes_fetched = 0;
    uint64_t failures = 0;
    uint64_t refusals = 0;
    bool gave_up = false;
};

/**
 * Download scheduler: one worker thread per neighbor plus a progress monitor.
 *
 * Each worker claims the lowest missing block nobody else is fetching, asks its
 * neighbor for it over a fresh connection, stores it and releases the claim.
 * Failures release the claim and back off. A worker gives up after
 * max_consecutive_failures failures in a row. Refusals for blocks the neighbor
 * does not own yet are retried without counting toward that ceiling; they have
 * their own, max_consecutive_refusals, reset by every delivered block.
 */
class DownloadScheduler : public ThreadManager {
public:
    /**
     * @param config Neighbors and timing
     * @param metadata Description of the file; the store must be sized with it
     * @param store Destination of downloaded blocks
     * @param stop_token Cancels workers and monitor
     */
    DownloadScheduler(const PeerConfig& config, const FileMetadata& metadata, BlockStore& store, StopToken& stop_token);
    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    /**
     * Start the workers and the monitor
     * @return false if already started or there are no neighbors
     */
    bool start();

    /**
     * Block until the monitor has decided the outcome, then join all threads
     */
    DownloadResult wait();

    /**
     * start() followed by wait()
     */
    DownloadResult run();

    /**
     * Outcome once decided
     */
    std::optional<DownloadResult> get_result() const;

    std::vector<NeighborStats> get_neighbor_stats() const;
    nlohmann::json get_statistics_json() const;

private:
    struct WorkerState {
        PeerAddress neighbor;
        std::atomic<uint64_t> blocks_fetched{0};
        std::atomic<uint64_t> bytes_fetched{0};
        std::atomic<uint64_t> failures{0};
        std::atomic<uint64_t> refusals{0};
        std::atomic<bool> gave_up{false};
    };

    void worker_loop(WorkerState& worker);
    void monitor_loop();
    void finish(DownloadResult result);
    bool should_stop() const;
    void notify_progress();

    const PeerConfig& config_;
    FileMetadata metadata_;
    BlockStore& store_;
    StopToken& stop_token_;
    BlockPicker picker_;

    std::vector<std::unique_ptr<WorkerState>> workers_;
    std::atomic<size_t> active_workers_;
    std::atomic<bool> started_;
    std::atomic<bool> finished_;

    // Wakes the monitor on stored blocks and worker exits
    std::mutex progress_mutex_;
    std::condition_variable progress_cv_;

    mutable std::mutex result_mutex_;
    std::condition_variable result_cv_;
    std::optional<DownloadResult> result_;
};

} // namespace blockshare
