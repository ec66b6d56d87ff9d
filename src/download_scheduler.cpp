#include "download_scheduler.h"
#include "logger.h"

#include <chrono>

// Download scheduler module logging macros
#define LOG_DOWNLOAD_DEBUG(message) LOG_DEBUG("download", message)
#define LOG_DOWNLOAD_INFO(message)  LOG_INFO("download", message)
#define LOG_DOWNLOAD_WARN(message)  LOG_WARN("download", message)
#define LOG_DOWNLOAD_ERROR(message) LOG_ERROR("download", message)

namespace blockshare {

std::string download_result_to_string(DownloadResult result) {
    switch (result) {
        case DownloadResult::COMPLETE: return "complete";
        case DownloadResult::FAILED:   return "failed";
        case DownloadResult::STOPPED:  return "stopped";
    }
    return "unknown";
}

DownloadScheduler::DownloadScheduler(const PeerConfig& config, const FileMetadata& metadata,
                                     BlockStore& store, StopToken& stop_token)
    : config_(config),
      metadata_(metadata),
      store_(store),
      stop_token_(stop_token),
      picker_(metadata.block_count()),
      active_workers_(0),
      started_(false),
      finished_(false) {
    for (const auto& neighbor : config_.peers) {
        auto worker = std::make_unique<WorkerState>();
        worker->neighbor = neighbor;
        workers_.push_back(std::move(worker));
    }
}

DownloadScheduler::~DownloadScheduler() {
    finished_.store(true);
    notify_progress();
    join_all_active_threads();
}

bool DownloadScheduler::start() {
    if (started_.exchange(true)) {
        LOG_DOWNLOAD_WARN("Download already started");
        return false;
    }
    if (workers_.empty()) {
        LOG_DOWNLOAD_ERROR("No neighbors to download from");
        finish(DownloadResult::FAILED);
        return false;
    }

    LOG_DOWNLOAD_INFO("Downloading " << metadata_.filename() << " (" << metadata_.block_count()
                      << " blocks) from " << workers_.size() << " neighbors");

    for (auto& worker : workers_) {
        WorkerState* state = worker.get();
        active_workers_++;
        if (!add_managed_thread([this, state]() { worker_loop(*state); },
                                "download-" + state->neighbor.to_string())) {
            active_workers_--;
        }
    }

    if (!add_managed_thread([this]() { monitor_loop(); }, "download-monitor")) {
        finish(DownloadResult::STOPPED);
        return false;
    }
    return true;
}

DownloadResult DownloadScheduler::wait() {
    DownloadResult result;
    {
        std::unique_lock<std::mutex> lock(result_mutex_);
        result_cv_.wait(lock, [this] { return result_.has_value(); });
        result = *result_;
    }
    join_all_active_threads();
    return result;
}

DownloadResult DownloadScheduler::run() {
    start();
    return wait();
}

std::optional<DownloadResult> DownloadScheduler::get_result() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return result_;
}

bool DownloadScheduler::should_stop() const {
    return finished_.load() || stop_token_.stop_requested();
}

void DownloadScheduler::notify_progress() {
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
    }
    progress_cv_.notify_all();
}

void DownloadScheduler::finish(DownloadResult result) {
    finished_.store(true);
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        if (!result_) {
            result_ = result;
        }
    }
    result_cv_.notify_all();
}

void DownloadScheduler::worker_loop(WorkerState& worker) {
    const std::string name = worker.neighbor.to_string();
    const std::chrono::milliseconds backoff(config_.retry_backoff_ms);
    NeighborClient client(worker.neighbor, config_.connect_timeout_ms, config_.request_timeout_ms);
    int consecutive_failures = 0;
    int consecutive_refusals = 0;
    const int refusal_warning = (config_.max_consecutive_refusals + 1) / 2;

    LOG_DOWNLOAD_DEBUG("Worker for " << name << " started");

    while (!should_stop() && !store_.all_owned()) {
        std::optional<uint32_t> index = picker_.claim_next(store_);
        if (!index) {
            // Every missing block is in flight elsewhere
            if (stop_token_.wait_for(backoff)) break;
            continue;
        }

        BlockClaim claim(picker_, *index);
        try {
            std::vector<uint8_t> payload = client.fetch_block(*index, metadata_.block_length(*index));
            size_t size = payload.size();
            if (store_.put(*index, std::move(payload))) {
                worker.blocks_fetched++;
                worker.bytes_fetched += size;
                LOG_DOWNLOAD_DEBUG("Received block " << *index << " from " << name);
            }
            claim.release();
            consecutive_failures = 0;
            consecutive_refusals = 0;
            notify_progress();
        } catch (const TransferFailure& e) {
            claim.release();
            if (e.not_owned()) {
                worker.refusals++;
                consecutive_refusals++;
                LOG_DOWNLOAD_DEBUG(e.what());
                if (consecutive_refusals >= config_.max_consecutive_refusals) {
                    worker.gave_up.store(true);
                    LOG_DOWNLOAD_ERROR("TransferFailure: giving up on " << name << " after "
                                       << consecutive_refusals << " consecutive refusals, last: " << e.what());
                    break;
                }
                if (consecutive_refusals == refusal_warning) {
                    LOG_DOWNLOAD_WARN(name << " has refused " << consecutive_refusals
                                      << " requests in a row without delivering a block");
                }
            } else {
                worker.failures++;
                consecutive_failures++;
                LOG_DOWNLOAD_DEBUG("Block " << *index << " failed (" << consecutive_failures << "/"
                                   << config_.max_consecutive_failures << "): " << e.what());
                if (consecutive_failures >= config_.max_consecutive_failures) {
                    worker.gave_up.store(true);
                    LOG_DOWNLOAD_ERROR("TransferFailure: giving up on " << name << " after "
                                       << consecutive_failures << " consecutive failures, last: " << e.what());
                    break;
                }
            }
            if (stop_token_.wait_for(backoff)) break;
        }
    }

    LOG_DOWNLOAD_DEBUG("Worker for " << name << " finished (" << worker.blocks_fetched.load() << " blocks)");
    active_workers_--;
    notify_progress();
}

void DownloadScheduler::monitor_loop() {
    const uint32_t total = metadata_.block_count();
    const std::chrono::milliseconds interval(config_.progress_interval_ms);
    auto next_report = std::chrono::steady_clock::now();

    while (true) {
        if (store_.all_owned()) {
            LOG_DOWNLOAD_INFO("All " << total << " blocks received");
            finish(DownloadResult::COMPLETE);
            break;
        }
        if (stop_token_.stop_requested() || finished_.load()) {
            LOG_DOWNLOAD_INFO("Download stopped at " << store_.owned_count() << "/" << total << " blocks");
            finish(DownloadResult::STOPPED);
            break;
        }
        if (active_workers_.load() == 0) {
            LOG_DOWNLOAD_ERROR("All workers gave up with " << store_.owned_count() << "/" << total << " blocks");
            finish(DownloadResult::FAILED);
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_report) {
            uint32_t owned = store_.owned_count();
            LOG_DOWNLOAD_INFO("Progress: " << owned << "/" << total << " blocks ("
                              << (total > 0 ? owned * 100ull / total : 100) << "%)");
            next_report = now + interval;
        }

        std::unique_lock<std::mutex> lock(progress_mutex_);
        progress_cv_.wait_until(lock, next_report);
    }
}

std::vector<NeighborStats> DownloadScheduler::get_neighbor_stats() const {
    std::vector<NeighborStats> result;
    for (const auto& worker : workers_) {
        NeighborStats stats;
        stats.neighbor = worker->neighbor.to_string();
        stats.blocks_fetched = worker->blocks_fetched.load();
        stats.bytes_fetched = worker->bytes_fetched.load();
        stats.failures = worker->failures.load();
        stats.refusals = worker->refusals.load();
        stats.gave_up = worker->gave_up.load();
        result.push_back(stats);
    }
    return result;
}

nlohmann::json DownloadScheduler::get_statistics_json() const {
    nlohmann::json json;
    json["filename"] = metadata_.filename();
    json["blocks_total"] = metadata_.block_count();
    json["blocks_owned"] = store_.owned_count();
    json["blocks_in_flight"] = picker_.claimed_count();
    json["active_workers"] = active_workers_.load();

    std::optional<DownloadResult> result = get_result();
    json["result"] = result ? download_result_to_string(*result) : "running";

    nlohmann::json neighbors = nlohmann::json::array();
    for (const auto& stats : get_neighbor_stats()) {
        nlohmann::json entry;
        entry["neighbor"] = stats.neighbor;
        entry["blocks_fetched"] = stats.blocks_fetched;
        entry["bytes_fetched"] = stats.bytes_fetched;
        entry["failures"] = stats.failures;
        entry["refusals"] = stats.refusals;
        entry["gave_up"] = stats.gave_up;
        neighbors.push_back(entry);
    }
    json["neighbors"] = neighbors;
    return json;
}

} // namespace blockshare
