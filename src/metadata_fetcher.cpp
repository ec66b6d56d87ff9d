#include "metadata_fetcher.h"
#include "logger.h"

#include <chrono>

#define LOG_FETCHER_DEBUG(message) LOG_DEBUG("metadata", message)
#define LOG_FETCHER_INFO(message)  LOG_INFO("metadata", message)
#define LOG_FETCHER_WARN(message)  LOG_WARN("metadata", message)
#define LOG_FETCHER_ERROR(message) LOG_ERROR("metadata", message)

namespace blockshare {

MetadataFetcher::MetadataFetcher(const PeerConfig& config, StopToken& stop_token)
    : config_(config), stop_token_(stop_token) {
}

FileMetadata MetadataFetcher::fetch() {
    if (config_.peers.empty()) {
        throw MetadataUnavailable("no neighbors configured");
    }

    for (int attempt = 1; attempt <= config_.metadata_attempts; ++attempt) {
        for (const auto& neighbor : config_.peers) {
            if (stop_token_.stop_requested()) {
                throw MetadataUnavailable("stopped while fetching metadata");
            }

            LOG_FETCHER_DEBUG("Requesting metadata from " << neighbor.to_string()
                              << " (sweep " << attempt << "/" << config_.metadata_attempts << ")");
            NeighborClient client(neighbor, config_.connect_timeout_ms, config_.request_timeout_ms);
            try {
                FileMetadata metadata = client.fetch_metadata();
                source_ = neighbor.to_string();
                LOG_FETCHER_INFO("Metadata received from " << source_ << ": " << metadata.filename()
                                 << ", " << metadata.file_size() << " bytes, " << metadata.block_count()
                                 << " blocks of " << metadata.block_size() << ", sha256 " << metadata.sha256());
                return metadata;
            } catch (const TransferFailure& e) {
                LOG_FETCHER_WARN("No metadata from " << e.what());
            }
        }

        if (attempt < config_.metadata_attempts) {
            if (stop_token_.wait_for(std::chrono::milliseconds(config_.retry_backoff_ms))) {
                throw MetadataUnavailable("stopped while fetching metadata");
            }
        }
    }

    LOG_FETCHER_ERROR("Could not obtain metadata from any of " << config_.peers.size() << " neighbors");
    throw MetadataUnavailable("no neighbor returned valid metadata");
}

} // namespace blockshare
