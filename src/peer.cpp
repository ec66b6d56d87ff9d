#include "peer.h"
#include "logger.h"
#include "metadata_fetcher.h"

// Peer module logging macros
#define LOG_PEER_DEBUG(message) LOG_DEBUG("peer", message)
#define LOG_PEER_INFO(message)  LOG_INFO("peer", message)
#define LOG_PEER_WARN(message)  LOG_WARN("peer", message)
#define LOG_PEER_ERROR(message) LOG_ERROR("peer", message)

namespace blockshare {

Peer::Peer(const PeerConfig& config, StopToken& stop_token)
    : config_(config), stop_token_(stop_token) {
    provider_ = std::make_unique<Provider>(config_, store_, metadata_, stop_token_);
}

Peer::~Peer() {
    stop();
}

bool Peer::start() {
    if (config_.seed) {
        std::optional<FileMetadata> metadata = describe_file(config_.file, config_.block_size);
        if (!metadata) {
            LOG_PEER_ERROR("Cannot seed " << config_.file);
            return false;
        }
        if (!store_.load_from_file(config_.file, *metadata)) {
            LOG_PEER_ERROR("Failed to load blocks of " << config_.file);
            return false;
        }
        metadata_.publish(*metadata);
        LOG_PEER_INFO("Seeding " << metadata->filename() << " (" << metadata->file_size() << " bytes, "
                      << metadata->block_count() << " blocks)");
    }

    if (!provider_->start()) {
        LOG_PEER_ERROR("Failed to start serving on " << config_.host << ":" << config_.port);
        return false;
    }
    return true;
}

ExitCode Peer::run() {
    if (!start()) {
        return ExitCode::USAGE;
    }

    if (!config_.seed) {
        ExitCode code;
        try {
            code = download();
        } catch (const MetadataUnavailable& e) {
            if (stop_token_.stop_requested()) {
                code = ExitCode::OK;
            } else {
                LOG_PEER_ERROR("MetadataUnavailable: " << e.what());
                code = ExitCode::METADATA_UNAVAILABLE;
            }
        }
        if (code != ExitCode::OK || config_.exit_when_done || stop_token_.stop_requested()) {
            stop();
            return code;
        }
        LOG_PEER_INFO("Download verified, continuing to serve blocks");
    }

    return serve_until_stopped();
}

ExitCode Peer::download() {
    FileMetadata metadata = [this]() {
        MetadataFetcher fetcher(config_, stop_token_);
        FileMetadata fetched = fetcher.fetch();
        std::lock_guard<std::mutex> lock(state_mutex_);
        metadata_source_ = fetcher.get_source();
        return fetched;
    }();

    // Size the store before publishing so that anyone who saw the metadata can request blocks
    store_.set_metadata(metadata);
    metadata_.publish(metadata);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        scheduler_ = std::make_unique<DownloadScheduler>(config_, metadata, store_, stop_token_);
    }

    DownloadResult result = scheduler_->run();
    if (result == DownloadResult::STOPPED) {
        LOG_PEER_INFO("Download interrupted at " << store_.owned_count() << "/" << metadata.block_count() << " blocks");
        return ExitCode::OK;
    }
    if (result == DownloadResult::FAILED) {
        LOG_PEER_ERROR("Download of " << metadata.filename() << " failed: every neighbor was given up");
        return ExitCode::DOWNLOAD_FAILED;
    }

    VerifyResult verify = reconstruct_and_verify(store_, metadata, config_.outfile);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        verify_result_ = verify;
    }

    switch (verify) {
        case VerifyResult::VERIFIED:
            LOG_PEER_INFO("[OK] " << config_.outfile << " is intact (sha256 " << metadata.sha256() << ")");
            return ExitCode::OK;
        case VerifyResult::CORRUPT:
            LOG_PEER_ERROR("IntegrityMismatch: " << config_.outfile << " does not match the seeder's digest");
            return ExitCode::INTEGRITY_FAILURE;
        case VerifyResult::WRITE_FAILED:
            LOG_PEER_ERROR("Could not write " << config_.outfile);
            return ExitCode::INTEGRITY_FAILURE;
    }
    return ExitCode::INTEGRITY_FAILURE;
}

ExitCode Peer::serve_until_stopped() {
    LOG_PEER_INFO("Serving on port " << get_listen_port() << ", press Ctrl+C to stop");
    stop_token_.wait();
    stop();
    return ExitCode::OK;
}

void Peer::stop() {
    if (provider_) {
        provider_->stop();
    }
}

int Peer::get_listen_port() const {
    return provider_->get_listen_port();
}

std::optional<VerifyResult> Peer::get_verify_result() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return verify_result_;
}

nlohmann::json Peer::get_statistics_json() const {
    nlohmann::json json;
    json["role"] = config_.seed ? "seeder" : "leecher";
    json["listen_port"] = get_listen_port();

    std::optional<FileMetadata> metadata = metadata_.get();
    if (metadata) {
        json["file"] = {
            {"filename", metadata->filename()},
            {"filesize", metadata->file_size()},
            {"blocksize", metadata->block_size()},
            {"num_blocks", metadata->block_count()},
            {"sha256", metadata->sha256()}
        };
    }
    json["blocks_owned"] = store_.owned_count();
    json["provider"] = provider_->get_statistics_json();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!metadata_source_.empty()) {
        json["metadata_source"] = metadata_source_;
    }
    if (scheduler_) {
        json["download"] = scheduler_->get_statistics_json();
    }
    if (verify_result_) {
        json["verify"] = verify_result_to_string(*verify_result_);
    }
    return json;
}

} // namespace blockshare
