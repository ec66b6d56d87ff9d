#pragma once

#include "block_store.h"
#include "download_scheduler.h"
#include "file_metadata.h"
#include "peer_config.h"
#include "provider.h"
#include "reconstructor.h"
#include "stop_token.h"

#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace blockshare {

/**
 * Process exit codes
 */
enum class ExitCode : int {
    OK = 0,
    USAGE = 1,
    METADATA_UNAVAILABLE = 2,
    DOWNLOAD_FAILED = 3,
    INTEGRITY_FAILURE = 4
};

/**
 * One participant of the exchange. Always serves blocks; a leecher also
 * acquires the metadata, downloads the missing blocks and reconstructs the file.
 *
 * Components share state only through the BlockStore and the MetadataSlot.
 */
class Peer {
public:
    /**
     * @param config Validated configuration (copied)
     * @param stop_token Stops every loop of this peer
     */
    Peer(const PeerConfig& config, StopToken& stop_token);
    ~Peer();

    Peer(const Peer&) = delete;
    Peer& operator=(const Peer&) = delete;

    /**
     * Prepare the role and start serving. A seeder loads and describes its
     * file first, so that it never serves without metadata.
     * @return false if the source file cannot be loaded or the port cannot be bound
     */
    bool start();

    /**
     * Run the whole lifecycle: start, download and verify for a leecher,
     * then serve until stopped (or return right after verification with
     * exit_when_done)
     * @return Exit status of the process
     */
    ExitCode run();

    /**
     * Stop serving and join all threads
     */
    void stop();

    bool is_seeder() const { return config_.seed; }
    int get_listen_port() const;

    const BlockStore& get_store() const { return store_; }
    const MetadataSlot& get_metadata_slot() const { return metadata_; }
    std::optional<VerifyResult> get_verify_result() const;

    /**
     * Role, progress and per-component counters
     */
    nlohmann::json get_statistics_json() const;

private:
    ExitCode download();
    ExitCode serve_until_stopped();

    PeerConfig config_;
    StopToken& stop_token_;
    BlockStore store_;
    MetadataSlot metadata_;
    std::unique_ptr<Provider> provider_;
    std::unique_ptr<DownloadScheduler> scheduler_;

    mutable std::mutex state_mutex_;
    std::optional<VerifyResult> verify_result_;
    std::string metadata_source_;
};

} // namespace blockshare
