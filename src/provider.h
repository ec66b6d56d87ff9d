#pragma once

#include "block_store.h"
#include "file_metadata.h"
#include "peer_config.h"
#include "socket.h"
#include "stop_token.h"
#include "threadmanager.h"

#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace blockshare {

/**
 * Counters of the serving side
 */
struct ProviderStats {
    uint64_t sessions_accepted = 0;
    uint64_t metadata_served = 0;
    uint64_t blocks_served = 0;
    uint64_t bytes_served = 0;
    uint64_t errors_sent = 0;
};

/**
 * Block provider: listens on the configured address and answers METADATA and
 * REQUEST messages, one thread per inbound connection.
 *
 * The provider only reads shared state: blocks from the BlockStore and the
 * file description from the MetadataSlot. A METADATA request that arrives
 * before a leecher knows the metadata waits for it up to
 * metadata_wait_timeout_ms, then gets ERROR "metadata_unavailable".
 */
class Provider : public ThreadManager {
public:
    Provider(const PeerConfig& config, const BlockStore& store, const MetadataSlot& metadata, StopToken& stop_token);
    ~Provider();

    Provider(const Provider&) = delete;
    Provider& operator=(const Provider&) = delete;

    /**
     * Bind the listening socket and start the accept loop
     * @return false if already running or the socket could not be bound
     */
    bool start();

    /**
     * Stop accepting, shut down live sessions and join every thread
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * Port actually bound (differs from the configured one when it was 0)
     */
    int get_listen_port() const { return listen_port_.load(); }

    size_t get_session_count() const;

    ProviderStats get_stats() const;
    nlohmann::json get_statistics_json() const;

private:
    void server_loop();
    void handle_session(socket_t client_socket, const std::string& peer_address);

    /**
     * Answer one request frame
     * @return false if the connection must be closed
     */
    bool handle_request(socket_t client_socket, const std::vector<uint8_t>& frame, const std::string& peer_address);

    void serve_metadata(socket_t client_socket, const std::string& peer_address);
    void serve_block(socket_t client_socket, uint32_t block_index, const std::string& peer_address);
    void send_error(socket_t client_socket, const std::string& reason, const std::string& peer_address);

    void register_session(socket_t client_socket);
    void unregister_session(socket_t client_socket);

    const PeerConfig& config_;
    const BlockStore& store_;
    const MetadataSlot& metadata_;
    StopToken& stop_token_;

    std::atomic<bool> running_;
    socket_t server_socket_;
    std::atomic<int> listen_port_;

    mutable std::mutex sessions_mutex_;
    std::set<socket_t> sessions_;

    std::atomic<uint64_t> sessions_accepted_;
    std::atomic<uint64_t> metadata_served_;
    std::atomic<uint64_t> blocks_served_;
    std::atomic<uint64_t> bytes_served_;
    std::atomic<uint64_t> errors_sent_;
};

} // namespace blockshare
