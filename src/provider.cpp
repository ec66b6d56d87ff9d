#include "provider.h"
#include "frame_codec.h"
#include "logger.h"
#include "messages.h"

#include <algorithm>
#include <chrono>

// Provider module logging macros
#define LOG_PROVIDER_DEBUG(message) LOG_DEBUG("provider", message)
#define LOG_PROVIDER_INFO(message)  LOG_INFO("provider", message)
#define LOG_PROVIDER_WARN(message)  LOG_WARN("provider", message)
#define LOG_PROVIDER_ERROR(message) LOG_ERROR("provider", message)

namespace blockshare {

namespace {

// Slice of a metadata wait between checks of the running flag
constexpr std::chrono::milliseconds METADATA_WAIT_SLICE(100);

} // anonymous namespace

Provider::Provider(const PeerConfig& config, const BlockStore& store, const MetadataSlot& metadata, StopToken& stop_token)
    : config_(config),
      store_(store),
      metadata_(metadata),
      stop_token_(stop_token),
      running_(false),
      server_socket_(INVALID_SOCKET_VALUE),
      listen_port_(0),
      sessions_accepted_(0),
      metadata_served_(0),
      blocks_served_(0),
      bytes_served_(0),
      errors_sent_(0) {
}

Provider::~Provider() {
    stop();
}

bool Provider::start() {
    if (running_.load()) {
        LOG_PROVIDER_WARN("Provider is already running");
        return false;
    }

    if (!init_socket_library()) {
        return false;
    }

    server_socket_ = create_tcp_server(config_.host, config_.port);
    if (!is_valid_socket(server_socket_)) {
        LOG_PROVIDER_ERROR("Failed to listen on " << config_.host << ":" << config_.port);
        return false;
    }
    listen_port_.store(get_bound_port(server_socket_));

    running_.store(true);
    if (!add_managed_thread([this]() { server_loop(); }, "provider-accept")) {
        running_.store(false);
        close_socket(server_socket_);
        server_socket_ = INVALID_SOCKET_VALUE;
        return false;
    }

    LOG_PROVIDER_INFO("Serving blocks on " << config_.host << ":" << listen_port_.load());
    return true;
}

void Provider::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_PROVIDER_INFO("Stopping provider");
    shutdown_all_threads();

    // Wake the accept poll and every session blocked in recv
    shutdown_socket(server_socket_);
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        LOG_PROVIDER_DEBUG("Shutting down " << sessions_.size() << " live sessions");
        for (socket_t session : sessions_) {
            shutdown_socket(session);
        }
    }

    join_all_active_threads();

    close_socket(server_socket_);
    server_socket_ = INVALID_SOCKET_VALUE;

    LOG_PROVIDER_INFO("Provider stopped (" << blocks_served_.load() << " blocks, "
                      << bytes_served_.load() << " bytes served)");
}

void Provider::server_loop() {
    LOG_PROVIDER_DEBUG("Accept loop started");

    while (running_.load() && !stop_token_.stop_requested()) {
        cleanup_finished_threads();

        bool timed_out = false;
        socket_t client_socket = accept_client(server_socket_, config_.accept_poll_ms, &timed_out);
        if (!is_valid_socket(client_socket)) {
            if (timed_out) {
                continue;
            }
            if (running_.load()) {
                LOG_PROVIDER_ERROR("Failed to accept client connection");
                // Avoid spinning on a persistent accept error
                stop_token_.wait_for(std::chrono::milliseconds(config_.retry_backoff_ms));
                continue;
            }
            break;
        }

        std::string peer_address = get_peer_address(client_socket);
        sessions_accepted_++;
        LOG_PROVIDER_DEBUG("Accepted connection from " << peer_address);

        bool started = add_managed_thread([this, client_socket, peer_address]() {
            handle_session(client_socket, peer_address);
        }, "session-" + peer_address);

        if (!started) {
            close_socket(client_socket);
        }
    }

    LOG_PROVIDER_DEBUG("Accept loop finished");
}

void Provider::handle_session(socket_t client_socket, const std::string& peer_address) {
    SocketGuard guard(client_socket);

    // Unregistered before the guard closes the socket
    struct Registration {
        Provider* provider;
        socket_t socket;
        ~Registration() { provider->unregister_session(socket); }
    };
    register_session(client_socket);
    Registration registration{this, client_socket};

    if (!set_socket_timeouts(client_socket, config_.session_idle_timeout_ms, config_.request_timeout_ms)) {
        LOG_PROVIDER_WARN("Could not set timeouts for session with " << peer_address);
    }

    while (running_.load()) {
        std::vector<uint8_t> frame;
        try {
            frame = read_frame(client_socket, MAX_CONTROL_MESSAGE_SIZE);
        } catch (const ConnectionClosed&) {
            LOG_PROVIDER_DEBUG("Session with " << peer_address << " closed by peer");
            break;
        } catch (const FrameTimeout&) {
            LOG_PROVIDER_INFO("Session with " << peer_address << " idle for "
                              << config_.session_idle_timeout_ms << "ms, closing");
            break;
        } catch (const FramingError& e) {
            if (running_.load()) {
                LOG_PROVIDER_WARN("Unreadable frame from " << peer_address << ": " << e.what());
            }
            break;
        }

        try {
            if (!handle_request(client_socket, frame, peer_address)) {
                break;
            }
        } catch (const FramingError& e) {
            LOG_PROVIDER_WARN("Failed to answer " << peer_address << ": " << e.what());
            break;
        }
    }
}

bool Provider::handle_request(socket_t client_socket, const std::vector<uint8_t>& frame, const std::string& peer_address) {
    nlohmann::json message;
    try {
        message = parse_message(frame);
    } catch (const ProtocolError& e) {
        LOG_PROVIDER_WARN("Malformed frame from " << peer_address << ": " << e.what());
        send_error(client_socket, ERROR_REASON_MALFORMED, peer_address);
        return false;
    }

    MessageType type;
    try {
        type = get_message_type(message);
    } catch (const ProtocolError& e) {
        LOG_PROVIDER_WARN("Invalid request from " << peer_address << ": " << e.what());
        send_error(client_socket, message.contains("type") ? ERROR_REASON_UNKNOWN_TYPE : ERROR_REASON_MALFORMED,
                   peer_address);
        return true;
    }

    switch (type) {
        case MessageType::METADATA:
            serve_metadata(client_socket, peer_address);
            return true;

        case MessageType::REQUEST: {
            uint32_t block_index;
            try {
                block_index = parse_block_index(message);
            } catch (const ProtocolError& e) {
                LOG_PROVIDER_WARN("Invalid REQUEST from " << peer_address << ": " << e.what());
                send_error(client_socket, ERROR_REASON_MALFORMED, peer_address);
                return true;
            }
            serve_block(client_socket, block_index, peer_address);
            return true;
        }

        default:
            LOG_PROVIDER_WARN("Unexpected " << message_type_to_string(type) << " from " << peer_address);
            send_error(client_socket, ERROR_REASON_UNEXPECTED_TYPE, peer_address);
            return true;
    }
}

void Provider::serve_metadata(socket_t client_socket, const std::string& peer_address) {
    std::optional<FileMetadata> metadata = metadata_.get();

    if (!metadata) {
        LOG_PROVIDER_DEBUG("METADATA from " << peer_address << " before metadata is known, waiting");
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.metadata_wait_timeout_ms);
        while (!metadata && running_.load()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }
            metadata = metadata_.wait_for(std::min(remaining, METADATA_WAIT_SLICE));
        }
    }

    if (!metadata) {
        LOG_PROVIDER_INFO("Metadata still unknown, refusing METADATA from " << peer_address);
        send_error(client_socket, ERROR_REASON_METADATA_UNAVAILABLE, peer_address);
        return;
    }

    send_message(client_socket, create_metadata_reply(*metadata));
    metadata_served_++;
    LOG_PROVIDER_DEBUG("Sent metadata to " << peer_address);
}

void Provider::serve_block(socket_t client_socket, uint32_t block_index, const std::string& peer_address) {
    std::vector<uint8_t> payload;
    try {
        payload = store_.get(block_index);
    } catch (const BlockNotOwned&) {
        LOG_PROVIDER_DEBUG("Block " << block_index << " requested by " << peer_address << " is not owned");
        send_error(client_socket, ERROR_REASON_NOT_OWNED, peer_address);
        return;
    }

    send_message(client_socket, create_block_header(block_index, static_cast<uint32_t>(payload.size())));
    write_frame(client_socket, payload);

    blocks_served_++;
    bytes_served_ += payload.size();
    LOG_PROVIDER_DEBUG("Sent block " << block_index << " (" << payload.size() << " bytes) to " << peer_address);
}

void Provider::send_error(socket_t client_socket, const std::string& reason, const std::string& peer_address) {
    try {
        send_message(client_socket, create_error_message(reason));
        errors_sent_++;
    } catch (const FramingError& e) {
        LOG_PROVIDER_DEBUG("Could not send ERROR to " << peer_address << ": " << e.what());
        throw;
    }
}

void Provider::register_session(socket_t client_socket) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.insert(client_socket);
    // Stop may have run between accept and registration
    if (!running_.load()) {
        shutdown_socket(client_socket);
    }
}

void Provider::unregister_session(socket_t client_socket) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(client_socket);
}

size_t Provider::get_session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

ProviderStats Provider::get_stats() const {
    ProviderStats stats;
    stats.sessions_accepted = sessions_accepted_.load();
    stats.metadata_served = metadata_served_.load();
    stats.blocks_served = blocks_served_.load();
    stats.bytes_served = bytes_served_.load();
    stats.errors_sent = errors_sent_.load();
    return stats;
}

nlohmann::json Provider::get_statistics_json() const {
    ProviderStats stats = get_stats();
    nlohmann::json json;
    json["listen_port"] = get_listen_port();
    json["running"] = is_running();
    json["live_sessions"] = get_session_count();
    json["sessions_accepted"] = stats.sessions_accepted;
    json["metadata_served"] = stats.metadata_served;
    json["blocks_served"] = stats.blocks_served;
    json["bytes_served"] = stats.bytes_served;
    json["errors_sent"] = stats.errors_sent;
    return json;
}

} // namespace blockshare
