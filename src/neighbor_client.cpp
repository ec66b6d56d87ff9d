#include "neighbor_client.h"
#include "frame_codec.h"
#include "logger.h"
#include "messages.h"
#include "socket.h"

#define LOG_CLIENT_DEBUG(message) LOG_DEBUG("client", message)

namespace blockshare {

namespace {

SocketGuard open_connection(const PeerAddress& neighbor, const std::string& name,
                            int connect_timeout_ms, int request_timeout_ms) {
    SocketGuard connection(create_tcp_client(neighbor.host, neighbor.port, connect_timeout_ms));
    if (!connection.valid()) {
        throw TransferFailure(name, "connection failed");
    }
    if (!set_socket_timeouts(connection.get(), request_timeout_ms, request_timeout_ms)) {
        throw TransferFailure(name, "could not set socket timeouts");
    }
    return connection;
}

void throw_if_error_reply(const nlohmann::json& reply, const std::string& name) {
    if (get_message_type(reply) == MessageType::ERROR_REPLY) {
        std::string reason = get_error_reason(reply);
        throw TransferFailure(name, "neighbor answered ERROR" + (reason.empty() ? std::string() : " (" + reason + ")"),
                              reason == ERROR_REASON_NOT_OWNED);
    }
}

} // anonymous namespace

NeighborClient::NeighborClient(const PeerAddress& neighbor, int connect_timeout_ms, int request_timeout_ms)
    : neighbor_(neighbor),
      name_(neighbor.to_string()),
      connect_timeout_ms_(connect_timeout_ms),
      request_timeout_ms_(request_timeout_ms) {
}

FileMetadata NeighborClient::fetch_metadata() const {
    SocketGuard connection = open_connection(neighbor_, name_, connect_timeout_ms_, request_timeout_ms_);

    try {
        send_message(connection.get(), create_metadata_request());
        nlohmann::json reply = receive_message(connection.get(), MAX_CONTROL_MESSAGE_SIZE);
        throw_if_error_reply(reply, name_);
        FileMetadata metadata = parse_metadata_reply(reply);
        LOG_CLIENT_DEBUG("Metadata from " << name_ << ": " << metadata.filename() << ", "
                         << metadata.file_size() << " bytes");
        return metadata;
    } catch (const FramingError& e) {
        throw TransferFailure(name_, std::string("metadata exchange failed: ") + e.what());
    } catch (const ProtocolError& e) {
        throw TransferFailure(name_, std::string("invalid metadata reply: ") + e.what());
    }
}

std::vector<uint8_t> NeighborClient::fetch_block(uint32_t block_index, uint32_t expected_length) const {
    SocketGuard connection = open_connection(neighbor_, name_, connect_timeout_ms_, request_timeout_ms_);

    try {
        send_message(connection.get(), create_block_request(block_index));

        nlohmann::json reply = receive_message(connection.get(), MAX_CONTROL_MESSAGE_SIZE);
        throw_if_error_reply(reply, name_);

        BlockHeader header = parse_block_header(reply);
        if (header.block_index != block_index) {
            throw TransferFailure(name_, "asked for block " + std::to_string(block_index) +
                                  ", header announces " + std::to_string(header.block_index));
        }
        if (header.block_len != expected_length) {
            throw TransferFailure(name_, "block " + std::to_string(block_index) + " announced with " +
                                  std::to_string(header.block_len) + " bytes, expected " +
                                  std::to_string(expected_length));
        }

        std::vector<uint8_t> payload = read_frame(connection.get(), expected_length);
        if (payload.size() != expected_length) {
            throw TransferFailure(name_, "block " + std::to_string(block_index) + " payload has " +
                                  std::to_string(payload.size()) + " bytes, expected " +
                                  std::to_string(expected_length));
        }
        return payload;
    } catch (const FramingError& e) {
        throw TransferFailure(name_, "block " + std::to_string(block_index) + " exchange failed: " + e.what());
    } catch (const ProtocolError& e) {
        throw TransferFailure(name_, "invalid reply for block " + std::to_string(block_index) + ": " + e.what());
    }
}

} // namespace blockshare
