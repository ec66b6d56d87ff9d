#include "frame_codec.h"
#include "logger.h"
#include <limits>

// Frame codec module logging macros
#define LOG_FRAME_DEBUG(message) LOG_DEBUG("frame", message)
#define LOG_FRAME_WARN(message)  LOG_WARN("frame", message)

namespace blockshare {

std::vector<uint8_t> encode_frame(const uint8_t* payload, size_t size) {
    if (size > std::numeric_limits<uint32_t>::max()) {
        throw FramingError("Frame payload too large: " + std::to_string(size) + " bytes");
    }

    uint32_t length = static_cast<uint32_t>(size);
    std::vector<uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + size);
    frame.push_back(static_cast<uint8_t>(length >> 24));
    frame.push_back(static_cast<uint8_t>(length >> 16));
    frame.push_back(static_cast<uint8_t>(length >> 8));
    frame.push_back(static_cast<uint8_t>(length));
    if (size > 0) {
        frame.insert(frame.end(), payload, payload + size);
    }
    return frame;
}

void write_frame(socket_t socket, const uint8_t* payload, size_t size) {
    std::vector<uint8_t> frame = encode_frame(payload, size);
    if (!send_tcp_all(socket, frame.data(), frame.size())) {
        throw FramingError("Failed to send frame of " + std::to_string(size) + " bytes");
    }
    LOG_FRAME_DEBUG("Sent frame (" << size << " bytes) on socket " << socket);
}

void write_frame(socket_t socket, const std::vector<uint8_t>& payload) {
    write_frame(socket, payload.data(), payload.size());
}

void write_frame(socket_t socket, const std::string& payload) {
    write_frame(socket, reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

void receive_exact_bytes(socket_t socket, uint8_t* buffer, size_t num_bytes) {
    size_t total_received = 0;
    while (total_received < num_bytes) {
        int received = receive_tcp_bytes(socket, buffer + total_received, num_bytes - total_received);
        if (received > 0) {
            total_received += static_cast<size_t>(received);
            continue;
        }
        if (received == RECEIVE_CLOSED) {
            throw ConnectionClosed("Connection closed after " + std::to_string(total_received) +
                                   " of " + std::to_string(num_bytes) + " bytes");
        }
        if (received == RECEIVE_TIMEOUT) {
            throw FrameTimeout("Timed out after " + std::to_string(total_received) +
                               " of " + std::to_string(num_bytes) + " bytes");
        }
        throw FramingError("Receive failed after " + std::to_string(total_received) +
                           " of " + std::to_string(num_bytes) + " bytes");
    }
}

std::vector<uint8_t> read_frame(socket_t socket, size_t max_payload) {
    uint8_t header[FRAME_HEADER_SIZE];
    receive_exact_bytes(socket, header, FRAME_HEADER_SIZE);

    uint32_t length = (static_cast<uint32_t>(header[0]) << 24) |
                      (static_cast<uint32_t>(header[1]) << 16) |
                      (static_cast<uint32_t>(header[2]) << 8) |
                      static_cast<uint32_t>(header[3]);

    if (max_payload != FRAME_NO_LIMIT && length > max_payload) {
        LOG_FRAME_WARN("Rejecting frame of " << length << " bytes on socket " << socket
                       << " (limit " << max_payload << ")");
        throw FramingError("Declared frame length " + std::to_string(length) +
                           " exceeds limit " + std::to_string(max_payload));
    }

    std::vector<uint8_t> payload(length);
    if (length > 0) {
        receive_exact_bytes(socket, payload.data(), length);
    }

    LOG_FRAME_DEBUG("Received frame (" << length << " bytes) on socket " << socket);
    return payload;
}

std::string read_frame_string(socket_t socket, size_t max_payload) {
    std::vector<uint8_t> payload = read_frame(socket, max_payload);
    return std::string(payload.begin(), payload.end());
}

} // namespace blockshare
