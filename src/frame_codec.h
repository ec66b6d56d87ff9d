#pragma once

#include "socket.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockshare {

/**
 * A frame could not be read or written on a connection.
 * Local to that connection: the caller closes it and carries on.
 */
class FramingError : public std::runtime_error {
public:
    explicit FramingError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * The peer closed the connection before a full header or body arrived
 */
class ConnectionClosed : public FramingError {
public:
    explicit ConnectionClosed(const std::string& what) : FramingError(what) {}
};

/**
 * The socket receive timeout expired in the middle of a read
 */
class FrameTimeout : public FramingError {
public:
    explicit FrameTimeout(const std::string& what) : FramingError(what) {}
};

/** Size of the big-endian length prefix */
constexpr size_t FRAME_HEADER_SIZE = 4;

/** Passed as max_payload to accept any declared length */
constexpr size_t FRAME_NO_LIMIT = 0;

/**
 * Encode a frame (length prefix followed by payload) into one buffer
 */
std::vector<uint8_t> encode_frame(const uint8_t* payload, size_t size);

/**
 * Write one frame as a single logical write
 * @throws FramingError if the payload exceeds 4 GiB - 1 or the send fails
 */
void write_frame(socket_t socket, const uint8_t* payload, size_t size);
void write_frame(socket_t socket, const std::vector<uint8_t>& payload);
void write_frame(socket_t socket, const std::string& payload);

/**
 * Read exactly num_bytes, looping over partial reads
 * @throws ConnectionClosed, FrameTimeout or FramingError
 */
void receive_exact_bytes(socket_t socket, uint8_t* buffer, size_t num_bytes);

/**
 * Read one frame and return its payload (possibly empty)
 * @param socket Connected socket
 * @param max_payload Largest accepted declared length, FRAME_NO_LIMIT for none
 * @throws FramingError when the declared length exceeds max_payload (nothing of the body is read)
 * @throws ConnectionClosed if the peer closes before the frame is complete
 * @throws FrameTimeout if the socket receive timeout expires
 */
std::vector<uint8_t> read_frame(socket_t socket, size_t max_payload = FRAME_NO_LIMIT);

/**
 * read_frame() returning the payload as a string
 */
std::string read_frame_string(socket_t socket, size_t max_payload = FRAME_NO_LIMIT);

} // namespace blockshare
