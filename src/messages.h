#pragma once

#include "file_metadata.h"
#include "frame_codec.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockshare {

/**
 * A well-framed record that is not a valid control message
 * (not JSON, missing or unknown type, missing or mistyped field)
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Control message types. The wire name of each is its upper-case spelling,
 * ERROR_REPLY travels as "ERROR".
 */
enum class MessageType {
    METADATA,
    METADATA_REPLY,
    REQUEST,
    BLOCK,
    ERROR_REPLY
};

std::string message_type_to_string(MessageType type);

/**
 * @return false for an unknown wire name
 */
bool message_type_from_string(const std::string& name, MessageType& type);

/** Reasons carried by ERROR replies */
extern const char* const ERROR_REASON_NOT_OWNED;
extern const char* const ERROR_REASON_METADATA_UNAVAILABLE;
extern const char* const ERROR_REASON_MALFORMED;
extern const char* const ERROR_REASON_UNKNOWN_TYPE;
extern const char* const ERROR_REASON_UNEXPECTED_TYPE;

/**
 * Header announcing the raw block frame that follows it
 */
struct BlockHeader {
    uint32_t block_index;
    uint32_t block_len;
};

// Message creation
nlohmann::json create_metadata_request();
nlohmann::json create_metadata_reply(const FileMetadata& metadata);
nlohmann::json create_block_request(uint32_t block_index);
nlohmann::json create_block_header(uint32_t block_index, uint32_t block_len);
nlohmann::json create_error_message(const std::string& reason = "");

// Message parsing. All of these throw ProtocolError on invalid input.

/**
 * Decode a frame payload into a JSON object
 */
nlohmann::json parse_message(const std::vector<uint8_t>& payload);

/**
 * Read the "type" field
 */
MessageType get_message_type(const nlohmann::json& message);

/**
 * Decode a METADATA_REPLY. num_blocks must match the count derived from
 * filesize and blocksize.
 */
FileMetadata parse_metadata_reply(const nlohmann::json& message);

/**
 * Read the block_index of a REQUEST
 */
uint32_t parse_block_index(const nlohmann::json& message);

/**
 * Decode a BLOCK header
 */
BlockHeader parse_block_header(const nlohmann::json& message);

/**
 * Optional reason of an ERROR reply, empty when absent
 */
std::string get_error_reason(const nlohmann::json& message);

// Transport helpers on top of the frame codec

/**
 * Send a control message as one frame
 * @throws FramingError
 */
void send_message(socket_t socket, const nlohmann::json& message);

/**
 * Receive one frame and decode it as a control message
 * @throws FramingError, ProtocolError
 */
nlohmann::json receive_message(socket_t socket, size_t max_payload);

/** Upper bound on the size of a control message frame */
constexpr size_t MAX_CONTROL_MESSAGE_SIZE = 64 * 1024;

} // namespace blockshare
