#include "messages.h"
#include "sha256.h"

namespace blockshare {

const char* const ERROR_REASON_NOT_OWNED = "not_owned";
const char* const ERROR_REASON_METADATA_UNAVAILABLE = "metadata_unavailable";
const char* const ERROR_REASON_MALFORMED = "malformed";
const char* const ERROR_REASON_UNKNOWN_TYPE = "unknown_type";
const char* const ERROR_REASON_UNEXPECTED_TYPE = "unexpected_type";

namespace {

uint64_t require_unsigned(const nlohmann::json& message, const char* field) {
    auto it = message.find(field);
    if (it == message.end()) {
        throw ProtocolError(std::string("missing field '") + field + "'");
    }
    if (!it->is_number_unsigned()) {
        throw ProtocolError(std::string("field '") + field + "' is not an unsigned integer");
    }
    return it->get<uint64_t>();
}

uint32_t require_uint32(const nlohmann::json& message, const char* field) {
    uint64_t value = require_unsigned(message, field);
    if (value > 0xFFFFFFFFull) {
        throw ProtocolError(std::string("field '") + field + "' out of range");
    }
    return static_cast<uint32_t>(value);
}

std::string require_string(const nlohmann::json& message, const char* field) {
    auto it = message.find(field);
    if (it == message.end()) {
        throw ProtocolError(std::string("missing field '") + field + "'");
    }
    if (!it->is_string()) {
        throw ProtocolError(std::string("field '") + field + "' is not a string");
    }
    return it->get<std::string>();
}

void expect_type(const nlohmann::json& message, MessageType expected) {
    MessageType actual = get_message_type(message);
    if (actual != expected) {
        throw ProtocolError("expected " + message_type_to_string(expected) +
                            ", got " + message_type_to_string(actual));
    }
}

} // anonymous namespace

std::string message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::METADATA:       return "METADATA";
        case MessageType::METADATA_REPLY: return "METADATA_REPLY";
        case MessageType::REQUEST:        return "REQUEST";
        case MessageType::BLOCK:          return "BLOCK";
        case MessageType::ERROR_REPLY:    return "ERROR";
    }
    return "UNKNOWN";
}

bool message_type_from_string(const std::string& name, MessageType& type) {
    if (name == "METADATA") {
        type = MessageType::METADATA;
    } else if (name == "METADATA_REPLY") {
        type = MessageType::METADATA_REPLY;
    } else if (name == "REQUEST") {
        type = MessageType::REQUEST;
    } else if (name == "BLOCK") {
        type = MessageType::BLOCK;
    } else if (name == "ERROR") {
        type = MessageType::ERROR_REPLY;
    } else {
        return false;
    }
    return true;
}

// Message creation

nlohmann::json create_metadata_request() {
    nlohmann::json message;
    message["type"] = message_type_to_string(MessageType::METADATA);
    return message;
}

nlohmann::json create_metadata_reply(const FileMetadata& metadata) {
    nlohmann::json message;
    message["type"] = message_type_to_string(MessageType::METADATA_REPLY);
    message["filename"] = metadata.filename();
    message["filesize"] = metadata.file_size();
    message["blocksize"] = metadata.block_size();
    message["num_blocks"] = metadata.block_count();
    message["sha256"] = metadata.sha256();
    return message;
}

nlohmann::json create_block_request(uint32_t block_index) {
    nlohmann::json message;
    message["type"] = message_type_to_string(MessageType::REQUEST);
    message["block_index"] = block_index;
    return message;
}

nlohmann::json create_block_header(uint32_t block_index, uint32_t block_len) {
    nlohmann::json message;
    message["type"] = message_type_to_string(MessageType::BLOCK);
    message["block_index"] = block_index;
    message["block_len"] = block_len;
    return message;
}

nlohmann::json create_error_message(const std::string& reason) {
    nlohmann::json message;
    message["type"] = message_type_to_string(MessageType::ERROR_REPLY);
    if (!reason.empty()) {
        message["reason"] = reason;
    }
    return message;
}

// Message parsing

nlohmann::json parse_message(const std::vector<uint8_t>& payload) {
    nlohmann::json message = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (message.is_discarded()) {
        throw ProtocolError("frame is not valid JSON");
    }
    if (!message.is_object()) {
        throw ProtocolError("message is not a JSON object");
    }
    return message;
}

MessageType get_message_type(const nlohmann::json& message) {
    std::string name = require_string(message, "type");
    MessageType type;
    if (!message_type_from_string(name, type)) {
        throw ProtocolError("unknown message type '" + name + "'");
    }
    return type;
}

FileMetadata parse_metadata_reply(const nlohmann::json& message) {
    expect_type(message, MessageType::METADATA_REPLY);

    std::string filename = require_string(message, "filename");
    uint64_t file_size = require_unsigned(message, "filesize");
    uint32_t block_size = require_uint32(message, "blocksize");
    uint32_t num_blocks = require_uint32(message, "num_blocks");
    std::string digest = require_string(message, "sha256");

    if (block_size == 0) {
        throw ProtocolError("blocksize is zero");
    }
    if (!is_sha256_hex(digest)) {
        throw ProtocolError("sha256 is not a 64-character hex digest");
    }

    try {
        FileMetadata metadata(filename, file_size, block_size, digest);
        if (metadata.block_count() != num_blocks) {
            throw ProtocolError("num_blocks " + std::to_string(num_blocks) + " does not match derived count " +
                                std::to_string(metadata.block_count()));
        }
        return metadata;
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(std::string("invalid metadata: ") + e.what());
    }
}

uint32_t parse_block_index(const nlohmann::json& message) {
    expect_type(message, MessageType::REQUEST);
    return require_uint32(message, "block_index");
}

BlockHeader parse_block_header(const nlohmann::json& message) {
    expect_type(message, MessageType::BLOCK);
    BlockHeader header;
    header.block_index = require_uint32(message, "block_index");
    header.block_len = require_uint32(message, "block_len");
    return header;
}

std::string get_error_reason(const nlohmann::json& message) {
    auto it = message.find("reason");
    if (it != message.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

// Transport helpers

void send_message(socket_t socket, const nlohmann::json& message) {
    write_frame(socket, message.dump());
}

nlohmann::json receive_message(socket_t socket, size_t max_payload) {
    return parse_message(read_frame(socket, max_payload));
}

} // namespace blockshare
