#pragma once

#include "file_metadata.h"
#include "network_utils.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockshare {

/**
 * One request to a neighbor failed: unreachable, timed out, answered ERROR,
 * or sent a malformed or mismatched reply.
 */
class TransferFailure : public std::runtime_error {
public:
    TransferFailure(const std::string& neighbor, const std::string& what, bool not_owned = false)
        : std::runtime_error(neighbor + ": " + what), neighbor_(neighbor), not_owned_(not_owned) {}

    const std::string& neighbor() const { return neighbor_; }

    /**
     * The neighbor refused because it does not own the block (yet)
     */
    bool not_owned() const { return not_owned_; }

private:
    std::string neighbor_;
    bool not_owned_;
};

/**
 * Client side of the block exchange protocol for one neighbor.
 * Every call opens a fresh connection, performs one request/response
 * exchange and closes it.
 */
class NeighborClient {
public:
    /**
     * @param neighbor Address of the neighbor
     * @param connect_timeout_ms Bound on establishing the TCP connection
     * @param request_timeout_ms Bound on each send and on waiting for each reply frame
     */
    NeighborClient(const PeerAddress& neighbor, int connect_timeout_ms, int request_timeout_ms);

    const PeerAddress& neighbor() const { return neighbor_; }

    /**
     * Ask for the file description
     * @throws TransferFailure
     */
    FileMetadata fetch_metadata() const;

    /**
     * Download one block
     * @param block_index Index to request
     * @param expected_length Length the block must have
     * @return The payload, exactly expected_length bytes
     * @throws TransferFailure
     */
    std::vector<uint8_t> fetch_block(uint32_t block_index, uint32_t expected_length) const;

private:
    PeerAddress neighbor_;
    std::string name_;
    int connect_timeout_ms_;
    int request_timeout_ms_;
};

} // namespace blockshare
