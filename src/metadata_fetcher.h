#pragma once

#include "file_metadata.h"
#include "neighbor_client.h"
#include "peer_config.h"
#include "stop_token.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace blockshare {

/**
 * No neighbor returned valid metadata. Fatal for a leecher.
 */
class MetadataUnavailable : public std::runtime_error {
public:
    explicit MetadataUnavailable(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Leecher-side metadata acquisition: asks the neighbors in list order and
 * adopts the first valid METADATA_REPLY.
 */
class MetadataFetcher {
public:
    MetadataFetcher(const PeerConfig& config, StopToken& stop_token);

    /**
     * Sweep the neighbor list up to metadata_attempts times, waiting
     * retry_backoff_ms between sweeps
     * @return Metadata of the first neighbor that answered validly
     * @throws MetadataUnavailable if every neighbor failed on every sweep, or on stop
     */
    FileMetadata fetch();

    /**
     * Neighbor that supplied the metadata, empty before a successful fetch()
     */
    const std::string& get_source() const { return source_; }

private:
    const PeerConfig& config_;
    StopToken& stop_token_;
    std::string source_;
};

} // namespace blockshare
