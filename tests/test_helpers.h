#pragma once

#include <gtest/gtest.h>
#include "block_store.h"
#include "file_metadata.h"
#include "peer_config.h"
#include "provider.h"
#include "sha256.h"
#include "socket.h"
#include "stop_token.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace blockshare {
namespace test {

/**
 * Two ends of one loopback TCP connection
 */
struct ConnectedPair {
    SocketGuard client;
    SocketGuard server;
};

inline ConnectedPair make_connected_pair() {
    ConnectedPair pair;
    SocketGuard listener(create_tcp_server("127.0.0.1", 0));
    if (!listener.valid()) {
        return pair;
    }
    int port = get_bound_port(listener.get());
    pair.client.reset(create_tcp_client("127.0.0.1", port, 1000));
    pair.server.reset(accept_client(listener.get(), 1000));
    return pair;
}

/**
 * Deterministic pseudo-random bytes
 */
inline std::vector<uint8_t> make_pattern(size_t size, uint32_t seed = 1) {
    std::vector<uint8_t> data(size);
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1664525u + 1013904223u;
        data[i] = static_cast<uint8_t>(state >> 24);
    }
    return data;
}

/**
 * Path of a scratch file unique to the running test
 */
inline std::string temp_path(const std::string& name) {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string prefix = info ? std::string(info->test_suite_name()) + "_" + info->name() + "_" : "";
    return ::testing::TempDir() + "blockshare_" + prefix + name;
}

/**
 * Poll predicate until it holds or the timeout expires
 */
inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

/**
 * A loopback port with nothing listening on it
 */
inline int unused_port() {
    SocketGuard listener(create_tcp_server("127.0.0.1", 0));
    return listener.valid() ? get_bound_port(listener.get()) : 1;
}

/**
 * In-process provider serving a chosen subset of a file's blocks
 */
class ServingNode {
public:
    ServingNode(const std::vector<uint8_t>& data, uint32_t block_size, bool own_all = true)
        : data_(data), metadata_("input.bin", data.size(), block_size, SHA256::hash(data)) {
        config_.port = 0;
        config_.accept_poll_ms = 50;
        store_.set_metadata(metadata_);
        if (own_all) {
            for (uint32_t i = 0; i < metadata_.block_count(); ++i) {
                add_block(i);
            }
        }
        slot_.publish(metadata_);
        provider_ = std::make_unique<Provider>(config_, store_, slot_, stop_token_);
        started_ = provider_->start();
    }

    ~ServingNode() {
        provider_->stop();
    }

    bool add_block(uint32_t index) {
        auto begin = data_.begin() + static_cast<std::ptrdiff_t>(metadata_.block_offset(index));
        return store_.put(index, std::vector<uint8_t>(begin, begin + metadata_.block_length(index)));
    }

    bool started() const { return started_; }
    PeerAddress address() const { return PeerAddress("127.0.0.1", provider_->get_listen_port()); }
    const FileMetadata& metadata() const { return metadata_; }
    Provider& provider() { return *provider_; }

private:
    std::vector<uint8_t> data_;
    FileMetadata metadata_;
    PeerConfig config_;
    BlockStore store_;
    MetadataSlot slot_;
    StopToken stop_token_;
    std::unique_ptr<Provider> provider_;
    bool started_;
};

} // namespace test
} // namespace blockshare
