#include <gtest/gtest.h>
#include "metadata_fetcher.h"
#include "test_helpers.h"
#include <chrono>
#include <memory>
#include <thread>

using namespace blockshare;
using namespace blockshare::test;

class MetadataFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
        config_.port = 0;
        config_.connect_timeout_ms = 300;
        config_.request_timeout_ms = 300;
        config_.retry_backoff_ms = 20;
    }

    void TearDown() override {
        cleanup_socket_library();
    }

    PeerConfig config_;
    StopToken stop_token_;
};

TEST_F(MetadataFetcherTest, NoNeighbors) {
    MetadataFetcher fetcher(config_, stop_token_);
    EXPECT_THROW(fetcher.fetch(), MetadataUnavailable);
    EXPECT_TRUE(fetcher.get_source().empty());
}

TEST_F(MetadataFetcherTest, AllNeighborsUnreachable) {
    config_.peers = {PeerAddress("127.0.0.1", unused_port()), PeerAddress("127.0.0.1", unused_port())};
    MetadataFetcher fetcher(config_, stop_token_);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(fetcher.fetch(), MetadataUnavailable);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST_F(MetadataFetcherTest, SkipsDeadNeighborInListOrder) {
    ServingNode seeder(make_pattern(10000, 41), 1024);
    ASSERT_TRUE(seeder.started());

    config_.peers = {PeerAddress("127.0.0.1", unused_port()), seeder.address()};
    MetadataFetcher fetcher(config_, stop_token_);

    FileMetadata metadata = fetcher.fetch();
    EXPECT_EQ(metadata, seeder.metadata());
    EXPECT_EQ(metadata.block_count(), 10u);
    EXPECT_EQ(fetcher.get_source(), seeder.address().to_string());
}

TEST_F(MetadataFetcherTest, FirstValidReplyWins) {
    ServingNode first(make_pattern(5000, 1), 1024);
    ServingNode second(make_pattern(7000, 2), 1024);
    ASSERT_TRUE(first.started());
    ASSERT_TRUE(second.started());

    config_.peers = {first.address(), second.address()};
    MetadataFetcher fetcher(config_, stop_token_);
    EXPECT_EQ(fetcher.fetch(), first.metadata());
}

TEST_F(MetadataFetcherTest, RetriesSweeps) {
    int port = unused_port();
    config_.peers = {PeerAddress("127.0.0.1", port)};
    config_.metadata_attempts = 20;
    config_.retry_backoff_ms = 50;

    // Bring a seeder up on the same port after the first sweep has failed
    std::vector<uint8_t> data = make_pattern(3000, 3);
    std::unique_ptr<Provider> late_provider;
    PeerConfig seed_config;
    seed_config.port = port;
    seed_config.accept_poll_ms = 50;
    BlockStore store;
    MetadataSlot slot;
    StopToken seed_stop;
    FileMetadata expected("input.bin", data.size(), 1024, SHA256::hash(data));
    store.set_metadata(expected);
    slot.publish(expected);

    std::thread starter([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        late_provider = std::make_unique<Provider>(seed_config, store, slot, seed_stop);
        late_provider->start();
    });

    MetadataFetcher fetcher(config_, stop_token_);
    FileMetadata metadata = fetcher.fetch();
    starter.join();

    EXPECT_EQ(metadata, expected);
    late_provider->stop();
}

TEST_F(MetadataFetcherTest, StopAbortsFetch) {
    config_.peers = {PeerAddress("127.0.0.1", unused_port())};
    config_.metadata_attempts = 1000;
    config_.retry_backoff_ms = 1000;

    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop_token_.request_stop();
    });

    MetadataFetcher fetcher(config_, stop_token_);
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(fetcher.fetch(), MetadataUnavailable);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    stopper.join();
}
