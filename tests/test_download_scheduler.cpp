#include <gtest/gtest.h>
#include "download_scheduler.h"
#include "test_helpers.h"
#include <chrono>
#include <thread>

using namespace blockshare;
using namespace blockshare::test;

class DownloadSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
        data_ = make_pattern(10000, 51);

        config_.port = 0;
        config_.connect_timeout_ms = 300;
        config_.request_timeout_ms = 500;
        config_.retry_backoff_ms = 10;
        config_.max_consecutive_failures = 3;
        config_.progress_interval_ms = 100;
    }

    void TearDown() override {
        cleanup_socket_library();
    }

    std::vector<uint8_t> assembled(const BlockStore& store) const {
        std::vector<uint8_t> out;
        for (uint32_t i = 0; i < store.block_count(); ++i) {
            std::vector<uint8_t> block = store.get(i);
            out.insert(out.end(), block.begin(), block.end());
        }
        return out;
    }

    std::vector<uint8_t> data_;
    PeerConfig config_;
    StopToken stop_token_;
};

TEST_F(DownloadSchedulerTest, DownloadsEveryBlockFromOneNeighbor) {
    ServingNode seeder(data_, 1024);
    ASSERT_TRUE(seeder.started());
    config_.peers = {seeder.address()};

    BlockStore store;
    ASSERT_TRUE(store.set_metadata(seeder.metadata()));
    DownloadScheduler scheduler(config_, seeder.metadata(), store, stop_token_);

    EXPECT_EQ(scheduler.run(), DownloadResult::COMPLETE);
    EXPECT_TRUE(store.all_owned());
    EXPECT_EQ(assembled(store), data_);

    std::vector<NeighborStats> stats = scheduler.get_neighbor_stats();
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].blocks_fetched, 10u);
    EXPECT_EQ(stats[0].bytes_fetched, 10000u);
    EXPECT_EQ(seeder.provider().get_stats().blocks_served, 10u);
}

TEST_F(DownloadSchedulerTest, SplitsWorkAcrossNeighbors) {
    ServingNode a(data_, 1024);
    ServingNode b(data_, 1024);
    ServingNode c(data_, 1024);
    config_.peers = {a.address(), b.address(), c.address()};

    BlockStore store;
    ASSERT_TRUE(store.set_metadata(a.metadata()));
    DownloadScheduler scheduler(config_, a.metadata(), store, stop_token_);
    ASSERT_EQ(scheduler.run(), DownloadResult::COMPLETE);
    EXPECT_EQ(assembled(store), data_);

    // Claims are exclusive, so no block is transferred twice
    uint64_t total = a.provider().get_stats().blocks_served + b.provider().get_stats().blocks_served +
                     c.provider().get_stats().blocks_served;
    EXPECT_EQ(total, 10u);
}

TEST_F(DownloadSchedulerTest, DeadNeighborIsGivenUp) {
    ServingNode seeder(data_, 1024);
    PeerAddress dead("127.0.0.1", unused_port());
    config_.peers = {dead, seeder.address()};

    BlockStore store;
    ASSERT_TRUE(store.set_metadata(seeder.metadata()));
    DownloadScheduler scheduler(config_, seeder.metadata(), store, stop_token_);
    ASSERT_EQ(scheduler.run(), DownloadResult::COMPLETE);
    EXPECT_EQ(assembled(store), data_);

    std::vector<NeighborStats> stats = scheduler.get_neighbor_stats();
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats[0].blocks_fetched, 0u);
    EXPECT_GT(stats[0].failures, 0u);
    EXPECT_EQ(stats[1].blocks_fetched, 10u);
}

TEST_F(DownloadSchedulerTest, FailsWhenEveryNeighborGivesUp) {
    FileMetadata metadata("input.bin", data_.size(), 1024, SHA256::hash(data_));
    config_.peers = {PeerAddress("127.0.0.1", unused_port()), PeerAddress("127.0.0.1", unused_port())};

    BlockStore store;
    ASSERT_TRUE(store.set_metadata(metadata));
    DownloadScheduler scheduler(config_, metadata, store, stop_token_);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(scheduler.run(), DownloadResult::FAILED);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));

    for (const auto& stats : scheduler.get_neighbor_stats()) {
        EXPECT_TRUE(stats.gave_up);
        EXPECT_EQ(stats.failures, 3u);
    }
    EXPECT_EQ(store.owned_count(), 0u);
}

TEST_F(DownloadSchedulerTest, NoNeighborsFailsImmediately) {
    FileMetadata metadata("input.bin", data_.size(), 1024, SHA256::hash(data_));
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(metadata));
    DownloadScheduler scheduler(config_, metadata, store, stop_token_);

    EXPECT_FALSE(scheduler.start());
    EXPECT_EQ(scheduler.wait(), DownloadResult::FAILED);
}

TEST_F(DownloadSchedulerTest, RefusalsWaitForPartialNeighbor) {
    // The only neighbor owns half the blocks at first and the rest later
    ServingNode partial(data_, 1024, false);
    for (uint32_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(partial.add_block(i));
    }
    config_.peers = {partial.address()};
    config_.max_consecutive_refusals = 100000;

    BlockStore store;
    ASSERT_TRUE(store.set_metadata(partial.metadata()));
    DownloadScheduler scheduler(config_, partial.metadata(), store, stop_token_);
    ASSERT_TRUE(scheduler.start());

    ASSERT_TRUE(wait_until([&store]() { return store.owned_count() == 5; }));
    // Far more refusals than the failure ceiling, the worker keeps going
    ASSERT_TRUE(wait_until([&scheduler]() {
        return scheduler.get_neighbor_stats()[0].refusals > 10;
    }));
    for (uint32_t i = 5; i < 10; ++i) {
        ASSERT_TRUE(partial.add_block(i));
    }

    EXPECT_EQ(scheduler.wait(), DownloadResult::COMPLETE);
    EXPECT_EQ(assembled(store), data_);
    EXPECT_FALSE(scheduler.get_neighbor_stats()[0].gave_up);
}

TEST_F(DownloadSchedulerTest, PartialNeighborThatNeverCompletesFails) {
    // The only neighbor owns blocks 0-4 and never gets the rest
    ServingNode partial(data_, 1024, false);
    for (uint32_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(partial.add_block(i));
    }
    config_.peers = {partial.address()};
    config_.max_consecutive_refusals = 20;

    BlockStore store;
    ASSERT_TRUE(store.set_metadata(partial.metadata()));
    DownloadScheduler scheduler(config_, partial.metadata(), store, stop_token_);

    EXPECT_EQ(scheduler.run(), DownloadResult::FAILED);
    EXPECT_EQ(store.owned_count(), 5u);

    std::vector<NeighborStats> stats = scheduler.get_neighbor_stats();
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_TRUE(stats[0].gave_up);
    EXPECT_EQ(stats[0].refusals, 20u);
    EXPECT_EQ(stats[0].failures, 0u);
    EXPECT_EQ(scheduler.get_statistics_json()["result"], "failed");
}

TEST_F(DownloadSchedulerTest, DeliveredBlockResetsRefusalCount) {
    ServingNode partial(data_, 1024, false);
    ASSERT_TRUE(partial.add_block(0));
    config_.peers = {partial.address()};
    config_.max_consecutive_refusals = 30;

    BlockStore store;
    ASSERT_TRUE(store.set_metadata(partial.metadata()));
    DownloadScheduler scheduler(config_, partial.metadata(), store, stop_token_);
    ASSERT_TRUE(scheduler.start());

    // Feed one block each time the refusal streak approaches the ceiling
    for (uint32_t i = 1; i < 10; ++i) {
        const uint64_t target = scheduler.get_neighbor_stats()[0].refusals + 15;
        ASSERT_TRUE(wait_until([&scheduler, target]() {
            return scheduler.get_neighbor_stats()[0].refusals >= target;
        }));
        ASSERT_TRUE(partial.add_block(i));
    }

    EXPECT_EQ(scheduler.wait(), DownloadResult::COMPLETE);
    EXPECT_EQ(assembled(store), data_);
    std::vector<NeighborStats> stats = scheduler.get_neighbor_stats();
    EXPECT_FALSE(stats[0].gave_up);
    EXPECT_GT(stats[0].refusals, 30u);
}

TEST_F(DownloadSchedulerTest, StopInterruptsDownload) {
    ServingNode partial(data_, 1024, false);
    ASSERT_TRUE(partial.add_block(0));
    config_.peers = {partial.address()};

    BlockStore store;
    ASSERT_TRUE(store.set_metadata(partial.metadata()));
    DownloadScheduler scheduler(config_, partial.metadata(), store, stop_token_);
    ASSERT_TRUE(scheduler.start());

    ASSERT_TRUE(wait_until([&store]() { return store.owned_count() == 1; }));
    stop_token_.request_stop();

    EXPECT_EQ(scheduler.wait(), DownloadResult::STOPPED);
    EXPECT_EQ(scheduler.get_result(), DownloadResult::STOPPED);
    EXPECT_EQ(scheduler.get_statistics_json()["result"], "stopped");
}

TEST_F(DownloadSchedulerTest, EmptyFileCompletesAtOnce) {
    std::vector<uint8_t> empty;
    ServingNode seeder(empty, 1024);
    config_.peers = {seeder.address()};

    BlockStore store;
    ASSERT_TRUE(store.set_metadata(seeder.metadata()));
    DownloadScheduler scheduler(config_, seeder.metadata(), store, stop_token_);
    EXPECT_EQ(scheduler.run(), DownloadResult::COMPLETE);
}

TEST_F(DownloadSchedulerTest, ResultNames) {
    EXPECT_EQ(download_result_to_string(DownloadResult::COMPLETE), "complete");
    EXPECT_EQ(download_result_to_string(DownloadResult::FAILED), "failed");
    EXPECT_EQ(download_result_to_string(DownloadResult::STOPPED), "stopped");
}
