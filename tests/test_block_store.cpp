#include <gtest/gtest.h>
#include "block_store.h"
#include "fs.h"
#include "sha256.h"
#include "test_helpers.h"
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace blockshare;
using namespace blockshare::test;

class BlockStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_ = make_pattern(10000, 11);
        metadata_.emplace("input.bin", data_.size(), 1024, SHA256::hash(data_));
    }

    std::vector<uint8_t> block(uint32_t index) const {
        auto begin = data_.begin() + metadata_->block_offset(index);
        return std::vector<uint8_t>(begin, begin + metadata_->block_length(index));
    }

    std::vector<uint8_t> data_;
    std::optional<FileMetadata> metadata_;
};

TEST_F(BlockStoreTest, UnsizedStore) {
    BlockStore store;
    EXPECT_FALSE(store.is_sized());
    EXPECT_FALSE(store.all_owned());
    EXPECT_EQ(store.block_count(), 0u);
    EXPECT_FALSE(store.put(0, block(0)));
    EXPECT_FALSE(store.has(0));
}

TEST_F(BlockStoreTest, SizedOnlyOnce) {
    BlockStore store;
    EXPECT_TRUE(store.set_metadata(*metadata_));
    EXPECT_FALSE(store.set_metadata(*metadata_));
    EXPECT_EQ(store.block_count(), 10u);
    EXPECT_EQ(store.owned_count(), 0u);
    EXPECT_EQ(store.missing().size(), 10u);
    ASSERT_TRUE(store.metadata().has_value());
    EXPECT_EQ(*store.metadata(), *metadata_);
}

TEST_F(BlockStoreTest, PutAndGet) {
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(*metadata_));

    EXPECT_TRUE(store.put(3, block(3)));
    EXPECT_TRUE(store.has(3));
    EXPECT_EQ(store.get(3), block(3));
    EXPECT_EQ(store.owned_count(), 1u);

    std::vector<uint32_t> missing = store.missing();
    EXPECT_EQ(missing.size(), 9u);
    EXPECT_EQ(std::find(missing.begin(), missing.end(), 3u), missing.end());
}

TEST_F(BlockStoreTest, PutIsIdempotent) {
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(*metadata_));

    EXPECT_TRUE(store.put(0, block(0)));
    std::vector<uint8_t> different(1024, 0xFF);
    EXPECT_FALSE(store.put(0, different));
    EXPECT_EQ(store.get(0), block(0));
    EXPECT_EQ(store.owned_count(), 1u);
}

TEST_F(BlockStoreTest, RejectsWrongLengthAndRange) {
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(*metadata_));

    EXPECT_FALSE(store.put(9, std::vector<uint8_t>(1024, 0)));
    EXPECT_TRUE(store.put(9, std::vector<uint8_t>(784, 0)));
    EXPECT_FALSE(store.put(0, std::vector<uint8_t>(100, 0)));
    EXPECT_FALSE(store.put(10, std::vector<uint8_t>(1024, 0)));
    EXPECT_EQ(store.owned_count(), 1u);
}

TEST_F(BlockStoreTest, GetMissingThrows) {
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(*metadata_));
    try {
        store.get(4);
        FAIL() << "expected BlockNotOwned";
    } catch (const BlockNotOwned& e) {
        EXPECT_EQ(e.index(), 4u);
    }
    EXPECT_THROW(store.get(100), BlockNotOwned);
}

TEST_F(BlockStoreTest, CompleteAfterAllBlocks) {
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(*metadata_));
    for (uint32_t i = 0; i < 10; ++i) {
        EXPECT_FALSE(store.all_owned());
        ASSERT_TRUE(store.put(i, block(i)));
    }
    EXPECT_TRUE(store.all_owned());
    EXPECT_TRUE(store.missing().empty());
    EXPECT_TRUE(store.owned().all_set());
}

TEST_F(BlockStoreTest, EmptyFileIsImmediatelyComplete) {
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(FileMetadata("empty.bin", 0, 1024, SHA256::hash(std::string()))));
    EXPECT_EQ(store.block_count(), 0u);
    EXPECT_TRUE(store.all_owned());
}

TEST_F(BlockStoreTest, LoadFromFile) {
    std::string path = temp_path("seed.bin");
    ASSERT_TRUE(create_file_binary(path, data_));

    BlockStore store;
    ASSERT_TRUE(store.load_from_file(path, *metadata_));
    EXPECT_TRUE(store.all_owned());
    for (uint32_t i = 0; i < 10; ++i) {
        EXPECT_EQ(store.get(i), block(i));
    }
    EXPECT_FALSE(store.load_from_file(path, *metadata_));

    delete_file(path);
}

TEST_F(BlockStoreTest, LoadFromFileSizeMismatch) {
    std::string path = temp_path("short.bin");
    ASSERT_TRUE(create_file_binary(path, data_.data(), 5000));

    BlockStore store;
    EXPECT_FALSE(store.load_from_file(path, *metadata_));
    EXPECT_FALSE(store.is_sized());

    delete_file(path);
}

TEST_F(BlockStoreTest, ConcurrentPutsStoreEachBlockOnce) {
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(*metadata_));

    std::atomic<int> first_insertions{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &store, &first_insertions]() {
            for (uint32_t i = 0; i < 10; ++i) {
                if (store.put(i, block(i))) {
                    first_insertions++;
                }
                store.has(i);
                store.owned_count();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(first_insertions.load(), 10);
    EXPECT_TRUE(store.all_owned());
}
