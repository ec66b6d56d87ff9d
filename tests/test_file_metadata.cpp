#include <gtest/gtest.h>
#include "file_metadata.h"
#include "fs.h"
#include "sha256.h"
#include "test_helpers.h"
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace blockshare;
using namespace blockshare::test;

namespace {
const std::string DIGEST = SHA256::hash(std::string("x"));
}

TEST(FileMetadataTest, BlockCountRoundsUp) {
    EXPECT_EQ(compute_block_count(10000, 1024), 10u);
    EXPECT_EQ(compute_block_count(10240, 1024), 10u);
    EXPECT_EQ(compute_block_count(10241, 1024), 11u);
    EXPECT_EQ(compute_block_count(0, 1024), 0u);
    EXPECT_EQ(compute_block_count(1, 1024), 1u);
    EXPECT_THROW(compute_block_count(100, 0), std::invalid_argument);
}

TEST(FileMetadataTest, BlockLengths) {
    FileMetadata metadata("input.bin", 10000, 1024, DIGEST);
    EXPECT_EQ(metadata.block_count(), 10u);
    for (uint32_t i = 0; i < 9; ++i) {
        EXPECT_EQ(metadata.block_length(i), 1024u);
    }
    EXPECT_EQ(metadata.block_length(9), 784u);
    EXPECT_EQ(metadata.block_length(10), 0u);
    EXPECT_EQ(metadata.block_offset(9), 9216u);
}

TEST(FileMetadataTest, FileSmallerThanBlock) {
    FileMetadata metadata("tiny.bin", 10, 1024, DIGEST);
    EXPECT_EQ(metadata.block_count(), 1u);
    EXPECT_EQ(metadata.block_length(0), 10u);
}

TEST(FileMetadataTest, DigestStoredLowercase) {
    std::string upper = DIGEST;
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    FileMetadata metadata("a", 1, 1, upper);
    EXPECT_EQ(metadata.sha256(), DIGEST);
    EXPECT_EQ(metadata, FileMetadata("a", 1, 1, DIGEST));
}

TEST(FileMetadataTest, RejectsInvalidConstruction) {
    EXPECT_THROW(FileMetadata("a", 10, 0, DIGEST), std::invalid_argument);
    EXPECT_THROW(FileMetadata("a", 10, 1, "abc"), std::invalid_argument);
}

TEST(FileMetadataTest, DescribeFile) {
    std::string path = temp_path("described.bin");
    std::vector<uint8_t> data = make_pattern(10000);
    ASSERT_TRUE(create_file_binary(path, data));

    std::optional<FileMetadata> metadata = describe_file(path, 1024);
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->filename(), get_filename_from_path(path));
    EXPECT_EQ(metadata->file_size(), 10000u);
    EXPECT_EQ(metadata->block_count(), 10u);
    EXPECT_EQ(metadata->sha256(), SHA256::hash(data));

    delete_file(path);
}

TEST(FileMetadataTest, DescribeMissingFile) {
    EXPECT_FALSE(describe_file(temp_path("missing.bin"), 1024).has_value());
    EXPECT_FALSE(describe_file(::testing::TempDir(), 1024).has_value());
}

//=============================================================================
// MetadataSlot
//=============================================================================

TEST(MetadataSlotTest, PublishOnce) {
    MetadataSlot slot;
    EXPECT_FALSE(slot.is_known());
    EXPECT_FALSE(slot.get().has_value());

    FileMetadata first("first.bin", 1, 1, DIGEST);
    FileMetadata second("second.bin", 1, 1, DIGEST);
    EXPECT_TRUE(slot.publish(first));
    EXPECT_FALSE(slot.publish(second));

    ASSERT_TRUE(slot.is_known());
    EXPECT_EQ(slot.get()->filename(), "first.bin");
}

TEST(MetadataSlotTest, WaitTimesOut) {
    MetadataSlot slot;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(slot.wait_for(std::chrono::milliseconds(100)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(90));
}

TEST(MetadataSlotTest, WaitWakesOnPublish) {
    MetadataSlot slot;
    std::thread publisher([&slot]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        slot.publish(FileMetadata("late.bin", 5, 1, DIGEST));
    });

    std::optional<FileMetadata> metadata = slot.wait_for(std::chrono::seconds(5));
    publisher.join();

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->filename(), "late.bin");
}
