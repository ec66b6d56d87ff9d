#include <gtest/gtest.h>
#include "reconstructor.h"
#include "fs.h"
#include "sha256.h"
#include "test_helpers.h"

using namespace blockshare;
using namespace blockshare::test;

class ReconstructorTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_ = make_pattern(10000, 61);
        metadata_.emplace("input.bin", data_.size(), 1024, SHA256::hash(data_));
        out_path_ = temp_path("out.bin");
    }

    void TearDown() override {
        delete_file(out_path_);
    }

    void fill_store(BlockStore& store, const std::vector<uint8_t>& source) {
        ASSERT_TRUE(store.set_metadata(*metadata_));
        for (uint32_t i = 0; i < metadata_->block_count(); ++i) {
            auto begin = source.begin() + metadata_->block_offset(i);
            ASSERT_TRUE(store.put(i, std::vector<uint8_t>(begin, begin + metadata_->block_length(i))));
        }
    }

    std::vector<uint8_t> data_;
    std::optional<FileMetadata> metadata_;
    std::string out_path_;
};

TEST_F(ReconstructorTest, IntactFileVerifies) {
    BlockStore store;
    fill_store(store, data_);

    EXPECT_EQ(reconstruct_and_verify(store, *metadata_, out_path_), VerifyResult::VERIFIED);

    std::vector<uint8_t> written;
    ASSERT_TRUE(read_file_binary(out_path_, written));
    EXPECT_EQ(written, data_);
}

TEST_F(ReconstructorTest, FlippedByteIsCorrupt) {
    std::vector<uint8_t> tampered = data_;
    tampered[5000] ^= 0x01;

    BlockStore store;
    fill_store(store, tampered);

    EXPECT_EQ(reconstruct_and_verify(store, *metadata_, out_path_), VerifyResult::CORRUPT);
    // The mismatching file is left in place, not repaired
    EXPECT_EQ(get_file_size(out_path_), 10000);
}

TEST_F(ReconstructorTest, UnwritablePath) {
    BlockStore store;
    fill_store(store, data_);

    std::string path = temp_path("no_such_dir") + "/out.bin";
    EXPECT_EQ(reconstruct_and_verify(store, *metadata_, path), VerifyResult::WRITE_FAILED);
}

TEST_F(ReconstructorTest, MissingBlockFailsWrite) {
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(*metadata_));
    ASSERT_TRUE(store.put(0, std::vector<uint8_t>(data_.begin(), data_.begin() + 1024)));

    EXPECT_FALSE(write_blocks_to_file(store, *metadata_, out_path_));
}

TEST_F(ReconstructorTest, EmptyFile) {
    FileMetadata empty("empty.bin", 0, 1024, SHA256::hash(std::string()));
    BlockStore store;
    ASSERT_TRUE(store.set_metadata(empty));

    EXPECT_EQ(reconstruct_and_verify(store, empty, out_path_), VerifyResult::VERIFIED);
    EXPECT_EQ(get_file_size(out_path_), 0);
}

TEST_F(ReconstructorTest, VerifyExistingFile) {
    ASSERT_TRUE(create_file_binary(out_path_, data_));
    EXPECT_EQ(verify_file(out_path_, metadata_->sha256()), VerifyResult::VERIFIED);
    EXPECT_EQ(verify_file(out_path_, SHA256::hash(std::string("other"))), VerifyResult::CORRUPT);
    EXPECT_EQ(verify_file(temp_path("absent.bin"), metadata_->sha256()), VerifyResult::WRITE_FAILED);
}

TEST_F(ReconstructorTest, ResultNames) {
    EXPECT_EQ(verify_result_to_string(VerifyResult::VERIFIED), "verified");
    EXPECT_EQ(verify_result_to_string(VerifyResult::CORRUPT), "corrupt");
    EXPECT_EQ(verify_result_to_string(VerifyResult::WRITE_FAILED), "write_failed");
}
