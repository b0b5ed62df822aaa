#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "transfer/transfer_plan.hpp"
#include "transfer/transfer_error.hpp"
#include "test_utils.hpp"

using namespace pneumatic::transfer;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

std::vector<FileMetadata> files_with_sizes(const std::vector<uint64_t>& sizes) {
    std::vector<FileMetadata> files;
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        FileMetadata file;
        file.relative_path = "file" + std::to_string(i);
        file.size = sizes[i];
        files.push_back(file);
    }
    return files;
}

std::vector<uint64_t> sizes_of(const std::vector<FileMetadata>& files) {
    std::vector<uint64_t> sizes;
    for (const auto& file : files) {
        sizes.push_back(file.size);
    }
    return sizes;
}

} // namespace

class TransferPlanTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging(boost::log::trivial::error);
    }
};

// Test bucketing with the default thresholds
TEST_F(TransferPlanTest, BucketsBySize) {
    const auto plan = TransferPlan::create(
        files_with_sizes({600000000, 0, 300000000, 1000000, 500000}));

    EXPECT_THAT(sizes_of(plan.small_files()), ElementsAre(0u, 500000u));
    EXPECT_THAT(sizes_of(plan.single_chunk_files()), ElementsAre(1000000u, 300000000u));
    EXPECT_THAT(sizes_of(plan.large_files()), ElementsAre(600000000u));
    EXPECT_EQ(plan.file_count(), 5u);
    EXPECT_EQ(plan.total_size(), 901500000u);
}

TEST_F(TransferPlanTest, EmptyInput) {
    const auto plan = TransferPlan::create({});
    EXPECT_THAT(plan.small_files(), IsEmpty());
    EXPECT_THAT(plan.single_chunk_files(), IsEmpty());
    EXPECT_THAT(plan.large_files(), IsEmpty());
    EXPECT_EQ(plan.file_count(), 0u);
    EXPECT_EQ(plan.total_size(), 0u);
}

TEST_F(TransferPlanTest, AllSmall) {
    const auto plan = TransferPlan::create(files_with_sizes({3, 1, 2}));
    EXPECT_EQ(sizes_of(plan.small_files()), (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_TRUE(plan.single_chunk_files().empty());
    EXPECT_TRUE(plan.large_files().empty());
}

// Test that threshold values fall in the upper bucket
TEST_F(TransferPlanTest, ThresholdBoundaries) {
    PlanThresholds thresholds;
    thresholds.small_file_threshold = 10;
    thresholds.large_file_threshold = 20;

    const auto plan = TransferPlan::create(files_with_sizes({9, 10, 19, 20}), thresholds);
    EXPECT_EQ(sizes_of(plan.small_files()), (std::vector<uint64_t>{9}));
    EXPECT_EQ(sizes_of(plan.single_chunk_files()), (std::vector<uint64_t>{10, 19}));
    EXPECT_EQ(sizes_of(plan.large_files()), (std::vector<uint64_t>{20}));
    EXPECT_EQ(plan.thresholds().small_file_threshold, 10u);
}

// Test that equal sizes keep their input order
TEST_F(TransferPlanTest, StableWithinSize) {
    const auto plan = TransferPlan::create(files_with_sizes({5, 5, 1, 5}));
    ASSERT_EQ(plan.small_files().size(), 4u);
    EXPECT_EQ(plan.small_files()[1].relative_path, "file0");
    EXPECT_EQ(plan.small_files()[2].relative_path, "file1");
    EXPECT_EQ(plan.small_files()[3].relative_path, "file3");
}

TEST_F(TransferPlanTest, EqualThresholdsLeaveNoSingleChunk) {
    PlanThresholds thresholds;
    thresholds.small_file_threshold = 100;
    thresholds.large_file_threshold = 100;

    const auto plan = TransferPlan::create(files_with_sizes({50, 100, 150}), thresholds);
    EXPECT_EQ(plan.small_files().size(), 1u);
    EXPECT_TRUE(plan.single_chunk_files().empty());
    EXPECT_EQ(plan.large_files().size(), 2u);
}

TEST_F(TransferPlanTest, InvertedThresholdsRejected) {
    PlanThresholds thresholds;
    thresholds.small_file_threshold = 1000;
    thresholds.large_file_threshold = 10;

    EXPECT_THROW(TransferPlan::create(files_with_sizes({1}), thresholds), PlanningError);
}

TEST_F(TransferPlanTest, BundleTargetCarried) {
    PlanThresholds thresholds;
    thresholds.bundle_target_size = 1234;
    const auto plan = TransferPlan::create({}, thresholds);
    EXPECT_EQ(plan.thresholds().bundle_target_size, 1234u);
}
