#include <gtest/gtest.h>
#include "transfer/file_discovery.hpp"
#include "transfer/local_file_system.hpp"
#include "transfer/memory_file_system.hpp"
#include "transfer/transfer_error.hpp"
#include "test_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>

using namespace pneumatic::transfer;
using pneumatic::utils::BoundedChannel;

namespace {

std::set<std::string> paths_of(const std::vector<FileMetadata>& files) {
    std::set<std::string> paths;
    for (const auto& file : files) {
        paths.insert(file.relative_path);
    }
    return paths;
}

} // namespace

class FileDiscoveryTest : public ::testing::TestWithParam<std::size_t> {
protected:
    void SetUp() override {
        init_test_logging(boost::log::trivial::fatal);
        file_system = std::make_shared<MemoryFileSystem>();
    }

    // Chain of nested directories, one file at each level
    std::set<std::string> build_deep_tree(int depth) {
        std::set<std::string> expected;
        std::string directory;
        for (int level = 0; level < depth; ++level) {
            directory = join_relative(directory, "d" + std::to_string(level));
            const std::string file = directory + "/f.bin";
            file_system->add_file(file, level);
            expected.insert(file);
        }
        return expected;
    }

    // Many sibling directories with a few files each
    std::set<std::string> build_wide_tree(int width, int files_per_directory) {
        std::set<std::string> expected;
        for (int d = 0; d < width; ++d) {
            const std::string directory = "dir" + std::to_string(d);
            file_system->add_directory(directory);
            for (int f = 0; f < files_per_directory; ++f) {
                const std::string file = directory + "/file" + std::to_string(f);
                file_system->add_file(file, f * 100);
                expected.insert(file);
            }
        }
        return expected;
    }

    std::shared_ptr<MemoryFileSystem> file_system;
};

TEST_P(FileDiscoveryTest, DeepTreeFullyDiscovered) {
    const auto expected = build_deep_tree(200);
    FileDiscovery discovery(file_system, GetParam());

    const auto files = discovery.collect();
    EXPECT_EQ(files.size(), expected.size());
    EXPECT_EQ(paths_of(files), expected);
}

TEST_P(FileDiscoveryTest, WideTreeFullyDiscovered) {
    const auto expected = build_wide_tree(300, 5);
    file_system->add_file("top.txt", 1);
    auto with_top = expected;
    with_top.insert("top.txt");

    FileDiscovery discovery(file_system, GetParam());
    const auto files = discovery.collect(4);
    EXPECT_EQ(paths_of(files), with_top);
}

// Test that each directory yields exactly one batch, empty ones included
TEST_P(FileDiscoveryTest, OneBatchPerDirectory) {
    file_system->add_directory("empty");
    file_system->add_directory("empty/nested");
    file_system->add_file("a/one", 1);
    file_system->add_file("a/two", 2);

    FileDiscovery discovery(file_system, GetParam());
    BoundedChannel<FileBatch> output(1);

    std::vector<FileBatch> batches;
    auto consumer = std::async(std::launch::async, [&output, &batches]() {
        FileBatch batch;
        while (output.receive(batch)) {
            batches.push_back(batch);
        }
    });
    discovery.discover(output);
    consumer.get();

    // root, empty, empty/nested, a
    ASSERT_EQ(batches.size(), 4u);
    EXPECT_EQ(std::count_if(batches.begin(), batches.end(),
                            [](const FileBatch& batch) { return batch.empty(); }), 3);
    EXPECT_TRUE(output.is_closed());
}

TEST_P(FileDiscoveryTest, EmptyRoot) {
    FileDiscovery discovery(file_system, GetParam());
    EXPECT_TRUE(discovery.collect().empty());
}

// Test that a listing failure aborts the whole traversal
TEST_P(FileDiscoveryTest, ListingFailureAborts) {
    build_wide_tree(50, 3);
    file_system->fail_on("dir17");

    FileDiscovery discovery(file_system, GetParam());
    EXPECT_THROW(discovery.collect(), DiscoveryError);
}

TEST_P(FileDiscoveryTest, MetadataFailureAborts) {
    build_deep_tree(20);
    file_system->fail_on("d0/d1/d2/f.bin");

    FileDiscovery discovery(file_system, GetParam());
    BoundedChannel<FileBatch> output(2);
    auto drain = std::async(std::launch::async, [&output]() {
        FileBatch batch;
        while (output.receive(batch)) {
        }
    });

    EXPECT_THROW(discovery.discover(output), DiscoveryError);
    drain.get();
    EXPECT_TRUE(output.is_closed());
}

INSTANTIATE_TEST_SUITE_P(WorkerCounts, FileDiscoveryTest, ::testing::Values(1, 2, 16));

class LocalFileSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging(boost::log::trivial::fatal);
        root = std::filesystem::temp_directory_path() /
               ("pneumatic_discovery_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "sub" / "deeper");
        write_file(root / "a.txt", 10);
        write_file(root / "sub" / "b.bin", 2048);
        write_file(root / "sub" / "deeper" / "c.dat", 0);
    }

    void TearDown() override {
        std::filesystem::remove_all(root);
    }

    static void write_file(const std::filesystem::path& path, std::size_t size) {
        std::ofstream file(path, std::ios::binary);
        file << std::string(size, 'x');
    }

    std::filesystem::path root;
};

TEST_F(LocalFileSystemTest, DiscoversFilesWithSizes) {
    auto file_system = std::make_shared<LocalFileSystem>(root.string());
    FileDiscovery discovery(file_system, 4);

    auto files = discovery.collect();
    std::sort(files.begin(), files.end(), [](const FileMetadata& lhs, const FileMetadata& rhs) {
        return lhs.relative_path < rhs.relative_path;
    });

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].relative_path, "a.txt");
    EXPECT_EQ(files[0].size, 10u);
    EXPECT_EQ(files[1].relative_path, "sub/b.bin");
    EXPECT_EQ(files[1].size, 2048u);
    EXPECT_EQ(files[2].relative_path, "sub/deeper/c.dat");
    EXPECT_EQ(files[2].size, 0u);
    EXPECT_TRUE(files[0].modified_at.has_value());
}

// Test that a link to a directory is reported as a file, not followed
TEST_F(LocalFileSystemTest, SymlinkNotFollowed) {
    std::filesystem::create_directory_symlink(root / "sub", root / "link");
    auto file_system = std::make_shared<LocalFileSystem>(root.string());

    const auto files = FileDiscovery(file_system, 2).collect();
    const auto paths = paths_of(files);
    EXPECT_EQ(paths.count("link"), 1u);
    EXPECT_EQ(paths.count("link/b.bin"), 0u);
    EXPECT_EQ(files.size(), 4u);
}

TEST_F(LocalFileSystemTest, MissingRootRejected) {
    EXPECT_THROW(LocalFileSystem((root / "missing").string()), DiscoveryError);
}
