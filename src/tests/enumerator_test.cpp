#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <thread>
#include <vector>
#include "enumerate/channel.hpp"
#include "enumerate/file_enumerator.hpp"
#include "test_utils.hpp"

using namespace slicer::enumerate;

//==============================================
// CHANNEL
//==============================================

TEST(ChannelTest, PreservesFifoOrder) {
  Channel<int> channel;
  EXPECT_TRUE(channel.empty());

  channel.produce(1);
  channel.produce(2);
  channel.produce(3);
  EXPECT_EQ(channel.size(), 3u);

  int value = 0;
  ASSERT_TRUE(channel.consume(value));
  EXPECT_EQ(value, 1);

  auto rest = channel.drain();
  EXPECT_EQ(rest, (std::vector<int>{2, 3}));
  EXPECT_TRUE(channel.empty());
  EXPECT_FALSE(channel.consume(value));
}

TEST(ChannelTest, ConcurrentProducers) {
  Channel<int> channel;
  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([&channel, t] {
      for (int i = 0; i < 250; ++i) {
        channel.produce(t * 1000 + i);
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }

  auto items = channel.drain();
  EXPECT_EQ(items.size(), 1000u);
  EXPECT_EQ(std::set<int>(items.begin(), items.end()).size(), 1000u);
}


//==============================================
// FILE ENUMERATOR
//==============================================

class FileEnumeratorTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("enumerator_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }
};

TEST_F(FileEnumeratorTest, FindsFilesInNestedDirectories) {
  write_test_file(test_dir / "a.txt", 10);
  write_test_file(test_dir / "sub" / "b.txt", 20);
  write_test_file(test_dir / "sub" / "deeper" / "c.txt", 30);
  write_test_file(test_dir / "empty.txt", 0);
  std::filesystem::create_directories(test_dir / "no_files_here");

  FileEnumerator enumerator(3);
  auto result = enumerator.enumerate({test_dir});

  ASSERT_EQ(result.files.size(), 4u);
  EXPECT_EQ(result.skipped, 0u);
  EXPECT_TRUE(std::is_sorted(result.files.begin(), result.files.end(),
                             [](const auto& lhs, const auto& rhs) { return lhs.path < rhs.path; }));
  for (const auto& file : result.files) {
    EXPECT_TRUE(file.is_whole_file()) << file.path;
    EXPECT_EQ(file.display_name, file.path.filename().string());
  }
  EXPECT_EQ(total_size(result.files), 60);
}

TEST_F(FileEnumeratorTest, SingleFileRoot) {
  auto file = write_test_file(test_dir / "only.bin", 42);

  FileEnumerator enumerator(1);
  auto result = enumerator.enumerate({file});

  ASSERT_EQ(result.files.size(), 1u);
  EXPECT_EQ(result.files[0].file_size, 42);
  EXPECT_EQ(result.files[0].byte_end, 41);
}

TEST_F(FileEnumeratorTest, MissingRootIsSkipped) {
  write_test_file(test_dir / "present.txt", 5);

  FileEnumerator enumerator(2);
  auto result = enumerator.enumerate({test_dir / "missing", test_dir});

  EXPECT_EQ(result.files.size(), 1u);
  EXPECT_EQ(result.skipped, 1u);
}

TEST_F(FileEnumeratorTest, BrokenLinkIsSkipped) {
  write_test_file(test_dir / "real.txt", 5);
  std::filesystem::create_symlink(test_dir / "nowhere.txt", test_dir / "dangling.txt");

  FileEnumerator enumerator(2);
  auto result = enumerator.enumerate({test_dir});

  ASSERT_EQ(result.files.size(), 1u);
  EXPECT_EQ(result.files[0].display_name, "real.txt");
  EXPECT_EQ(result.skipped, 1u);
}

TEST_F(FileEnumeratorTest, DirectoryLinksAreNotFollowed) {
  write_test_file(test_dir / "real" / "a.txt", 5);
  std::filesystem::create_directory_symlink(test_dir, test_dir / "real" / "loop");

  FileEnumerator enumerator(2);
  auto result = enumerator.enumerate({test_dir});

  EXPECT_EQ(result.files.size(), 1u);
}

TEST_F(FileEnumeratorTest, ZeroWorkersRejected) {
  EXPECT_THROW(FileEnumerator(0), std::invalid_argument);
}


//==============================================
// HELPERS
//==============================================

TEST(EnumerateHelpersTest, ShuffleWithSeedIsReproducible) {
  std::vector<FileDescriptor> files;
  for (int i = 0; i < 50; ++i) {
    files.push_back(FileDescriptor::whole("/data/f" + std::to_string(i), i + 1));
  }

  auto first = files;
  auto second = files;
  shuffle_descriptors(first, 7);
  shuffle_descriptors(second, 7);
  EXPECT_EQ(first, second);
  EXPECT_NE(first, files);

  // Same multiset of descriptors
  auto by_path = [](const FileDescriptor& lhs, const FileDescriptor& rhs) { return lhs.path < rhs.path; };
  std::sort(first.begin(), first.end(), by_path);
  std::sort(files.begin(), files.end(), by_path);
  EXPECT_EQ(first, files);
}

TEST(EnumerateHelpersTest, SliceTotalRoundsUp) {
  EXPECT_EQ(slice_total(0, 10), 0u);
  EXPECT_EQ(slice_total(1, 10), 1u);
  EXPECT_EQ(slice_total(10, 10), 1u);
  EXPECT_EQ(slice_total(11, 10), 2u);
  EXPECT_EQ(slice_total(22, 12), 2u);
  EXPECT_THROW(slice_total(10, 0), std::invalid_argument);
}

TEST(EnumerateHelpersTest, TotalSizeCountsRanges) {
  std::vector<FileDescriptor> files = {FileDescriptor::whole("/a", 10), FileDescriptor::whole("/b", 0)};
  FileDescriptor part = FileDescriptor::whole("/c", 100);
  part.byte_start = 20;
  part.byte_end = 29;
  files.push_back(part);
  EXPECT_EQ(total_size(files), 20);
}
