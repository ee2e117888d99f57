#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <fstream>
#include <thread>
#include <nlohmann/json.hpp>
#include "build/build_callback.hpp"
#include "config/config.hpp"
#include "driver/chunk_driver.hpp"
#include "feeder/segment_tool.hpp"
#include "test_utils.hpp"

using namespace slicer;
using ::testing::HasSubstr;

namespace {

// Writes a small file for every cut request
class FakeSegmentTool : public feeder::SegmentTool {
public:
  void cut(const feeder::SegmentRequest& request) override {
    cuts++;
    write_test_file(request.output, 8, 'v');
  }
  std::string probe_duration(const std::filesystem::path&) override { return "3.0"; }

  std::atomic<int> cuts{0};
};

std::size_t count_occurrences(const std::string& text, const std::string& needle) {
  std::size_t count = 0;
  for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
    count++;
  }
  return count;
}

std::size_t count_lines(const std::string& text) {
  return count_occurrences(text, "\r\n");
}

} // namespace

class ChunkDriverTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path input_dir;
  std::filesystem::path car_dir;
  FakeSegmentTool tool;
  config::ChunkOptions options;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("driver_test");
    input_dir = test_dir / "input";
    car_dir = test_dir / "cars";
    std::filesystem::create_directories(input_dir);
    std::filesystem::create_directories(car_dir);

    options.input_path = input_dir;
    options.car_dir = car_dir;
    options.graph_name = "dataset";
    options.slice_size = 12;
    options.random_select_file = false;
    options.parallel = 2;
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }

  std::size_t archives_in(const std::filesystem::path& dir, const std::string& extension = ".car") const {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
      if (entry.path().extension() == extension) {
        count++;
      }
    }
    return count;
  }

  std::filesystem::path write_config(std::int64_t slice_size, const std::string& extra_path = "",
                                     const std::string& extra_size = "") {
    config::CapacityConfig capacity;
    capacity.slice_size = slice_size;
    capacity.extra_file_path = extra_path;
    capacity.extra_file_size_in_one_piece = extra_size;
    auto path = test_dir / "slicer.json";
    capacity.save(path);
    return path;
  }
};

TEST_F(ChunkDriverTest, InvalidCapacityFailsBeforeAnyWork) {
  write_test_file(input_dir / "a.txt", 10);
  options.slice_size = 0;

  driver::ChunkDriver driver(options, tool);
  partition::CancellationToken cancel;
  EXPECT_THROW(driver.run_once(cancel), config::ConfigError);
  EXPECT_EQ(archives_in(car_dir), 0u);
}

TEST_F(ChunkDriverTest, EmptyInputProducesNoSlices) {
  driver::ChunkDriver driver(options, tool);
  partition::CancellationToken cancel;
  auto report = driver.run(cancel);

  EXPECT_EQ(report.files, 0u);
  EXPECT_EQ(report.slices, 0u);
  EXPECT_FALSE(report.cancelled);
  EXPECT_FALSE(std::filesystem::exists(car_dir / build::MANIFEST_FILE_NAME));
}

TEST_F(ChunkDriverTest, CommitmentRunWritesArchivesAndManifest) {
  write_test_file(input_dir / "f1", 10);
  write_test_file(input_dir / "f2", 10);
  write_test_file(input_dir / "sub" / "f3", 10);

  driver::ChunkDriver driver(options, tool);
  EXPECT_EQ(driver.callback_kind(), build::CallbackKind::CommitmentRecording);
  partition::CancellationToken cancel;
  auto report = driver.run(cancel);

  EXPECT_EQ(report.files, 3u);
  EXPECT_EQ(report.input_bytes, 30);
  EXPECT_EQ(report.slices, 3u);
  EXPECT_EQ(archives_in(car_dir), 3u);
  EXPECT_EQ(archives_in(car_dir, ".tmp"), 0u);

  const std::string manifest = read_test_file(car_dir / build::MANIFEST_FILE_NAME);
  EXPECT_EQ(count_lines(manifest), 4u);
  EXPECT_THAT(manifest, HasSubstr(",dataset-total-3-part-1,piece-"));
  EXPECT_THAT(manifest, HasSubstr(",dataset-total-3-part-2,piece-"));
  EXPECT_THAT(manifest, HasSubstr(",dataset-total-3-part-3,piece-"));
}

TEST_F(ChunkDriverTest, ManifestOnlyRunKeepsRelativeEntryNames) {
  write_test_file(input_dir / "sub" / "f1", 10);
  options.calc_commp = false;
  options.skip_filename = false;

  driver::ChunkDriver driver(options, tool);
  EXPECT_EQ(driver.callback_kind(), build::CallbackKind::ManifestOnly);
  partition::CancellationToken cancel;
  auto report = driver.run(cancel);

  EXPECT_EQ(report.slices, 1u);
  const std::string manifest = read_test_file(car_dir / build::MANIFEST_FILE_NAME);
  EXPECT_EQ(manifest.rfind("payload_cid,filename,detail\r\n", 0), 0u);
  EXPECT_THAT(manifest, HasSubstr("\"\"Name\"\":\"\"sub/f1\"\""));
}

TEST_F(ChunkDriverTest, DiscardRunPersistsNothing) {
  write_test_file(input_dir / "f1", 30);
  options.calc_commp = false;
  options.save_manifest = false;

  driver::ChunkDriver driver(options, tool);
  EXPECT_EQ(driver.callback_kind(), build::CallbackKind::Discard);
  partition::CancellationToken cancel;
  auto report = driver.run(cancel);

  EXPECT_EQ(report.slices, 3u);
  EXPECT_TRUE(std::filesystem::is_empty(car_dir));
}

TEST_F(ChunkDriverTest, CapacityBumpIsPersisted) {
  write_test_file(input_dir / "f1", 10);
  options.config_path = write_config(100);
  options.slice_size = 0;

  driver::ChunkDriver driver(options, tool);
  EXPECT_EQ(driver.options().slice_size, 100);
  partition::CancellationToken cancel;
  driver.run(cancel);

  EXPECT_EQ(driver.options().slice_size, 101);
  EXPECT_EQ(config::CapacityConfig::load(options.config_path).slice_size, 101);
}

TEST_F(ChunkDriverTest, ZeroStepLeavesCapacityAlone) {
  options.config_path = write_config(100);
  options.capacity_step = 0;

  driver::ChunkDriver driver(options, tool);
  EXPECT_EQ(driver.bump_capacity(), 100);
  EXPECT_EQ(config::CapacityConfig::load(options.config_path).slice_size, 100);
}

TEST_F(ChunkDriverTest, ExtraFilesJoinEverySlice) {
  write_test_file(input_dir / "f1", 20);
  write_test_file(input_dir / "f2", 20);
  auto extra_dir = test_dir / "extra";
  write_test_file(extra_dir / "bonus.dat", 5);
  options.config_path = write_config(30, extra_dir.string(), "5");
  options.capacity_step = 0;
  options.calc_commp = false;
  options.skip_filename = false;

  driver::ChunkDriver driver(options, tool);
  partition::CancellationToken cancel;
  auto report = driver.run(cancel);

  // 40 input bytes at 25 bytes per slice
  EXPECT_EQ(report.slices, 2u);
  const std::string manifest = read_test_file(car_dir / build::MANIFEST_FILE_NAME);
  EXPECT_EQ(count_occurrences(manifest, "\"\"Name\"\":\"\"bonus.dat\"\""), 2u);
}

TEST_F(ChunkDriverTest, VideoSegmentsJoinEverySlice) {
  write_test_file(input_dir / "f1", 20);
  write_test_file(input_dir / "f2", 20);
  options.video_path = write_test_file(test_dir / "seed.mp4", 64);
  options.video_output_path = test_dir / "segments";
  options.base_rename = "clip";
  options.video_reserve = 8;
  options.slice_size = 28;
  options.calc_commp = false;
  options.skip_filename = false;

  driver::ChunkDriver driver(options, tool);
  partition::CancellationToken cancel;
  auto report = driver.run(cancel);

  EXPECT_EQ(report.slices, 2u);
  EXPECT_EQ(tool.cuts.load(), 2);
  EXPECT_TRUE(std::filesystem::exists(test_dir / "segments" / "clip0.mp4"));
  EXPECT_TRUE(std::filesystem::exists(test_dir / "segments" / "clip1.mp4"));
  const std::string manifest = read_test_file(car_dir / build::MANIFEST_FILE_NAME);
  EXPECT_EQ(count_occurrences(manifest, ".mp4"), 2u);
}

TEST_F(ChunkDriverTest, ManifestRepositoryReceivesRecords) {
  write_test_file(input_dir / "f1", 30);
  options.manifest_db = test_dir / "manifest.json";

  {
    driver::ChunkDriver driver(options, tool);
    partition::CancellationToken cancel;
    EXPECT_EQ(driver.run(cancel).slices, 3u);
  }

  store::ManifestRepository repository(options.manifest_db);
  EXPECT_EQ(repository.size(), 3u);
  EXPECT_EQ(repository.stats_by_status()[store::ManifestStatus::Completed], 3u);
}

TEST_F(ChunkDriverTest, CancelledBeforeStart) {
  write_test_file(input_dir / "f1", 30);

  driver::ChunkDriver driver(options, tool);
  partition::CancellationToken cancel;
  cancel.cancel();
  auto report = driver.run(cancel);

  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(report.slices, 0u);
}

TEST_F(ChunkDriverTest, LoopStopsWhenCancelled) {
  write_test_file(input_dir / "f1", 10);
  options.config_path = write_config(100);
  options.loop = true;
  options.loop_delay_seconds = 60;
  options.calc_commp = false;
  options.save_manifest = false;

  driver::ChunkDriver driver(options, tool);
  partition::CancellationToken cancel;
  std::thread stopper([&cancel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    cancel.cancel();
  });
  auto report = driver.run(cancel);
  stopper.join();

  EXPECT_TRUE(report.cancelled);
  EXPECT_GE(config::CapacityConfig::load(options.config_path).slice_size, 101);
}
