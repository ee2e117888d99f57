#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>
#include <nlohmann/json.hpp>
#include "build/archive_writer.hpp"
#include "build/build_callback.hpp"
#include "build/build_dispatcher.hpp"
#include "build/build_error.hpp"
#include "build/piece_commitment.hpp"
#include "build/slice_builder.hpp"
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace slicer::build;
using slicer::crypto::Sha256;
using slicer::partition::CancellationToken;
using slicer::partition::FileDescriptor;
using slicer::partition::PartitionCancelled;
using slicer::partition::SlicePlan;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;

namespace {

FileDescriptor range_of(const std::filesystem::path& path, std::int64_t file_size,
                        std::int64_t start, std::int64_t end) {
  FileDescriptor descriptor = FileDescriptor::whole(path, file_size);
  descriptor.byte_start = start;
  descriptor.byte_end = end;
  return descriptor;
}

std::uint64_t read_big_endian(const std::string& bytes, std::size_t offset, std::size_t width) {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    value = (value << 8) | static_cast<unsigned char>(bytes[offset + i]);
  }
  return value;
}

class MockCallback : public BuildCallback {
public:
  MOCK_METHOD(void, on_success, (const SliceArchive& archive, const std::string& slice_name,
                                 const std::string& content_id, const std::string& detail), (override));
  MOCK_METHOD(void, on_error, (const std::exception& error), (override));
};

// Records every successful slice and optionally fails or stalls on request
class RecordingCallback : public BuildCallback {
public:
  void on_success(const SliceArchive&, const std::string& slice_name, const std::string&,
                  const std::string&) override {
    int now = ++running;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(delay);
    {
      std::lock_guard<std::mutex> lock(mutex);
      names.push_back(slice_name);
    }
    --running;
    if (slice_name == fail_on) {
      throw BuildError("refusing " + slice_name);
    }
  }

  void on_error(const std::exception& error) override {
    throw BuildError(error.what());
  }

  std::mutex mutex;
  std::vector<std::string> names;
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::chrono::milliseconds delay{0};
  std::string fail_on;
};

} // namespace

class BuildTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path input_dir;
  std::filesystem::path car_dir;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("build_test");
    input_dir = test_dir / "input";
    car_dir = test_dir / "cars";
    std::filesystem::create_directories(input_dir);
    std::filesystem::create_directories(car_dir);
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }

  // Temporary archives left behind in the output directory
  std::size_t temp_files() const {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(car_dir)) {
      if (entry.path().extension() == ".tmp") {
        count++;
      }
    }
    return count;
  }

  SlicePlan plan_with(std::vector<FileDescriptor> descriptors, std::size_t index = 0, std::size_t total = 1) {
    SlicePlan plan;
    plan.descriptors = std::move(descriptors);
    plan.slice_index = index;
    plan.slice_total = total;
    return plan;
  }
};

//==============================================
// ARCHIVE WRITER
//==============================================

TEST_F(BuildTest, ArchiveLayoutAndContentId) {
  auto a = write_test_file(input_dir / "a.txt", 10);
  auto b = write_test_file(input_dir / "b.txt", 30, 'A');

  ArchiveWriter writer(car_dir);
  auto archive = writer.write({FileDescriptor::whole(a, 10), range_of(b, 30, 5, 14)});
  ASSERT_NE(archive, nullptr);

  const std::string bytes = read_test_file(archive->path());
  EXPECT_EQ(static_cast<std::int64_t>(bytes.size()), archive->size());
  EXPECT_EQ(bytes.substr(0, 8), "SLCARv01");
  EXPECT_EQ(read_big_endian(bytes, 8, 4), 2u);

  // First entry
  std::size_t offset = 12;
  ASSERT_EQ(read_big_endian(bytes, offset, 2), 5u);
  EXPECT_EQ(bytes.substr(offset + 2, 5), "a.txt");
  offset += 2 + 5;
  EXPECT_EQ(read_big_endian(bytes, offset, 8), 10u);
  EXPECT_EQ(bytes.substr(offset + 8, 10), "abcdefghij");
  offset += 8 + 10;

  // Second entry holds bytes 5..14 of b.txt
  ASSERT_EQ(read_big_endian(bytes, offset, 2), 5u);
  offset += 2 + 5;
  EXPECT_EQ(read_big_endian(bytes, offset, 8), 10u);
  EXPECT_EQ(bytes.substr(offset + 8, 10), "FGHIJKLMNO");
  EXPECT_EQ(offset + 8 + 10, bytes.size());

  EXPECT_EQ(archive->content_id(), "payload-" + Sha256::to_hex(Sha256::hash(bytes.data(), bytes.size())));
  ASSERT_EQ(archive->entries().size(), 2u);
  EXPECT_EQ(archive->entries()[1].digest, Sha256::to_hex(Sha256::hash("FGHIJKLMNO", 10)));
}

TEST_F(BuildTest, SameInputGivesSameContentId) {
  auto a = write_test_file(input_dir / "a.txt", 100);
  ArchiveWriter writer(car_dir);
  auto first = writer.write({FileDescriptor::whole(a, 100)});
  auto second = writer.write({FileDescriptor::whole(a, 100)});
  EXPECT_NE(first->path(), second->path());
  EXPECT_EQ(first->content_id(), second->content_id());
}

TEST_F(BuildTest, ArchiveFileRemovedWithObject) {
  auto a = write_test_file(input_dir / "a.txt", 10);
  std::filesystem::path path;
  {
    auto archive = ArchiveWriter(car_dir).write({FileDescriptor::whole(a, 10)});
    path = archive->path();
    EXPECT_TRUE(std::filesystem::exists(path));
  }
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(BuildTest, ShortSourceFailsWithoutLeftovers) {
  auto a = write_test_file(input_dir / "a.txt", 10);
  ArchiveWriter writer(car_dir);
  EXPECT_THROW(writer.write({range_of(a, 10, 0, 49)}), BuildError);
  EXPECT_THROW(writer.write({FileDescriptor::whole(input_dir / "gone.txt", 10)}), BuildError);
  EXPECT_EQ(temp_files(), 0u);
}

TEST_F(BuildTest, EmptyFilesAreRecorded) {
  auto empty = write_test_file(input_dir / "empty.txt", 0);
  auto archive = ArchiveWriter(car_dir).write({FileDescriptor::whole(empty, 0)});
  ASSERT_EQ(archive->entries().size(), 1u);
  EXPECT_EQ(archive->entries()[0].size, 0);
}

TEST_F(BuildTest, EntryNamesAreRelativeToParent) {
  ArchiveWriter writer(car_dir, input_dir);

  auto nested = FileDescriptor::whole(input_dir / "sub" / "deep" / "x.bin", 1);
  EXPECT_EQ(writer.entry_name(nested), "sub/deep/x.bin");

  auto top = FileDescriptor::whole(input_dir / "y.bin", 1);
  EXPECT_EQ(writer.entry_name(top), "y.bin");

  // Renamed descriptors keep their directory but use the display name
  nested.display_name = "0f3a.bin";
  EXPECT_EQ(writer.entry_name(nested), "sub/deep/0f3a.bin");

  auto outside = FileDescriptor::whole(test_dir / "elsewhere" / "z.bin", 1);
  EXPECT_EQ(writer.entry_name(outside), "z.bin");

  EXPECT_EQ(ArchiveWriter(car_dir).entry_name(nested), "0f3a.bin");
}


//==============================================
// SLICE BUILDER
//==============================================

TEST_F(BuildTest, SliceNameFormat) {
  EXPECT_EQ(SliceBuilder::slice_name("dataset", 0, 3), "dataset-total-3-part-1");
  EXPECT_EQ(SliceBuilder::slice_name("dataset", 2, 3), "dataset-total-3-part-3");
}

TEST_F(BuildTest, BuilderReportsSuccessWithDetail) {
  auto a = write_test_file(input_dir / "a.txt", 10);
  MockCallback callback;
  std::string detail;
  std::string content_id;
  EXPECT_CALL(callback, on_error(_)).Times(0);
  EXPECT_CALL(callback, on_success(_, "graph-total-2-part-2", _, _))
    .WillOnce(Invoke([&](const SliceArchive& archive, const std::string&, const std::string& id,
                         const std::string& d) {
      EXPECT_EQ(id, archive.content_id());
      content_id = id;
      detail = d;
    }));

  SliceBuilder builder(ArchiveWriter(car_dir, input_dir), callback, "graph", false);
  builder.build(plan_with({FileDescriptor::whole(a, 10)}, 1, 2));

  auto json = nlohmann::json::parse(detail);
  EXPECT_EQ(json["Name"], "");
  EXPECT_EQ(json["Hash"], content_id);
  ASSERT_EQ(json["Link"].size(), 1u);
  EXPECT_EQ(json["Link"][0]["Name"], "a.txt");
  EXPECT_EQ(json["Link"][0]["Size"], 10);
  EXPECT_EQ(json["Link"][0]["Hash"], Sha256::to_hex(Sha256::hash("abcdefghij", 10)));

  // The archive does not outlive the build
  EXPECT_EQ(temp_files(), 0u);
}

TEST_F(BuildTest, SkipFilenameOmitsLinkNames) {
  auto a = write_test_file(input_dir / "a.txt", 10);
  auto archive = ArchiveWriter(car_dir).write({FileDescriptor::whole(a, 10)});

  MockCallback callback;
  SliceBuilder builder(ArchiveWriter(car_dir), callback, "graph", true);
  auto json = nlohmann::json::parse(builder.detail(*archive));
  EXPECT_FALSE(json["Link"][0].contains("Name"));
  EXPECT_EQ(json["Size"], archive->size());
}

TEST_F(BuildTest, BuilderReportsWriteFailure) {
  MockCallback callback;
  EXPECT_CALL(callback, on_success(_, _, _, _)).Times(0);
  EXPECT_CALL(callback, on_error(_)).Times(1);

  SliceBuilder builder(ArchiveWriter(car_dir), callback, "graph");
  builder.build(plan_with({FileDescriptor::whole(input_dir / "gone.txt", 10)}));
}


//==============================================
// CALLBACKS
//==============================================

TEST_F(BuildTest, CommitmentCallbackStoresArchiveAndManifestRow) {
  auto a = write_test_file(input_dir / "a.txt", 300);
  auto archive = ArchiveWriter(car_dir).write({FileDescriptor::whole(a, 300)});
  CommitmentResult expected;
  {
    auto in = archive->open();
    expected = PieceCommitment::compute(in);
  }

  slicer::store::ManifestRepository repository;
  CallbackOptions options;
  options.car_dir = car_dir;
  options.repository = &repository;
  auto callback = make_build_callback(CallbackKind::CommitmentRecording, options);
  callback->on_success(*archive, "graph-total-1-part-1", archive->content_id(), "{\"Link\":[]}");

  auto stored = car_dir / (expected.commitment_id + ".car");
  ASSERT_TRUE(std::filesystem::exists(stored));
  EXPECT_EQ(read_test_file(stored), read_test_file(archive->path()));

  const std::string manifest = read_test_file(car_dir / MANIFEST_FILE_NAME);
  EXPECT_EQ(manifest.rfind("payload_cid,filename,piece_cid,payload_size,piece_size,detail\r\n", 0), 0u);
  EXPECT_THAT(manifest, HasSubstr(archive->content_id() + ",graph-total-1-part-1," + expected.commitment_id +
                                  "," + std::to_string(archive->size()) + "," +
                                  std::to_string(expected.piece_size) + ",\"{\"\"Link\"\":[]}\"\r\n"));

  auto record = repository.get_by_payload_cid(archive->content_id());
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->piece_cid, expected.commitment_id);
  EXPECT_EQ(record->status, slicer::store::ManifestStatus::Completed);
}

TEST_F(BuildTest, CommitmentCallbackPadsAndRenames) {
  auto a = write_test_file(input_dir / "a.txt", 300);
  auto archive = ArchiveWriter(car_dir).write({FileDescriptor::whole(a, 300)});

  CallbackOptions options;
  options.car_dir = car_dir;
  options.rename = true;
  options.add_padding = true;
  auto callback = make_build_callback(CallbackKind::CommitmentRecording, options);
  callback->on_success(*archive, "graph-total-1-part-1", archive->content_id(), "{}");

  CommitmentResult expected;
  {
    auto in = archive->open();
    expected = PieceCommitment::compute(in);
  }
  auto renamed = car_dir / expected.commitment_id;
  EXPECT_FALSE(std::filesystem::exists(car_dir / (expected.commitment_id + ".car")));
  ASSERT_TRUE(std::filesystem::exists(renamed));
  EXPECT_EQ(std::filesystem::file_size(renamed), PieceCommitment::unpadded_size(expected.piece_size));
}

TEST_F(BuildTest, ManifestOnlyCallbackUsesShortHeader) {
  auto a = write_test_file(input_dir / "a.txt", 50);
  auto archive = ArchiveWriter(car_dir).write({FileDescriptor::whole(a, 50)});

  CallbackOptions options;
  options.car_dir = car_dir;
  auto callback = make_build_callback(CallbackKind::ManifestOnly, options);
  callback->on_success(*archive, "graph-total-1-part-1", archive->content_id(), "plain");

  EXPECT_TRUE(std::filesystem::exists(car_dir / (archive->content_id() + ".car")));
  EXPECT_EQ(read_test_file(car_dir / MANIFEST_FILE_NAME),
            "payload_cid,filename,detail\r\n" + archive->content_id() + ",graph-total-1-part-1,plain\r\n");
}

TEST_F(BuildTest, DiscardCallbackWritesNothing) {
  auto a = write_test_file(input_dir / "a.txt", 50);
  auto archive = ArchiveWriter(car_dir).write({FileDescriptor::whole(a, 50)});

  auto callback = make_build_callback(CallbackKind::Discard, CallbackOptions{});
  callback->on_success(*archive, "graph-total-1-part-1", archive->content_id(), "{}");
  EXPECT_FALSE(std::filesystem::exists(car_dir / MANIFEST_FILE_NAME));
  EXPECT_EQ(std::distance(std::filesystem::directory_iterator(car_dir), std::filesystem::directory_iterator()), 1);
}

TEST_F(BuildTest, OnErrorAlwaysThrows) {
  CallbackOptions options;
  options.car_dir = car_dir;
  const std::runtime_error cause("disk full");
  for (auto kind : {CallbackKind::CommitmentRecording, CallbackKind::ManifestOnly, CallbackKind::Discard}) {
    auto callback = make_build_callback(kind, options);
    try {
      callback->on_error(cause);
      ADD_FAILURE() << "on_error returned";
    } catch (const BuildError& e) {
      EXPECT_THAT(e.what(), HasSubstr("disk full"));
    }
  }
}

TEST_F(BuildTest, DuplicateSliceIsRejectedByRepository) {
  auto a = write_test_file(input_dir / "a.txt", 64);
  auto archive = ArchiveWriter(car_dir).write({FileDescriptor::whole(a, 64)});

  slicer::store::ManifestRepository repository;
  CallbackOptions options;
  options.car_dir = car_dir;
  options.repository = &repository;
  auto callback = make_build_callback(CallbackKind::CommitmentRecording, options);
  callback->on_success(*archive, "graph-total-1-part-1", archive->content_id(), "{}");
  EXPECT_THROW(callback->on_success(*archive, "graph-total-1-part-1", archive->content_id(), "{}"), BuildError);
}


//==============================================
// DISPATCHER
//==============================================

TEST_F(BuildTest, DispatcherBuildsEverySlice) {
  std::vector<FileDescriptor> files;
  for (int i = 0; i < 6; ++i) {
    auto path = write_test_file(input_dir / ("f" + std::to_string(i)), 20 + i);
    files.push_back(FileDescriptor::whole(path, 20 + i));
  }

  RecordingCallback callback;
  callback.delay = std::chrono::milliseconds(20);
  SliceBuilder builder(ArchiveWriter(car_dir), callback, "graph");
  {
    BuildDispatcher dispatcher(builder, 2);
    for (std::size_t i = 0; i < files.size(); ++i) {
      dispatcher.accept(plan_with({files[i]}, i, files.size()));
    }
    dispatcher.wait();
    EXPECT_EQ(dispatcher.completed(), 6u);
  }

  EXPECT_EQ(callback.names.size(), 6u);
  EXPECT_LE(callback.peak.load(), 2);
  EXPECT_EQ(temp_files(), 0u);
}

TEST_F(BuildTest, DispatcherPropagatesFirstFailure) {
  auto path = write_test_file(input_dir / "f", 20);
  RecordingCallback callback;
  callback.fail_on = "graph-total-3-part-1";
  SliceBuilder builder(ArchiveWriter(car_dir), callback, "graph");

  BuildDispatcher dispatcher(builder, 1);
  dispatcher.accept(plan_with({FileDescriptor::whole(path, 20)}, 0, 3));
  EXPECT_THROW(
    {
      // With one worker the failure is recorded before the next slot frees up
      dispatcher.accept(plan_with({FileDescriptor::whole(path, 20)}, 1, 3));
      dispatcher.accept(plan_with({FileDescriptor::whole(path, 20)}, 2, 3));
      dispatcher.wait();
    },
    BuildError);
  EXPECT_THROW(dispatcher.wait(), BuildError);
}

TEST_F(BuildTest, DispatcherStopsOnCancellation) {
  auto path = write_test_file(input_dir / "f", 20);
  RecordingCallback callback;
  SliceBuilder builder(ArchiveWriter(car_dir), callback, "graph");
  CancellationToken cancel;

  BuildDispatcher dispatcher(builder, 2, &cancel);
  dispatcher.accept(plan_with({FileDescriptor::whole(path, 20)}, 0, 2));
  cancel.cancel();
  EXPECT_THROW(dispatcher.accept(plan_with({FileDescriptor::whole(path, 20)}, 1, 2)), PartitionCancelled);
  dispatcher.wait();
  EXPECT_EQ(dispatcher.completed(), 1u);
}

TEST_F(BuildTest, DispatcherRejectsZeroParallel) {
  RecordingCallback callback;
  SliceBuilder builder(ArchiveWriter(car_dir), callback, "graph");
  EXPECT_THROW(BuildDispatcher(builder, 0), std::invalid_argument);
}
