#include "driver/chunk_driver.hpp"
#include <chrono>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "build/archive_writer.hpp"
#include "build/build_dispatcher.hpp"
#include "build/slice_builder.hpp"
#include "enumerate/file_enumerator.hpp"
#include "feeder/extra_file_feeder.hpp"
#include "feeder/video_feeder.hpp"
#include "partition/renamer.hpp"
#include "partition/slice_partitioner.hpp"

namespace slicer {
namespace driver {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkDriver::ChunkDriver(config::ChunkOptions options, feeder::SegmentTool& segment_tool)
  : options_(std::move(options))
  , segment_tool_(segment_tool) {
  if (!options_.config_path.empty()) {
    capacity_ = config::CapacityConfig::load(options_.config_path);
    config::apply(*capacity_, options_);
  }
  if (options_.parent_path.empty()) {
    options_.parent_path = options_.input_path;
  }
  BOOST_LOG_TRIVIAL(info) << "Driver: Graph " << options_.graph_name << ", input " << options_.input_path.string()
                          << ", output " << options_.car_dir.string() << ", parallel " << options_.parallel;
}

ChunkDriver::~ChunkDriver() = default;


//==============================================
// RUNNING
//==============================================

RunReport ChunkDriver::run(partition::CancellationToken& cancel) {
  bump_capacity();

  RunReport report = run_once(cancel);
  while (options_.loop && !cancel.cancelled()) {
    const std::int64_t capacity = bump_capacity();
    BOOST_LOG_TRIVIAL(info) << "Driver: Slice size has been set as " << capacity;
    BOOST_LOG_TRIVIAL(info) << "Driver: Chunking completed, waiting for " << options_.loop_delay_seconds << " seconds";

    if (cancel.wait_for(std::chrono::seconds(options_.loop_delay_seconds))) {
      break;
    }
    report = run_once(cancel);
  }

  if (cancel.cancelled()) {
    BOOST_LOG_TRIVIAL(warning) << "Driver: Stopped on cancellation request";
    report.cancelled = true;
  }
  return report;
}

RunReport ChunkDriver::run_once(const partition::CancellationToken& cancel) {
  config::validate(options_);

  RunReport report;
  if (cancel.cancelled()) {
    report.cancelled = true;
    return report;
  }

  // Enumeration is drained completely before partitioning starts
  enumerate::FileEnumerator enumerator(options_.parallel);
  enumerate::EnumerationResult enumerated = enumerator.enumerate({options_.input_path});
  report.skipped = enumerated.skipped;
  if (enumerated.skipped > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Driver: Skipped " << enumerated.skipped << " unreadable entries";
  }

  std::vector<partition::FileDescriptor> files = std::move(enumerated.files);
  const std::int64_t total = enumerate::total_size(files);
  BOOST_LOG_TRIVIAL(info) << "Driver: Total files: " << files.size() << ", " << total << " bytes";
  if (total == 0) {
    BOOST_LOG_TRIVIAL(warning) << "Driver: Empty folder or file: " << options_.input_path.string();
    report.files = files.size();
    return report;
  }

  if (options_.random_select_file) {
    enumerate::shuffle_descriptors(files, options_.shuffle_seed);
  }

  feeder::Feeder& feeder = active_feeder();
  const std::int64_t cap = options_.slice_size - feeder.budget().reserved_bytes;
  const std::size_t slice_total = enumerate::slice_total(total, cap);

  if (!options_.manifest_db.empty() && !repository_) {
    repository_ = std::make_unique<store::ManifestRepository>(options_.manifest_db);
  }

  build::CallbackOptions callback_options;
  callback_options.car_dir = options_.car_dir;
  callback_options.rename = options_.rename;
  callback_options.add_padding = options_.add_padding;
  callback_options.repository = repository_.get();
  auto callback = build::make_build_callback(callback_kind(), callback_options);

  build::SliceBuilder builder(build::ArchiveWriter(options_.car_dir, options_.parent_path), *callback,
                              options_.graph_name, options_.skip_filename);
  build::BuildDispatcher dispatcher(builder, options_.parallel, &cancel);

  std::unique_ptr<partition::Renamer> renamer;
  if (options_.random_rename_source_file) {
    renamer = std::make_unique<partition::Renamer>();
  }
  partition::SlicePartitioner partitioner(options_.slice_size, feeder, dispatcher, renamer.get());

  partition::PartitionReport partitioned;
  try {
    partitioned = partitioner.partition(files, slice_total, &cancel);
  } catch (const partition::PartitionCancelled& e) {
    BOOST_LOG_TRIVIAL(warning) << "Driver: " << e.what();
    partitioned.cancelled = true;
  }
  dispatcher.wait();

  report.files = files.size();
  report.input_bytes = total;
  report.slices = dispatcher.completed();
  report.cancelled = partitioned.cancelled;
  BOOST_LOG_TRIVIAL(info) << "Driver: Run finished: " << report.files << " file(s), " << report.skipped
                          << " skipped, " << report.slices << " slice(s)"
                          << (report.cancelled ? " (cancelled)" : "");
  return report;
}

std::int64_t ChunkDriver::bump_capacity() {
  if (!capacity_ || options_.capacity_step == 0) {
    return options_.slice_size;
  }

  BOOST_LOG_TRIVIAL(info) << "Driver: Old slice size: " << capacity_->slice_size;
  capacity_->slice_size += options_.capacity_step;
  capacity_->save(options_.config_path);
  options_.slice_size = capacity_->slice_size;
  BOOST_LOG_TRIVIAL(info) << "Driver: New slice size: " << options_.slice_size;
  return options_.slice_size;
}

build::CallbackKind ChunkDriver::callback_kind() const {
  if (options_.calc_commp) {
    return build::CallbackKind::CommitmentRecording;
  }
  if (options_.save_manifest) {
    return build::CallbackKind::ManifestOnly;
  }
  return build::CallbackKind::Discard;
}


//==============================================
// FEEDERS
//==============================================

feeder::Feeder& ChunkDriver::active_feeder() {
  if (feeder_) {
    return *feeder_;
  }

  if (!options_.video_path.empty()) {
    if (!options_.extra_file_path.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "Driver: Video path set, extra files from "
                                 << options_.extra_file_path.string() << " are not used";
    }
    feeder::VideoOptions video;
    video.source = options_.video_path;
    video.output_dir = options_.video_output_path;
    if (video.output_dir.empty()) {
      video.output_dir = std::filesystem::is_directory(options_.input_path) ? options_.input_path
                                                                           : options_.input_path.parent_path();
    }
    video.base_name = options_.base_rename;
    if (video.base_name.empty()) {
      video.base_name = boost::uuids::to_string(boost::uuids::random_generator()());
    }
    video.start_counter = options_.base_limit;
    video.step_ms = options_.video_step_ms;
    video.reserved_bytes = options_.video_reserve;
    feeder_ = std::make_unique<feeder::VideoFeeder>(std::move(video), segment_tool_);
  } else if (!options_.extra_file_path.empty()) {
    feeder::ExtraFileOptions extra;
    extra.reserved_bytes = options_.extra_file_size;
    extra.slice_reserve_bytes = options_.slice_size;
    feeder_ = feeder::ExtraFileFeeder::from_directory(options_.extra_file_path, extra,
                                                      options_.random_rename_source_file, options_.parallel,
                                                      options_.shuffle_seed);
  } else {
    feeder_ = std::make_unique<feeder::NullFeeder>();
  }
  return *feeder_;
}

} // namespace driver
} // namespace slicer
