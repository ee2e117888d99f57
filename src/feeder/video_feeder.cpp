#include "feeder/video_feeder.hpp"
#include <system_error>
#include <boost/log/trivial.hpp>

namespace slicer::feeder {

VideoFeeder::VideoFeeder(VideoOptions options, SegmentTool& tool)
  : options_(std::move(options))
  , tool_(tool)
  , counter_(options_.start_counter) {
  if (options_.source.empty()) {
    throw SegmentError("video source path cannot be empty");
  }
  if (options_.output_dir.empty()) {
    throw SegmentError("video output path cannot be empty");
  }
  std::error_code ec;
  if (!std::filesystem::exists(options_.source, ec)) {
    throw SegmentError("source video file does not exist: " + options_.source.string());
  }

  std::filesystem::create_directories(options_.output_dir, ec);
  if (ec) {
    throw SegmentError("failed to create output directory " + options_.output_dir.string() + ": " + ec.message());
  }

  if (options_.segment_duration.empty()) {
    options_.segment_duration = tool_.probe_duration(options_.source);
  }

  BOOST_LOG_TRIVIAL(info) << "Video feeder: Using seed video " << options_.source.string()
                          << " (segment " << options_.segment_duration << "s) writing to "
                          << options_.output_dir.string() << ", counter starts at " << options_.start_counter;
}

std::vector<FileDescriptor> VideoFeeder::next_batch() {
  std::vector<FileDescriptor> batch;

  // fetch_add hands every caller its own index, even across threads
  const std::int64_t index = counter_.fetch_add(1);
  const std::int64_t offset_ms = index * options_.step_ms;

  SegmentRequest request;
  request.source = options_.source;
  request.output = options_.output_dir / (options_.base_name + std::to_string(index) + ".mp4");
  request.start = format_timestamp(offset_ms);
  request.duration = options_.segment_duration;

  BOOST_LOG_TRIVIAL(info) << "Video feeder: Segment " << index << " starting at " << request.start;

  try {
    tool_.cut(request);
  } catch (const SegmentError& e) {
    BOOST_LOG_TRIVIAL(error) << "Video feeder: Split video failed: " << e.what();
    return batch;
  }

  std::error_code ec;
  auto size = std::filesystem::file_size(request.output, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Video feeder: Cannot stat segment " << request.output.string()
                             << ": " << ec.message();
    return batch;
  }

  batch.push_back(FileDescriptor::whole(request.output, static_cast<std::int64_t>(size)));
  return batch;
}

FeederBudget VideoFeeder::budget() const {
  return FeederBudget{options_.reserved_bytes, partition::MAX_PIECE_BYTES};
}

} // namespace slicer::feeder
