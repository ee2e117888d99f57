#ifndef SLICER_FEEDER_VIDEO_FEEDER_HPP
#define SLICER_FEEDER_VIDEO_FEEDER_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include "feeder/feeder.hpp"
#include "feeder/segment_tool.hpp"

namespace slicer::feeder {

struct VideoOptions {
  std::filesystem::path source;
  std::filesystem::path output_dir;
  // Prefix of every generated segment file name
  std::string base_name;
  // First counter value, lets a new session continue where an earlier one stopped
  std::int64_t start_counter = 0;
  // Offset added to the start position per call
  std::int64_t step_ms = 1;
  // Segment length in seconds; probed from the source when empty
  std::string segment_duration;
  std::int64_t reserved_bytes = 0;
};

// Cuts one fresh segment of a single source video per call
class VideoFeeder : public Feeder {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws SegmentError if the source is missing or its duration cannot be probed
  VideoFeeder(VideoOptions options, SegmentTool& tool);


  // ---- FEEDER ----
  std::vector<FileDescriptor> next_batch() override;
  FeederBudget budget() const override;


  // ---- GETTERS ----
  std::int64_t counter() const { return counter_.load(); }
  const std::string& segment_duration() const { return options_.segment_duration; }

private:
  // ---- PARAMETERS ----
  VideoOptions options_;
  SegmentTool& tool_;
  std::atomic<std::int64_t> counter_;
};

} // namespace slicer::feeder

#endif // SLICER_FEEDER_VIDEO_FEEDER_HPP
