#ifndef SLICER_FEEDER_SEGMENT_TOOL_HPP
#define SLICER_FEEDER_SEGMENT_TOOL_HPP

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace slicer::feeder {

class SegmentError : public std::runtime_error {
public:
  explicit SegmentError(const std::string& message)
    : std::runtime_error("Segment error: " + message) {}
};

struct SegmentRequest {
  std::filesystem::path source;
  std::filesystem::path output;
  // Start position formatted as HH:MM:SS.mmm
  std::string start;
  // Duration in seconds as understood by the tool, e.g. "12.5"
  std::string duration;
};

// External video cutter
class SegmentTool {
public:
  virtual ~SegmentTool() = default;

  // Writes the requested segment; throws SegmentError on failure
  virtual void cut(const SegmentRequest& request) = 0;
  // Returns the duration of the video in seconds; throws SegmentError on failure
  virtual std::string probe_duration(const std::filesystem::path& video) = 0;
};

// Runs ffmpeg and ffprobe as child processes, capturing stderr for error reports
class FfmpegSegmentTool : public SegmentTool {
public:
  explicit FfmpegSegmentTool(std::string ffmpeg_binary = "ffmpeg",
                             std::string ffprobe_binary = "ffprobe");

  void cut(const SegmentRequest& request) override;
  std::string probe_duration(const std::filesystem::path& video) override;

private:
  std::string ffmpeg_binary_;
  std::string ffprobe_binary_;
};

// Formats milliseconds as HH:MM:SS.mmm
std::string format_timestamp(std::int64_t milliseconds);

} // namespace slicer::feeder

#endif // SLICER_FEEDER_SEGMENT_TOOL_HPP
