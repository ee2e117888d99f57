#include "feeder/segment_tool.hpp"
#include <iomanip>
#include <sstream>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>
#include <boost/process.hpp>

namespace slicer::feeder {

namespace bp = boost::process;

namespace {

boost::filesystem::path resolve_binary(const std::string& binary) {
  if (binary.find('/') != std::string::npos) {
    return boost::filesystem::path(binary);
  }
  auto resolved = bp::search_path(binary);
  if (resolved.empty()) {
    throw SegmentError(binary + " not found in PATH");
  }
  return resolved;
}

std::string read_all(bp::ipstream& stream) {
  std::string output;
  std::string line;
  while (std::getline(stream, line)) {
    output += line;
    output += '\n';
  }
  return output;
}

} // namespace

FfmpegSegmentTool::FfmpegSegmentTool(std::string ffmpeg_binary, std::string ffprobe_binary)
  : ffmpeg_binary_(std::move(ffmpeg_binary))
  , ffprobe_binary_(std::move(ffprobe_binary)) {}

void FfmpegSegmentTool::cut(const SegmentRequest& request) {
  if (request.start.empty()) {
    throw SegmentError("start time cannot be empty");
  }
  if (request.duration.empty()) {
    throw SegmentError("duration cannot be empty");
  }

  std::error_code ec;
  if (!std::filesystem::exists(request.source, ec)) {
    throw SegmentError("source video file does not exist: " + request.source.string());
  }
  std::filesystem::create_directories(request.output.parent_path(), ec);
  if (ec) {
    throw SegmentError("failed to create output directory " + request.output.parent_path().string() +
                       ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Segment tool: Cutting " << request.source.string() << " at " << request.start
                           << " for " << request.duration << "s into " << request.output.string();

  std::string stderr_text;
  int exit_code = 0;
  try {
    bp::ipstream err_stream;
    bp::child child(resolve_binary(ffmpeg_binary_),
                    "-ss", request.start,
                    "-i", request.source.string(),
                    "-t", request.duration,
                    "-c", "copy",
                    request.output.string(),
                    "-y",
                    bp::std_in < bp::null,
                    bp::std_out > bp::null,
                    bp::std_err > err_stream);
    stderr_text = read_all(err_stream);
    child.wait();
    exit_code = child.exit_code();
  } catch (const bp::process_error& e) {
    throw SegmentError("failed to run " + ffmpeg_binary_ + ": " + e.what());
  }

  if (exit_code != 0) {
    throw SegmentError("ffmpeg slice failed for " + request.source.string() + ": exit code " +
                       std::to_string(exit_code) + ", stderr: " + stderr_text);
  }
  if (!std::filesystem::exists(request.output, ec)) {
    throw SegmentError("output file was not created: " + request.output.string());
  }
}

std::string FfmpegSegmentTool::probe_duration(const std::filesystem::path& video) {
  std::error_code ec;
  if (!std::filesystem::exists(video, ec)) {
    throw SegmentError("video file does not exist: " + video.string());
  }

  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
  try {
    bp::ipstream out_stream;
    bp::ipstream err_stream;
    bp::child child(resolve_binary(ffprobe_binary_),
                    "-v", "error",
                    "-show_entries", "format=duration",
                    "-of", "default=noprint_wrappers=1:nokey=1",
                    video.string(),
                    bp::std_in < bp::null,
                    bp::std_out > out_stream,
                    bp::std_err > err_stream);
    stdout_text = read_all(out_stream);
    stderr_text = read_all(err_stream);
    child.wait();
    exit_code = child.exit_code();
  } catch (const bp::process_error& e) {
    throw SegmentError("failed to run " + ffprobe_binary_ + ": " + e.what());
  }

  if (exit_code != 0) {
    throw SegmentError("ffprobe failed for " + video.string() + ": exit code " +
                       std::to_string(exit_code) + ", stderr: " + stderr_text);
  }

  boost::algorithm::trim(stdout_text);
  if (stdout_text.empty()) {
    throw SegmentError("no duration found for " + video.string());
  }
  return stdout_text;
}

std::string format_timestamp(std::int64_t milliseconds) {
  const std::int64_t total_seconds = milliseconds / 1000;
  std::stringstream ss;
  ss << std::setfill('0')
     << std::setw(2) << total_seconds / 3600 << ':'
     << std::setw(2) << (total_seconds % 3600) / 60 << ':'
     << std::setw(2) << total_seconds % 60 << '.'
     << std::setw(3) << milliseconds % 1000;
  return ss.str();
}

} // namespace slicer::feeder
