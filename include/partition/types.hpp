#ifndef SLICER_PARTITION_TYPES_HPP
#define SLICER_PARTITION_TYPES_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace slicer::partition {

// Absolute ceiling for one slice including supplementary content
constexpr std::int64_t MAX_PIECE_BYTES = 32LL * 1024 * 1024 * 1024;

// One contiguous, inclusive byte range of a source file.
// An empty source file is described by byte_start = 0, byte_end = -1.
struct FileDescriptor {
  std::filesystem::path path;
  std::string display_name;
  std::int64_t file_size = 0;
  std::int64_t byte_start = 0;
  std::int64_t byte_end = -1;

  std::int64_t size_in_slice() const { return byte_end - byte_start + 1; }
  bool is_whole_file() const { return byte_start == 0 && byte_end == file_size - 1; }

  // Builds a descriptor covering the whole file
  static FileDescriptor whole(const std::filesystem::path& path, std::int64_t size);
};

bool operator==(const FileDescriptor& lhs, const FileDescriptor& rhs);
bool operator!=(const FileDescriptor& lhs, const FileDescriptor& rhs);

struct SlicePlan {
  std::vector<FileDescriptor> descriptors;
  std::size_t slice_index = 0;
  std::size_t slice_total = 0;
  // Bytes contributed by partitioned input only, feeder content excluded
  std::int64_t payload_size = 0;
};

struct FeederBudget {
  std::int64_t reserved_bytes = 0;
  std::int64_t hard_cap_bytes = MAX_PIECE_BYTES;
};

// Cooperative cancellation flag shared between the driver and long running loops
class CancellationToken {
public:
  void cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
    cv_.notify_all();
  }
  bool cancelled() const { return cancelled_.load(); }

  // Sleeps for up to timeout; returns true when woken by cancel()
  template<typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
  }

private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

class PartitionError : public std::runtime_error {
public:
  explicit PartitionError(const std::string& message) : std::runtime_error(message) {}
};

class PartitionCancelled : public PartitionError {
public:
  explicit PartitionCancelled(const std::string& message)
    : PartitionError("Partition cancelled: " + message) {}
};

} // namespace slicer::partition

#endif // SLICER_PARTITION_TYPES_HPP
