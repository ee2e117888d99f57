#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "enumerate/channel.hpp"
#include "partition/types.hpp"

namespace slicer {
namespace enumerate {

using partition::FileDescriptor;

struct EnumerationResult {
  std::vector<FileDescriptor> files;
  // Entries that could not be read (permission denied, broken link, missing root)
  std::size_t skipped = 0;
};

class FileEnumerator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileEnumerator(std::size_t workers);


  // ---- ENUMERATION ----
  // Collects a whole-file descriptor for every regular file under the roots.
  // The returned list is sorted by path; callers shuffle it when needed.
  EnumerationResult enumerate(const std::vector<std::filesystem::path>& roots) const;

  std::size_t workers() const { return workers_; }

private:
  // ---- PARAMETERS ----
  std::size_t workers_;

  struct ScanState {
    Channel<FileDescriptor> channel;
    std::atomic<std::size_t> skipped{0};
  };

  // Lists one directory, publishing files and posting sub-directories back to the pool
  void scan_directory(const std::filesystem::path& directory, ScanState& state,
                      boost::asio::thread_pool& pool) const;
  // Publishes a single regular file, counts it as skipped when its size cannot be read
  void publish_file(const std::filesystem::path& file, ScanState& state) const;
};


// ---- HELPERS ----
// Uniform shuffle; the same seed always yields the same order
void shuffle_descriptors(std::vector<FileDescriptor>& files, std::optional<std::uint64_t> seed = std::nullopt);
// Sum of size_in_slice over all descriptors
std::int64_t total_size(const std::vector<FileDescriptor>& files);
// Number of slices needed for total bytes at the given capacity, rounded up
std::size_t slice_total(std::int64_t total, std::int64_t capacity);

} // namespace enumerate
} // namespace slicer
