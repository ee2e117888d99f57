#ifndef SLICER_BUILD_ARCHIVE_WRITER_HPP
#define SLICER_BUILD_ARCHIVE_WRITER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "partition/types.hpp"

namespace slicer::build {

// Archive layout, all integers big-endian:
//   magic "SLCARv01" | u32 entry count
//   per entry: u16 name length | name | u64 data length | data
constexpr char ARCHIVE_MAGIC[8] = {'S', 'L', 'C', 'A', 'R', 'v', '0', '1'};

struct ArchiveEntry {
  std::string name;
  std::int64_t size = 0;
  // Hex SHA-256 of the entry data
  std::string digest;
};

// A materialized slice archive backed by a temporary file.
// The file is removed when the object is destroyed.
class SliceArchive {
public:
  SliceArchive(std::filesystem::path path, std::string content_id, std::int64_t size,
               std::vector<ArchiveEntry> entries);
  ~SliceArchive();
  SliceArchive(const SliceArchive&) = delete;
  SliceArchive& operator=(const SliceArchive&) = delete;

  // Opens a fresh reader positioned at the first byte
  std::ifstream open() const;

  const std::filesystem::path& path() const { return path_; }
  const std::string& content_id() const { return content_id_; }
  std::int64_t size() const { return size_; }
  const std::vector<ArchiveEntry>& entries() const { return entries_; }

private:
  std::filesystem::path path_;
  std::string content_id_;
  std::int64_t size_;
  std::vector<ArchiveEntry> entries_;
};

class ArchiveWriter {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Temporary archives are written under work_dir. Entry names are made relative
  // to parent_path when the source lives beneath it.
  explicit ArchiveWriter(std::filesystem::path work_dir, std::filesystem::path parent_path = {});


  // ---- WRITING ----
  // Copies every descriptor's byte range into a new archive while hashing it.
  // Throws BuildError when a source cannot be read in full.
  std::unique_ptr<SliceArchive> write(const std::vector<partition::FileDescriptor>& descriptors) const;

  // Name recorded for a descriptor inside the archive
  std::string entry_name(const partition::FileDescriptor& descriptor) const;

private:
  std::filesystem::path work_dir_;
  std::filesystem::path parent_path_;

  std::filesystem::path temp_path() const;
};

} // namespace slicer::build

#endif // SLICER_BUILD_ARCHIVE_WRITER_HPP
