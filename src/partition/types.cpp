#include "partition/types.hpp"
#include <tuple>

namespace slicer::partition {

FileDescriptor FileDescriptor::whole(const std::filesystem::path& path, std::int64_t size) {
  FileDescriptor descriptor;
  descriptor.path = path;
  descriptor.display_name = path.filename().string();
  descriptor.file_size = size;
  descriptor.byte_start = 0;
  descriptor.byte_end = size - 1;
  return descriptor;
}

bool operator==(const FileDescriptor& lhs, const FileDescriptor& rhs) {
  return std::tie(lhs.path, lhs.display_name, lhs.file_size, lhs.byte_start, lhs.byte_end) ==
         std::tie(rhs.path, rhs.display_name, rhs.file_size, rhs.byte_start, rhs.byte_end);
}

bool operator!=(const FileDescriptor& lhs, const FileDescriptor& rhs) {
  return !(lhs == rhs);
}

} // namespace slicer::partition
