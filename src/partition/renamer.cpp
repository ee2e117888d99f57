#include "partition/renamer.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace slicer {
namespace partition {

Renamer::Renamer() : generator_(std::random_device{}()) {}

Renamer::Renamer(std::uint64_t seed) : generator_(seed) {}

FileDescriptor Renamer::rename(const FileDescriptor& descriptor) {
  FileDescriptor renamed = descriptor;
  std::filesystem::path name(descriptor.display_name);
  std::string extension = name.extension().string();
  // Split ranges end in ".00000001"; the extension worth keeping is the one before it
  if (extension.size() == 9 && extension.find_first_not_of("0123456789", 1) == std::string::npos) {
    extension = name.stem().extension().string();
  }
  renamed.display_name = random_identifier() + extension;
  return renamed;
}

std::vector<FileDescriptor> Renamer::rename_all(const std::vector<FileDescriptor>& descriptors) {
  std::vector<FileDescriptor> renamed;
  renamed.reserve(descriptors.size());
  for (const auto& descriptor : descriptors) {
    renamed.push_back(rename(descriptor));
  }
  return renamed;
}

std::string Renamer::random_identifier() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::stringstream ss;
  ss << std::hex << std::setfill('0')
     << std::setw(16) << generator_()
     << std::setw(16) << generator_();
  return ss.str();
}

} // namespace partition
} // namespace slicer
