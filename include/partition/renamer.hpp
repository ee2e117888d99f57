#pragma once

#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "partition/types.hpp"

namespace slicer {
namespace partition {

// Replaces display names with random identifiers, leaving the source path untouched
class Renamer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Renamer();
  explicit Renamer(std::uint64_t seed);


  // ---- RENAMING ----
  // Returns a copy of the descriptor with an anonymized display name.
  // The extension of the current display name is preserved.
  FileDescriptor rename(const FileDescriptor& descriptor);
  // Renames every descriptor independently
  std::vector<FileDescriptor> rename_all(const std::vector<FileDescriptor>& descriptors);

private:
  // ---- PARAMETERS ----
  std::mutex mutex_;
  std::mt19937_64 generator_;

  std::string random_identifier();
};

} // namespace partition
} // namespace slicer
