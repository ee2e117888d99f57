#ifndef SLICER_FEEDER_EXTRA_FILE_FEEDER_HPP
#define SLICER_FEEDER_EXTRA_FILE_FEEDER_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "feeder/feeder.hpp"

namespace slicer::feeder {

struct ExtraFileOptions {
  // Target amount of extra content per slice
  std::int64_t reserved_bytes = 0;
  // Room kept for the partitioned payload when checking the hard cap
  std::int64_t slice_reserve_bytes = 0;
  std::int64_t hard_cap_bytes = partition::MAX_PIECE_BYTES;
};

// Cycles through a fixed, pre-shuffled list of extra files, one budget's worth per slice
class ExtraFileFeeder : public Feeder {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Candidates are used in the given order; callers shuffle beforehand
  ExtraFileFeeder(std::vector<FileDescriptor> candidates, ExtraFileOptions options);

  // Enumerates a directory, anonymizes names when asked and shuffles the result.
  // Throws std::invalid_argument when the path is not a directory.
  static std::unique_ptr<ExtraFileFeeder> from_directory(const std::filesystem::path& directory,
                                                         ExtraFileOptions options,
                                                         bool anonymize,
                                                         std::size_t workers,
                                                         std::optional<std::uint64_t> seed = std::nullopt);


  // ---- FEEDER ----
  std::vector<FileDescriptor> next_batch() override;
  FeederBudget budget() const override;


  // ---- GETTERS ----
  std::size_t cursor() const;
  std::size_t candidate_count() const { return candidates_.size(); }

private:
  // ---- PARAMETERS ----
  std::vector<FileDescriptor> candidates_;
  ExtraFileOptions options_;
  mutable std::mutex mutex_;
  std::size_t cursor_ = 0;
};

} // namespace slicer::feeder

#endif // SLICER_FEEDER_EXTRA_FILE_FEEDER_HPP
