#include "feeder/extra_file_feeder.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "enumerate/file_enumerator.hpp"
#include "partition/renamer.hpp"

namespace slicer::feeder {

ExtraFileFeeder::ExtraFileFeeder(std::vector<FileDescriptor> candidates, ExtraFileOptions options)
  : candidates_(std::move(candidates))
  , options_(options) {
  BOOST_LOG_TRIVIAL(info) << "Extra file feeder: " << candidates_.size() << " candidate(s), "
                          << options_.reserved_bytes << " bytes reserved per slice";
}

std::unique_ptr<ExtraFileFeeder> ExtraFileFeeder::from_directory(const std::filesystem::path& directory,
                                                                 ExtraFileOptions options,
                                                                 bool anonymize,
                                                                 std::size_t workers,
                                                                 std::optional<std::uint64_t> seed) {
  if (!std::filesystem::is_directory(directory)) {
    throw std::invalid_argument("the path " + directory.string() + " is not a directory");
  }

  enumerate::FileEnumerator enumerator(workers);
  auto result = enumerator.enumerate({directory});
  std::vector<FileDescriptor> candidates = std::move(result.files);

  if (anonymize) {
    partition::Renamer renamer;
    candidates = renamer.rename_all(candidates);
  }
  enumerate::shuffle_descriptors(candidates, seed);

  return std::make_unique<ExtraFileFeeder>(std::move(candidates), options);
}

std::vector<FileDescriptor> ExtraFileFeeder::next_batch() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<FileDescriptor> batch;
  if (candidates_.empty()) {
    return batch;
  }

  const std::size_t start = cursor_;
  std::int64_t total = 0;
  while (total < options_.reserved_bytes) {
    const FileDescriptor& candidate = candidates_[cursor_];
    if (total + candidate.size_in_slice() + options_.slice_reserve_bytes <= options_.hard_cap_bytes) {
      total += candidate.size_in_slice();
      batch.push_back(candidate);
    }
    cursor_ = (cursor_ + 1) % candidates_.size();

    // One full revolution ends the request even if the budget is not met
    if (cursor_ == start) {
      break;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Extra file feeder: Batch of " << batch.size() << " file(s), "
                           << total << " bytes, cursor at " << cursor_;
  return batch;
}

FeederBudget ExtraFileFeeder::budget() const {
  return FeederBudget{options_.reserved_bytes, options_.hard_cap_bytes};
}

std::size_t ExtraFileFeeder::cursor() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cursor_;
}

} // namespace slicer::feeder
