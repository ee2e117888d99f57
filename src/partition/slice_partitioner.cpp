#include "partition/slice_partitioner.hpp"
#include <algorithm>
#include <cstdio>
#include <boost/log/trivial.hpp>

namespace slicer::partition {

namespace {

std::string cut_name(const std::string& name, std::size_t sequence) {
  char suffix[16];
  std::snprintf(suffix, sizeof(suffix), ".%08zu", sequence);
  return name + suffix;
}

} // namespace

//==============================================
// SPLITTING ARITHMETIC
//==============================================

std::vector<Cut> plan_cuts(std::int64_t accumulated, std::int64_t file_size, std::int64_t cap) {
  if (cap <= 0 || accumulated < 0 || accumulated >= cap || file_size < 0) {
    throw PartitionError("invalid split input: accumulated=" + std::to_string(accumulated) +
                         " size=" + std::to_string(file_size) + " cap=" + std::to_string(cap));
  }

  std::vector<Cut> cuts;
  if (file_size < cap - accumulated) {
    cuts.push_back(Cut{0, file_size - 1, false});
    return cuts;
  }
  if (file_size == cap - accumulated) {
    cuts.push_back(Cut{0, file_size - 1, true});
    return cuts;
  }

  // First cut fills the open slice
  std::int64_t seek_end = cap - accumulated - 1;
  cuts.push_back(Cut{0, seek_end, true});

  // Following cuts are cap sized, the tail may stay open
  while (seek_end < file_size - 1) {
    std::int64_t seek_start = seek_end + 1;
    seek_end = std::min(seek_start + cap - 1, file_size - 1);
    cuts.push_back(Cut{seek_start, seek_end, seek_end - seek_start + 1 == cap});
  }
  return cuts;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SlicePartitioner::SlicePartitioner(std::int64_t target_capacity, feeder::Feeder& feeder, SliceSink& sink,
                                   Renamer* renamer)
  : target_capacity_(target_capacity)
  , cap_(target_capacity - feeder.budget().reserved_bytes)
  , feeder_(feeder)
  , sink_(sink)
  , renamer_(renamer) {
  if (target_capacity_ <= 0) {
    throw PartitionError("slice capacity must be > 0, got " + std::to_string(target_capacity_));
  }
  if (cap_ <= 0) {
    throw PartitionError("slice capacity " + std::to_string(target_capacity_) +
                         " does not exceed feeder reservation " +
                         std::to_string(feeder.budget().reserved_bytes));
  }
  BOOST_LOG_TRIVIAL(debug) << "Partitioner: Capacity " << target_capacity_ << ", " << cap_
                           << " bytes available to input per slice";
}


//==============================================
// PARTITIONING
//==============================================

PartitionReport SlicePartitioner::partition(const std::vector<FileDescriptor>& files, std::size_t slice_total,
                                            const CancellationToken* cancel) {
  BOOST_LOG_TRIVIAL(info) << "Partitioner: Partitioning " << files.size() << " file(s) into at most "
                          << slice_total << " slice(s)";

  PartitionState state;
  PartitionReport report;

  for (const auto& file : files) {
    if (cancel && cancel->cancelled()) {
      BOOST_LOG_TRIVIAL(warning) << "Partitioner: Cancelled after " << state.slice_index << " slice(s)";
      report.cancelled = true;
      report.slices = state.slice_index;
      return report;
    }
    add_file(state, file, slice_total);
    report.files++;
    report.input_bytes += file.size_in_slice();
  }

  // Final remainder is allowed to be smaller than cap
  if (state.accumulated_size > 0 || !state.current_plan.empty()) {
    emit(state, slice_total);
  }

  report.slices = state.slice_index;
  BOOST_LOG_TRIVIAL(info) << "Partitioner: Produced " << report.slices << " slice(s) from "
                          << report.input_bytes << " bytes";
  return report;
}

void SlicePartitioner::add_file(PartitionState& state, const FileDescriptor& file, std::size_t slice_total) {
  const std::int64_t size = file.size_in_slice();
  if (size < 0) {
    throw PartitionError("negative remaining size for " + file.path.string());
  }

  std::vector<Cut> cuts = plan_cuts(state.accumulated_size, size, cap_);

  // Uncut files keep their descriptor as is
  if (cuts.size() == 1) {
    append(state, file);
    if (cuts.front().closes_slice) {
      emit(state, slice_total);
    }
    return;
  }

  std::size_t sequence = 0;
  for (const auto& cut : cuts) {
    FileDescriptor piece = file;
    piece.display_name = cut_name(file.display_name, sequence++);
    piece.byte_start = file.byte_start + cut.byte_start;
    piece.byte_end = file.byte_start + cut.byte_end;

    BOOST_LOG_TRIVIAL(debug) << "Partitioner: Cut " << piece.size_in_slice() << " bytes of "
                             << file.path.string() << ", seek start at " << piece.byte_start
                             << ", end at " << piece.byte_end;
    append(state, std::move(piece));
    if (cut.closes_slice) {
      emit(state, slice_total);
    }
  }
}

void SlicePartitioner::append(PartitionState& state, FileDescriptor descriptor) {
  state.accumulated_size += descriptor.size_in_slice();
  if (state.accumulated_size > cap_) {
    throw PartitionError("slice overflow: " + std::to_string(state.accumulated_size) +
                         " bytes exceed cap " + std::to_string(cap_));
  }
  if (renamer_) {
    descriptor = renamer_->rename(descriptor);
  }
  state.current_plan.push_back(std::move(descriptor));
}

void SlicePartitioner::emit(PartitionState& state, std::size_t slice_total) {
  SlicePlan plan;
  plan.descriptors = feeder_.next_batch();
  plan.descriptors.insert(plan.descriptors.end(),
                          std::make_move_iterator(state.current_plan.begin()),
                          std::make_move_iterator(state.current_plan.end()));
  plan.slice_index = state.slice_index;
  plan.slice_total = slice_total;
  plan.payload_size = state.accumulated_size;

  BOOST_LOG_TRIVIAL(info) << "Partitioner: Slice " << plan.slice_index + 1 << "/" << slice_total
                          << " closed, payload " << plan.payload_size << " bytes, "
                          << plan.descriptors.size() << " descriptor(s)";

  state.accumulated_size = 0;
  state.current_plan.clear();
  state.slice_index++;

  sink_.accept(std::move(plan));
}

} // namespace slicer::partition
