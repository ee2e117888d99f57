#ifndef SLICER_PARTITION_SLICE_PARTITIONER_HPP
#define SLICER_PARTITION_SLICE_PARTITIONER_HPP

#include <cstdint>
#include <vector>
#include "feeder/feeder.hpp"
#include "partition/renamer.hpp"
#include "partition/types.hpp"

namespace slicer::partition {

// Receives every completed slice in partition order
class SliceSink {
public:
  virtual ~SliceSink() = default;

  // Takes ownership of the plan; throwing aborts the partition run
  virtual void accept(SlicePlan plan) = 0;
};

// One range produced by plan_cuts. closes_slice is set when the slice is full after this range.
struct Cut {
  std::int64_t byte_start;
  std::int64_t byte_end;
  bool closes_slice;
};

// Splits a file of file_size bytes given accumulated bytes already in the open slice.
// Requires 0 <= accumulated < cap. A file that fits is returned as one uncut range.
std::vector<Cut> plan_cuts(std::int64_t accumulated, std::int64_t file_size, std::int64_t cap);

// Everything the partitioning loop mutates, threaded explicitly through it
struct PartitionState {
  std::int64_t accumulated_size = 0;
  std::vector<FileDescriptor> current_plan;
  std::size_t slice_index = 0;
};

struct PartitionReport {
  std::size_t files = 0;
  std::size_t slices = 0;
  std::int64_t input_bytes = 0;
  bool cancelled = false;
};

class SlicePartitioner {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws PartitionError when target_capacity minus the feeder reservation is not positive.
  // A renamer enables anonymized display names.
  SlicePartitioner(std::int64_t target_capacity, feeder::Feeder& feeder, SliceSink& sink,
                   Renamer* renamer = nullptr);


  // ---- PARTITIONING ----
  // Streams the files into slices of exactly cap() bytes, the last one possibly smaller.
  // Cancellation is honoured between files, never inside a split.
  PartitionReport partition(const std::vector<FileDescriptor>& files, std::size_t slice_total,
                            const CancellationToken* cancel = nullptr);

  // Capacity available to partitioned input after the feeder reservation
  std::int64_t cap() const { return cap_; }

private:
  // ---- PARAMETERS ----
  std::int64_t target_capacity_;
  std::int64_t cap_;
  feeder::Feeder& feeder_;
  SliceSink& sink_;
  Renamer* renamer_;


  // ---- SLICE ASSEMBLY ----
  // Adds one input file, emitting as many slices as it completes
  void add_file(PartitionState& state, const FileDescriptor& file, std::size_t slice_total);
  // Appends a descriptor, anonymizing it first when enabled
  void append(PartitionState& state, FileDescriptor descriptor);
  // Hands the open slice plus feeder content to the sink and resets the state
  void emit(PartitionState& state, std::size_t slice_total);
};

} // namespace slicer::partition

#endif // SLICER_PARTITION_SLICE_PARTITIONER_HPP
